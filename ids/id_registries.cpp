#include "ledger/ids/id_registries.hpp"

namespace ledger {
namespace ids {

AllocatorOptions transactionIdOptions(const std::filesystem::path& file) {
  AllocatorOptions options;
  options.name = "transaction";
  options.path = file;
  options.format = SetFormat::kJsonArray;
  options.reload = ReloadPolicy::kOnce;
  options.prefix = kTransactionIdPrefix;
  options.random_digits = 10;
  options.max_attempts = 1000;
  return options;
}

AllocatorOptions nachIdOptions(const std::filesystem::path& file) {
  AllocatorOptions options;
  options.name = "NACH";
  options.path = file;
  options.format = SetFormat::kLines;
  options.reload = ReloadPolicy::kEveryCall;
  options.prefix = kNachIdPrefix;
  options.date_stamped = true;
  options.random_digits = 6;
  options.max_attempts = 100;
  return options;
}

AllocatorOptions accountNumberOptions(const std::filesystem::path& file) {
  AllocatorOptions options;
  options.name = "account number";
  options.path = file;
  options.format = SetFormat::kLines;
  options.reload = ReloadPolicy::kEveryCall;
  options.prefix = kAccountNumberPrefix;
  options.random_digits = 8;
  options.max_attempts = 1000;
  return options;
}

AllocatorOptions customerIdOptions(const std::filesystem::path& file) {
  AllocatorOptions options;
  options.name = "customer";
  options.path = file;
  options.format = SetFormat::kLines;
  options.reload = ReloadPolicy::kEveryCall;
  options.prefix = kCustomerIdPrefix;
  options.random_digits = 8;
  options.max_attempts = 1000;
  return options;
}

IdRegistries::IdRegistries(const Paths& paths, IdAllocator::DateSource date_source)
    : transaction_ids_(transactionIdOptions(paths.transaction_ids)),
      nach_ids_(nachIdOptions(paths.nach_ids), std::move(date_source)),
      account_numbers_(accountNumberOptions(paths.account_numbers)),
      customer_ids_(customerIdOptions(paths.customer_ids)) {}

}  // namespace ids
}  // namespace ledger
