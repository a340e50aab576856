#ifndef LEDGER_ID_REGISTRIES_HPP_
#define LEDGER_ID_REGISTRIES_HPP_

#include "ledger/ids/id_allocator.hpp"

#include <filesystem>

namespace ledger {
namespace ids {

// Account numbers start with the branch code
inline constexpr const char* kAccountNumberPrefix = "5621";
inline constexpr const char* kCustomerIdPrefix = "CUST";
inline constexpr const char* kTransactionIdPrefix = "FHIC";
inline constexpr const char* kNachIdPrefix = "NACH";

/** "FHIC" + 10 digits, JSON array file, loaded once, 1000 attempts. */
AllocatorOptions transactionIdOptions(const std::filesystem::path& file);

/** "NACH" + YYYYMMDD + 6 digits, line file, reloaded every call, 100 attempts. */
AllocatorOptions nachIdOptions(const std::filesystem::path& file);

/** "5621" + 8 digits, line file, reloaded every call, 1000 attempts. */
AllocatorOptions accountNumberOptions(const std::filesystem::path& file);

/** "CUST" + 8 digits, line file, reloaded every call, 1000 attempts. */
AllocatorOptions customerIdOptions(const std::filesystem::path& file);

/**
 * The four identifier registries of one data directory. Constructed once
 * per process and handed to callers by reference.
 */
class IdRegistries {
 public:
  struct Paths {
    std::filesystem::path transaction_ids;
    std::filesystem::path nach_ids;
    std::filesystem::path account_numbers;
    std::filesystem::path customer_ids;
  };

  IdRegistries(const Paths& paths, IdAllocator::DateSource date_source);

  // Non-copyable
  IdRegistries(const IdRegistries&) = delete;
  IdRegistries& operator=(const IdRegistries&) = delete;

  IdAllocator& transactionIds() { return transaction_ids_; }
  IdAllocator& nachIds() { return nach_ids_; }
  IdAllocator& accountNumbers() { return account_numbers_; }
  IdAllocator& customerIds() { return customer_ids_; }

 private:
  IdAllocator transaction_ids_;
  IdAllocator nach_ids_;
  IdAllocator account_numbers_;
  IdAllocator customer_ids_;
};

}  // namespace ids
}  // namespace ledger

#endif  // LEDGER_ID_REGISTRIES_HPP_
