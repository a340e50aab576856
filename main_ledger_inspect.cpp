#include "ledger/ledger_config.hpp"
#include "ledger/ledger_store.hpp"
#include "ledger/observability/logger.hpp"
#include "ledger/observability/metrics.hpp"

#include <iostream>

namespace {

void printStats(const char* label, ledger::ids::IdAllocator& allocator) {
  auto stats = allocator.stats();
  std::cout << "  " << label << ": " << stats.total_ids << " issued (" << stats.file_path << ")"
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  using ledger::observability::Logger;

  try {
    ledger::LedgerConfig config;
    // Parse command line arguments
    if (argc >= 3) config = ledger::LedgerConfig::fromJsonFile(argv[2]);
    if (argc >= 2) config.data_dir = argv[1];

    Logger::getInstance().setLogLevel(ledger::observability::parseLogLevel(config.log_level));

    std::cout << "=== Ledger Inspect ===" << std::endl;
    std::cout << "Data directory: " << config.data_dir << std::endl;
    std::cout << "======================" << std::endl;

    ledger::LedgerStore store(config);
    auto accounts = store.loadAccounts();
    auto customers = store.loadCustomers();
    auto loans = store.loadLoans();

    double total_balance = 0.0;
    size_t total_transactions = 0;
    for (const auto& account : accounts) {
      total_balance += account.balance;
      total_transactions += account.transactions.size();
    }

    std::cout << "Accounts: " << accounts.size() << " (" << total_transactions
              << " transactions, total balance " << total_balance << ")" << std::endl;
    std::cout << "Customers: " << customers.size() << std::endl;
    std::cout << "Loans: " << loans.size() << std::endl;

    auto report = store.lastReplayReport();
    std::cout << "Replay: " << report.rows_read << " rows read, " << report.applied
              << " applied, " << report.skipped() << " skipped" << std::endl;
    std::cout << "  duplicates=" << report.duplicates << " unmatched=" << report.unmatched
              << " ignored=" << report.ignored_actions << " malformed=" << report.malformed
              << std::endl;
    if (!report.log_readable) {
      std::cerr << "Activity log could not be read: " << store.activityLog().path() << std::endl;
    }

    std::cout << "Identifier registries:" << std::endl;
    printStats("transaction", store.ids().transactionIds());
    printStats("NACH", store.ids().nachIds());
    printStats("account number", store.ids().accountNumbers());
    printStats("customer", store.ids().customerIds());

    std::cout << std::endl << ledger::observability::getGlobalMetrics().exportMetrics();
    return report.log_readable ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
