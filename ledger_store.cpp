#include "ledger/ledger_store.hpp"
#include "ledger/errors.hpp"
#include "ledger/observability/logger.hpp"
#include "ledger/observability/metrics.hpp"
#include "ledger/storage/account_csv.hpp"

#include <fstream>
#include <system_error>

namespace ledger {

namespace fs = std::filesystem;
using observability::getGlobalMetrics;
using observability::LogLevel;
namespace metric = observability::metric;

namespace {

bool hasPrefix(const std::string& value, const char* prefix) {
  return value.rfind(prefix, 0) == 0;
}

// Issues ids for snapshot transactions stored without one
void assignMissingTransactionIds(std::vector<model::Account>& accounts,
                                 ids::IdAllocator& transaction_ids) {
  size_t assigned = 0;
  for (auto& account : accounts) {
    for (auto& txn : account.transactions) {
      if (!txn.id.empty()) continue;
      try {
        txn.id = transaction_ids.generate();
        ++assigned;
      } catch (const IdAllocationError& e) {
        LEDGER_LOG_BUILDER(LogLevel::ERROR, "Could not issue id for stored transaction")
            .field("account", account.account_number)
            .field("error", e.what());
      }
    }
  }
  if (assigned > 0) {
    LEDGER_LOG_BUILDER(LogLevel::WARN, "Issued ids for stored transactions without one")
        .field("transactions", assigned);
  }
}

// Moves `key` from metadata into `field` unless the field is already set
void liftMetadataKey(model::Metadata& metadata, const char* key,
                     std::optional<std::string>& field) {
  auto it = metadata.find(key);
  if (it == metadata.end()) return;
  if (!field) field = it->second;
  metadata.erase(it);
}

}  // namespace

LedgerStore::LedgerStore(const LedgerConfig& config)
    : config_(config),
      snapshots_(config_.data_dir),
      activity_log_(config_.pathOf(config_.activity_log)),
      ids_(ids::IdRegistries::Paths{config_.pathOf(config_.transaction_ids),
                                    config_.pathOf(config_.nach_ids),
                                    config_.pathOf(config_.account_numbers),
                                    config_.pathOf(config_.customer_ids)},
           [this]() { return clock_.compactDate(); }) {}

std::vector<model::Account> LedgerStore::loadAccountSnapshotLocked() {
  auto result = snapshots_.load<model::Account>(config_.accounts_json);
  if (result.ok()) {
    assignMissingTransactionIds(result.items, ids_.transactionIds());
    return std::move(result.items);
  }
  const bool corrupt = result.status == storage::LoadStatus::kCorrupt;
  if (corrupt && !snapshots_.setAside(config_.accounts_json)) {
    LEDGER_LOG_WARN("Corrupt " + config_.accounts_json + " left in place, next save replaces it");
  }

  const fs::path csv_path = config_.pathOf(config_.accounts_csv);
  std::error_code ec;
  if (!fs::exists(csv_path, ec)) {
    return {};
  }

  std::ifstream in(csv_path, std::ios::binary);
  if (!in.is_open()) {
    LEDGER_LOG_ERROR("Failed to open flat account snapshot " + csv_path.string());
    return {};
  }

  auto accounts = storage::parseAccountsCsv(in);
  getGlobalMetrics().incrementCounter(metric::kSnapshotLoadFallbacks);
  LEDGER_LOG_BUILDER(LogLevel::WARN, "Accounts rebuilt from flat CSV snapshot")
      .field("reason", corrupt ? "corrupt" : "missing")
      .field("accounts", accounts.size());
  return accounts;
}

void LedgerStore::reserveLoadedIds(const std::vector<model::Account>& accounts) {
  std::vector<std::string> account_numbers;
  std::vector<std::string> txn_ids;
  for (const auto& account : accounts) {
    if (hasPrefix(account.account_number, ids::kAccountNumberPrefix)) {
      account_numbers.push_back(account.account_number);
    }
    for (const auto& txn : account.transactions) {
      txn_ids.push_back(txn.id);
    }
  }
  ids_.accountNumbers().reserveAll(account_numbers);
  ids_.transactionIds().reserveAll(txn_ids);
}

std::vector<model::Account> LedgerStore::loadAccounts() {
  std::vector<model::Account> accounts;
  storage::ReplayReport report;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    accounts = loadAccountSnapshotLocked();
    report = replay_engine_.replay(accounts, activity_log_);
    last_replay_ = report;
  }
  reserveLoadedIds(accounts);
  getGlobalMetrics().setGauge(metric::kAccountsLoaded, static_cast<double>(accounts.size()));

  LEDGER_LOG_BUILDER(LogLevel::INFO, "Accounts loaded")
      .field("accounts", accounts.size())
      .field("replayed", report.applied);
  return accounts;
}

std::vector<model::Account> LedgerStore::loadAccountsWithoutReplay() {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshots_.load<model::Account>(config_.accounts_json).items;
}

bool LedgerStore::saveAccounts(const std::vector<model::Account>& accounts) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool json_ok = snapshots_.save(config_.accounts_json, accounts);
  bool csv_ok = snapshots_.saveText(config_.accounts_csv, storage::formatAccountsCsv(accounts));
  return json_ok && csv_ok;
}

std::vector<model::Customer> LedgerStore::loadCustomers() {
  std::vector<model::Customer> customers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    customers = snapshots_.load<model::Customer>(config_.customers_json).items;
  }

  std::vector<std::string> customer_ids;
  for (const auto& customer : customers) {
    if (hasPrefix(customer.customer_id, ids::kCustomerIdPrefix)) {
      customer_ids.push_back(customer.customer_id);
    }
  }
  ids_.customerIds().reserveAll(customer_ids);
  getGlobalMetrics().setGauge(metric::kCustomersLoaded, static_cast<double>(customers.size()));
  return customers;
}

bool LedgerStore::saveCustomers(const std::vector<model::Customer>& customers) {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshots_.save(config_.customers_json, customers);
}

std::vector<model::Loan> LedgerStore::loadLoans() {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshots_.load<model::Loan>(config_.loans_json).items;
}

bool LedgerStore::saveLoans(const std::vector<model::Loan>& loans) {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshots_.save(config_.loans_json, loans);
}

bool LedgerStore::appendActivity(const model::ActivityRecord& record) {
  return activity_log_.append(record);
}

model::Transaction LedgerStore::recordTransaction(model::Account& account,
                                                  const TransactionDraft& draft) {
  model::Transaction txn;
  txn.id = ids_.transactionIds().generate();
  txn.type = draft.type;
  txn.amount = draft.amount;
  txn.resulting_balance = draft.resulting_balance;
  txn.timestamp = clock_.formattedDateTime();
  txn.cheque_id = draft.cheque_id;
  txn.category = draft.category;
  txn.merchant = draft.merchant;
  txn.payment_method = draft.payment_method;
  txn.metadata = draft.metadata;
  // The log row carries these in metadata and replay reads them back
  // into the typed fields
  liftMetadataKey(txn.metadata, "category", txn.category);
  liftMetadataKey(txn.metadata, "merchant", txn.merchant);
  liftMetadataKey(txn.metadata, "method", txn.payment_method);

  auto record = model::ActivityRecord::fromTransaction(account, txn, draft.mode);
  if (!activity_log_.append(record)) {
    throw ActivityLogError("Could not record " + txn.type + " " + txn.id + " for account " +
                           account.account_number);
  }

  account.transactions.push_back(txn);
  account.balance = txn.resulting_balance;
  return txn;
}

storage::ReplayReport LedgerStore::lastReplayReport() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_replay_;
}

}  // namespace ledger
