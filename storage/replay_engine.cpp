#include "ledger/storage/replay_engine.hpp"
#include "ledger/observability/logger.hpp"
#include "ledger/observability/metrics.hpp"
#include "ledger/util/utf8.hpp"

#include <unordered_map>

namespace ledger {
namespace storage {

using observability::getGlobalMetrics;
using observability::LogLevel;
namespace metric = observability::metric;
namespace txn_type = model::txn_type;

namespace {

std::optional<std::string> takeField(model::Metadata& metadata, const char* key) {
  auto it = metadata.find(key);
  if (it == metadata.end()) return std::nullopt;
  std::string value = it->second;
  metadata.erase(it);
  return value;
}

// Every text cell that ends up in a Transaction, and from there in a
// JSON snapshot or the transaction id set
bool hasValidText(const csv::Row& row) {
  for (const char* column : {"txnId", "timestamp", "chequeId", "metadata"}) {
    if (!util::isValidUtf8(row.get(column))) return false;
  }
  return true;
}

}  // namespace

ReplayEngine::ReplayEngine() : transaction_actions_(defaultActions()) {}

ReplayEngine::ReplayEngine(std::unordered_set<std::string> transaction_actions)
    : transaction_actions_(std::move(transaction_actions)) {}

const std::unordered_set<std::string>& ReplayEngine::defaultActions() {
  static const std::unordered_set<std::string> actions = {
      txn_type::kDeposit,         txn_type::kWithdraw,
      txn_type::kNeftSent,        txn_type::kNeftReceived,
      txn_type::kRtgsSent,        txn_type::kRtgsReceived,
      txn_type::kInterAccountSent, txn_type::kInterAccountReceived,
      txn_type::kAmbFee,          txn_type::kAmbFeeSettled,
      txn_type::kBillPayment,     txn_type::kExpense,
      txn_type::kSalaryCredit,    txn_type::kSalary,
      txn_type::kLoanEmi,         txn_type::kLoanCredit,
      txn_type::kAtmWithdrawal,   txn_type::kDebitCardPurchase,
      txn_type::kRecurringBill,   txn_type::kTaxDeducted,
      txn_type::kSwiftSent,
  };
  return actions;
}

bool ReplayEngine::isTransactionAction(const std::string& action) const {
  return transaction_actions_.count(action) > 0;
}

ReplayReport ReplayEngine::replay(std::vector<model::Account>& accounts,
                                  const ActivityLog& log) const {
  ReplayReport report;

  std::unordered_map<std::string, model::Account*> by_account_number;
  std::unordered_map<std::string, model::Account*> by_username;
  for (auto& account : accounts) {
    by_account_number[account.account_number] = &account;
    by_username[account.username] = &account;
  }

  // Transaction ids per account, built on first use
  std::unordered_map<model::Account*, std::unordered_set<std::string>> known_ids;

  report.log_readable = log.forEach([&](const csv::Row& row, size_t line) {
    ++report.rows_read;

    model::Account* account = nullptr;
    auto by_number = by_account_number.find(row.get("accountNumber"));
    if (by_number != by_account_number.end()) {
      account = by_number->second;
    } else {
      auto by_name = by_username.find(row.get("username"));
      if (by_name != by_username.end()) account = by_name->second;
    }
    if (account == nullptr) {
      ++report.unmatched;
      return true;
    }

    const std::string& action = row.get("action");
    if (!isTransactionAction(action)) {
      ++report.ignored_actions;
      return true;
    }

    auto amount = model::parseAmount(row.get("amount"));
    auto resulting_balance = model::parseAmount(row.get("resultingBalance"));
    const std::string& txn_id = row.get("txnId");
    if (!amount || !resulting_balance || txn_id.empty() || !hasValidText(row)) {
      ++report.malformed;
      LEDGER_LOG_BUILDER(LogLevel::DEBUG, "Skipping malformed activity row")
          .field("line", line)
          .field("action", action);
      return true;
    }

    auto seen = known_ids.find(account);
    if (seen == known_ids.end()) {
      std::unordered_set<std::string> ids;
      for (const auto& t : account->transactions) ids.insert(t.id);
      seen = known_ids.emplace(account, std::move(ids)).first;
    }
    if (!seen->second.insert(txn_id).second) {
      ++report.duplicates;
      return true;
    }

    model::Transaction txn;
    txn.id = txn_id;
    txn.type = action;
    txn.amount = *amount;
    txn.resulting_balance = *resulting_balance;
    txn.timestamp = row.get("timestamp");
    if (!row.get("chequeId").empty()) txn.cheque_id = row.get("chequeId");
    txn.metadata = model::parseMetadata(row.get("metadata"));
    txn.category = takeField(txn.metadata, "category");
    txn.merchant = takeField(txn.metadata, "merchant");
    txn.payment_method = takeField(txn.metadata, "method");

    account->transactions.push_back(std::move(txn));
    account->balance = *resulting_balance;
    ++report.applied;
    return true;
  });

  auto& metrics = getGlobalMetrics();
  metrics.incrementCounter(metric::kReplayRowsApplied, static_cast<double>(report.applied));
  metrics.incrementCounter(metric::kReplayRowsSkipped, static_cast<double>(report.skipped()));

  LEDGER_LOG_BUILDER(LogLevel::INFO, "Activity log replayed")
      .field("rows", report.rows_read)
      .field("applied", report.applied)
      .field("duplicates", report.duplicates)
      .field("unmatched", report.unmatched)
      .field("malformed", report.malformed);
  return report;
}

}  // namespace storage
}  // namespace ledger
