#include "ledger/model/activity_record.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace ledger {
namespace model {

ActivityRecord ActivityRecord::fromTransaction(const Account& account, const Transaction& txn,
                                               const std::string& mode) {
  ActivityRecord record;
  record.timestamp = txn.timestamp;
  record.username = account.username;
  record.account_number = account.account_number;
  record.action = txn.type;
  record.amount = txn.amount;
  record.mode = mode;
  record.resulting_balance = txn.resulting_balance;
  record.txn_id = txn.id;
  record.cheque_id = txn.cheque_id.value_or("");
  record.metadata = txn.metadata;
  if (txn.category) record.metadata.emplace("category", *txn.category);
  if (txn.merchant) record.metadata.emplace("merchant", *txn.merchant);
  if (txn.payment_method) record.metadata.emplace("method", *txn.payment_method);
  return record;
}

const std::vector<std::string>& activityColumns() {
  static const std::vector<std::string> columns = {
      "timestamp", "username", "accountNumber", "action", "amount",
      "mode", "resultingBalance", "txnId", "chequeId", "metadata"};
  return columns;
}

std::vector<std::string> toCells(const ActivityRecord& record) {
  return {
      record.timestamp,
      record.username,
      record.account_number,
      record.action,
      record.amount ? formatAmount(*record.amount) : "",
      record.mode,
      record.resulting_balance ? formatAmount(*record.resulting_balance) : "",
      record.txn_id,
      record.cheque_id,
      serializeMetadata(record.metadata),
  };
}

std::string formatAmount(double value) {
  char buffer[32];
  for (int precision = 15; precision <= 17; ++precision) {
    std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
    if (std::strtod(buffer, nullptr) == value) break;
  }
  return buffer;
}

std::optional<double> parseAmount(const std::string& text) {
  const char* ws = " \t\r\n";
  auto begin = text.find_first_not_of(ws);
  if (begin == std::string::npos) return std::nullopt;
  auto end = text.find_last_not_of(ws);
  std::string trimmed = text.substr(begin, end - begin + 1);

  errno = 0;
  char* parse_end = nullptr;
  double value = std::strtod(trimmed.c_str(), &parse_end);
  if (errno != 0 || parse_end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace model
}  // namespace ledger
