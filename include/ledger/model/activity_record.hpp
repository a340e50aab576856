#ifndef LEDGER_ACTIVITY_RECORD_HPP_
#define LEDGER_ACTIVITY_RECORD_HPP_

#include "ledger/model/account.hpp"
#include "ledger/model/transaction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace model {

/**
 * One row of account_activity.csv. Non-monetary events (ACCOUNT_CREATED,
 * CARD_CLOSED, ...) leave amount and resulting_balance empty.
 */
struct ActivityRecord {
  std::string timestamp;
  std::string username;
  std::string account_number;
  std::string action;
  std::optional<double> amount;
  std::string mode;
  std::optional<double> resulting_balance;
  std::string txn_id;
  std::string cheque_id;
  Metadata metadata;

  /**
   * Row describing `txn` on `account`. Category, merchant and payment
   * method travel in the metadata column under "category", "merchant"
   * and "method".
   */
  static ActivityRecord fromTransaction(const Account& account, const Transaction& txn,
                                        const std::string& mode = "");
};

// Column order of the log file
const std::vector<std::string>& activityColumns();

// Cells in activityColumns() order
std::vector<std::string> toCells(const ActivityRecord& record);

/** Shortest text that reads back as the same double ("1500", "0.1"). */
std::string formatAmount(double value);

/**
 * Strict numeric parse: the whole (trimmed) text must be a finite number.
 */
std::optional<double> parseAmount(const std::string& text);

}  // namespace model
}  // namespace ledger

#endif  // LEDGER_ACTIVITY_RECORD_HPP_
