#ifndef LEDGER_TRANSACTION_HPP_
#define LEDGER_TRANSACTION_HPP_

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace ledger {
namespace model {

/**
 * Free-form annotations attached to a transaction (loan id, bill id,
 * card id, ...). Ordered so serialized output is stable.
 */
using Metadata = std::map<std::string, std::string>;

/**
 * Parses a metadata column value. Accepts a JSON object (values of any
 * scalar type are stringified) or the legacy "key=value;key=value" form.
 * Anything unparseable yields an empty map.
 */
Metadata parseMetadata(const std::string& text);

/** Compact JSON object; empty string for an empty map. */
std::string serializeMetadata(const Metadata& metadata);

// Action tags used by the collaborators
namespace txn_type {
inline constexpr const char* kDeposit = "DEPOSIT";
inline constexpr const char* kWithdraw = "WITHDRAW";
inline constexpr const char* kNeftSent = "NEFT_SENT";
inline constexpr const char* kNeftReceived = "NEFT_RECEIVED";
inline constexpr const char* kRtgsSent = "RTGS_SENT";
inline constexpr const char* kRtgsReceived = "RTGS_RECEIVED";
inline constexpr const char* kInterAccountSent = "INTER_ACCOUNT_SENT";
inline constexpr const char* kInterAccountReceived = "INTER_ACCOUNT_RECEIVED";
inline constexpr const char* kAmbFee = "AMB_FEE";
inline constexpr const char* kAmbFeeSettled = "AMB_FEE_SETTLED";
inline constexpr const char* kBillPayment = "BILL_PAYMENT";
inline constexpr const char* kExpense = "EXPENSE";
inline constexpr const char* kSalary = "SALARY";
inline constexpr const char* kSalaryCredit = "SALARY_CREDIT";
inline constexpr const char* kLoanEmi = "LOAN_EMI";
inline constexpr const char* kLoanCredit = "LOAN_CREDIT";
inline constexpr const char* kAtmWithdrawal = "ATM_WITHDRAWAL";
inline constexpr const char* kDebitCardPurchase = "DEBIT_CARD_PURCHASE";
inline constexpr const char* kRecurringBill = "RECURRING_BILL";
inline constexpr const char* kTaxDeducted = "TAX_DEDUCTED";
inline constexpr const char* kSwiftSent = "SWIFT_SENT";
}  // namespace txn_type

/**
 * A balance-affecting event on one account. Never mutated after creation.
 */
struct Transaction {
  std::string id;
  std::string type;
  double amount = 0.0;
  double resulting_balance = 0.0;
  std::string timestamp;  // "dd-mm-YYYY HH:MM:SS"
  std::optional<std::string> cheque_id;
  std::optional<std::string> category;
  std::optional<std::string> merchant;
  std::optional<std::string> payment_method;
  Metadata metadata;

  bool operator==(const Transaction& other) const;
  bool operator!=(const Transaction& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const Transaction& txn);
void from_json(const nlohmann::json& j, Transaction& txn);

}  // namespace model
}  // namespace ledger

#endif  // LEDGER_TRANSACTION_HPP_
