#include "ledger/model/account.hpp"
#include "ledger/model/json_fields.hpp"

#include <algorithm>

namespace ledger {
namespace model {

namespace {

constexpr const char* kEntity = "account";

nlohmann::json sectionOr(const nlohmann::json& j, const char* key, nlohmann::json fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return *it;
}

}  // namespace

bool Account::hasTransaction(const std::string& txn_id) const {
  return std::any_of(transactions.begin(), transactions.end(),
                     [&txn_id](const Transaction& t) { return t.id == txn_id; });
}

bool Account::operator==(const Account& other) const {
  return customer_id == other.customer_id && username == other.username &&
         password == other.password && first_name == other.first_name &&
         last_name == other.last_name && dob == other.dob && gender == other.gender &&
         account_type == other.account_type && account_number == other.account_number &&
         balance == other.balance && transactions == other.transactions &&
         failed_attempts == other.failed_attempts && locked == other.locked &&
         pending_amb_fees == other.pending_amb_fees &&
         recurring_bills == other.recurring_bills &&
         salary_profile == other.salary_profile && cards == other.cards;
}

void to_json(nlohmann::json& j, const Account& account) {
  j = nlohmann::json{
      {"customerId", account.customer_id},
      {"username", account.username},
      {"password", account.password},
      {"firstName", account.first_name},
      {"lastName", account.last_name},
      {"dob", account.dob},
      {"gender", account.gender},
      {"accountType", account.account_type},
      {"accountNumber", account.account_number},
      {"balance", account.balance},
      {"transactions", account.transactions},
      {"failedAttempts", account.failed_attempts},
      {"locked", account.locked},
      {"pendingAmbFees", account.pending_amb_fees},
      {"recurringBills", account.recurring_bills},
      {"salaryProfile", account.salary_profile},
      {"cards", account.cards},
  };
}

void from_json(const nlohmann::json& j, Account& account) {
  account.customer_id = requireField<std::string>(j, "customerId", kEntity);
  account.username = requireField<std::string>(j, "username", kEntity);
  account.password = requireField<std::string>(j, "password", kEntity);
  account.first_name = requireField<std::string>(j, "firstName", kEntity);
  account.last_name = requireField<std::string>(j, "lastName", kEntity);
  account.dob = requireField<std::string>(j, "dob", kEntity);
  account.gender = requireField<std::string>(j, "gender", kEntity);
  account.account_type = requireField<std::string>(j, "accountType", kEntity);
  account.account_number = requireField<std::string>(j, "accountNumber", kEntity);
  account.balance = requireField<double>(j, "balance", kEntity);
  account.failed_attempts = fieldOr<int>(j, "failedAttempts", kEntity, 0);
  account.locked = fieldOr<bool>(j, "locked", kEntity, false);
  account.pending_amb_fees = fieldOr<double>(j, "pendingAmbFees", kEntity, 0.0);

  account.transactions.clear();
  auto txns = j.find("transactions");
  if (txns != j.end() && !txns->is_null()) {
    if (!txns->is_array()) {
      throw SchemaError(std::string(kEntity) + " " + account.account_number +
                        ": field 'transactions' must be an array");
    }
    account.transactions.reserve(txns->size());
    for (const auto& item : *txns) {
      account.transactions.push_back(item.get<Transaction>());
    }
  }

  account.recurring_bills = sectionOr(j, "recurringBills", nlohmann::json::array());
  account.salary_profile = sectionOr(j, "salaryProfile", nullptr);
  account.cards = sectionOr(j, "cards", nlohmann::json::array());
}

}  // namespace model
}  // namespace ledger
