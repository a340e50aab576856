#ifndef LEDGER_ACCOUNT_HPP_
#define LEDGER_ACCOUNT_HPP_

#include "ledger/model/transaction.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ledger {
namespace model {

/**
 * A bank account as persisted in bank_data.json.
 *
 * The account is the only mutator of its transaction list. Sections owned
 * by other subsystems (recurring bills, salary profile, cards) are carried
 * as raw JSON so a load/save cycle writes them back unchanged.
 */
struct Account {
  std::string customer_id;
  std::string username;
  std::string password;
  std::string first_name;
  std::string last_name;
  std::string dob;
  std::string gender;
  std::string account_type;
  std::string account_number;
  double balance = 0.0;
  std::vector<Transaction> transactions;
  int failed_attempts = 0;
  bool locked = false;
  double pending_amb_fees = 0.0;

  nlohmann::json recurring_bills = nlohmann::json::array();
  nlohmann::json salary_profile = nullptr;
  nlohmann::json cards = nlohmann::json::array();

  bool hasTransaction(const std::string& txn_id) const;

  bool operator==(const Account& other) const;
  bool operator!=(const Account& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const Account& account);
void from_json(const nlohmann::json& j, Account& account);

}  // namespace model
}  // namespace ledger

#endif  // LEDGER_ACCOUNT_HPP_
