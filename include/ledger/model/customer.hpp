#ifndef LEDGER_CUSTOMER_HPP_
#define LEDGER_CUSTOMER_HPP_

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace model {

/**
 * A customer and the account numbers linked to them. The loan and
 * employer fields are optional; the loan subsystem fills them in.
 */
struct Customer {
  std::string customer_id;
  std::string username;
  std::string password;
  std::string first_name;
  std::string last_name;
  std::string dob;
  std::string gender;
  std::string phone_number;
  std::string email;
  std::vector<std::string> account_numbers;
  int failed_attempts = 0;
  bool locked = false;

  std::optional<int> cibil_score;
  std::optional<double> salary;
  std::optional<std::string> employer_name;
  std::optional<std::string> employer_type;
  std::optional<std::string> job_start_date;  // "YYYY-MM-DD"
  std::optional<std::string> employer_category;
  std::optional<std::string> city;
  bool kyc_completed = false;

  bool operator==(const Customer& other) const;
  bool operator!=(const Customer& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const Customer& customer);
void from_json(const nlohmann::json& j, Customer& customer);

}  // namespace model
}  // namespace ledger

#endif  // LEDGER_CUSTOMER_HPP_
