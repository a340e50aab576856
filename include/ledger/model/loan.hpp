#ifndef LEDGER_LOAN_HPP_
#define LEDGER_LOAN_HPP_

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ledger {
namespace model {

/**
 * A sanctioned loan as stored in loans.json. On-disk keys are snake_case.
 */
struct Loan {
  std::string loan_id;
  std::string customer_id;
  double principal = 0.0;
  double interest_rate = 0.0;  // annual, percent
  int tenure_months = 0;
  std::optional<std::string> start_date;  // ISO "YYYY-MM-DD"
  std::string status = "Active";
  int emis_paid = 0;
  std::string approval_reason;
  std::optional<std::string> closure_date;

  bool operator==(const Loan& other) const;
  bool operator!=(const Loan& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const Loan& loan);
void from_json(const nlohmann::json& j, Loan& loan);

}  // namespace model
}  // namespace ledger

#endif  // LEDGER_LOAN_HPP_
