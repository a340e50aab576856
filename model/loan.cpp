#include "ledger/model/loan.hpp"
#include "ledger/model/json_fields.hpp"

namespace ledger {
namespace model {

namespace {
constexpr const char* kEntity = "loan";
}  // namespace

bool Loan::operator==(const Loan& other) const {
  return loan_id == other.loan_id && customer_id == other.customer_id &&
         principal == other.principal && interest_rate == other.interest_rate &&
         tenure_months == other.tenure_months && start_date == other.start_date &&
         status == other.status && emis_paid == other.emis_paid &&
         approval_reason == other.approval_reason && closure_date == other.closure_date;
}

void to_json(nlohmann::json& j, const Loan& loan) {
  j = nlohmann::json{
      {"loan_id", loan.loan_id},
      {"customer_id", loan.customer_id},
      {"principal", loan.principal},
      {"interest_rate", loan.interest_rate},
      {"tenure_months", loan.tenure_months},
      {"start_date", nullable(loan.start_date)},
      {"status", loan.status},
      {"emis_paid", loan.emis_paid},
      {"approval_reason", loan.approval_reason},
      {"closure_date", nullable(loan.closure_date)},
  };
}

void from_json(const nlohmann::json& j, Loan& loan) {
  loan.loan_id = requireField<std::string>(j, "loan_id", kEntity);
  loan.customer_id = requireField<std::string>(j, "customer_id", kEntity);
  loan.principal = requireField<double>(j, "principal", kEntity);
  loan.interest_rate = requireField<double>(j, "interest_rate", kEntity);
  loan.tenure_months = requireField<int>(j, "tenure_months", kEntity);
  loan.start_date = optionalField<std::string>(j, "start_date", kEntity);
  loan.status = fieldOr<std::string>(j, "status", kEntity, "Active");
  loan.emis_paid = fieldOr<int>(j, "emis_paid", kEntity, 0);
  loan.approval_reason = fieldOr<std::string>(j, "approval_reason", kEntity, "");
  loan.closure_date = optionalField<std::string>(j, "closure_date", kEntity);
}

}  // namespace model
}  // namespace ledger
