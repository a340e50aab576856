#include "ledger/model/customer.hpp"
#include "ledger/model/json_fields.hpp"

namespace ledger {
namespace model {

namespace {
constexpr const char* kEntity = "customer";
}  // namespace

bool Customer::operator==(const Customer& other) const {
  return customer_id == other.customer_id && username == other.username &&
         password == other.password && first_name == other.first_name &&
         last_name == other.last_name && dob == other.dob && gender == other.gender &&
         phone_number == other.phone_number && email == other.email &&
         account_numbers == other.account_numbers &&
         failed_attempts == other.failed_attempts && locked == other.locked &&
         cibil_score == other.cibil_score && salary == other.salary &&
         employer_name == other.employer_name && employer_type == other.employer_type &&
         job_start_date == other.job_start_date &&
         employer_category == other.employer_category && city == other.city &&
         kyc_completed == other.kyc_completed;
}

void to_json(nlohmann::json& j, const Customer& customer) {
  j = nlohmann::json{
      {"customerId", customer.customer_id},
      {"username", customer.username},
      {"password", customer.password},
      {"firstName", customer.first_name},
      {"lastName", customer.last_name},
      {"dob", customer.dob},
      {"gender", customer.gender},
      {"phoneNumber", customer.phone_number},
      {"email", customer.email},
      {"accountNumbers", customer.account_numbers},
      {"failedAttempts", customer.failed_attempts},
      {"locked", customer.locked},
      {"cibilScore", nullable(customer.cibil_score)},
      {"salary", nullable(customer.salary)},
      {"employerName", nullable(customer.employer_name)},
      {"employerType", nullable(customer.employer_type)},
      {"jobStartDate", nullable(customer.job_start_date)},
      {"employerCategory", nullable(customer.employer_category)},
      {"city", nullable(customer.city)},
      {"kycCompleted", customer.kyc_completed},
  };
}

void from_json(const nlohmann::json& j, Customer& customer) {
  customer.customer_id = requireField<std::string>(j, "customerId", kEntity);
  customer.username = requireField<std::string>(j, "username", kEntity);
  customer.password = requireField<std::string>(j, "password", kEntity);
  customer.first_name = requireField<std::string>(j, "firstName", kEntity);
  customer.last_name = requireField<std::string>(j, "lastName", kEntity);
  customer.dob = requireField<std::string>(j, "dob", kEntity);
  customer.gender = requireField<std::string>(j, "gender", kEntity);
  customer.phone_number = requireField<std::string>(j, "phoneNumber", kEntity);
  customer.email = requireField<std::string>(j, "email", kEntity);
  customer.account_numbers =
      requireField<std::vector<std::string>>(j, "accountNumbers", kEntity);
  customer.failed_attempts = fieldOr<int>(j, "failedAttempts", kEntity, 0);
  customer.locked = fieldOr<bool>(j, "locked", kEntity, false);

  customer.cibil_score = optionalField<int>(j, "cibilScore", kEntity);
  customer.salary = optionalField<double>(j, "salary", kEntity);
  customer.employer_name = optionalField<std::string>(j, "employerName", kEntity);
  customer.employer_type = optionalField<std::string>(j, "employerType", kEntity);
  customer.job_start_date = optionalField<std::string>(j, "jobStartDate", kEntity);
  customer.employer_category = optionalField<std::string>(j, "employerCategory", kEntity);
  customer.city = optionalField<std::string>(j, "city", kEntity);
  customer.kyc_completed = fieldOr<bool>(j, "kycCompleted", kEntity, false);
}

}  // namespace model
}  // namespace ledger
