#include "ledger/storage/account_csv.hpp"
#include "ledger/model/activity_record.hpp"
#include "ledger/observability/logger.hpp"
#include "ledger/storage/csv.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace ledger {
namespace storage {

using observability::LogLevel;

namespace {

const std::vector<std::string>& accountColumns() {
  static const std::vector<std::string> columns = {
      "username", "password", "firstName", "lastName", "dob", "gender",
      "accountType", "accountNumber", "balance", "failedAttempts", "locked"};
  return columns;
}

bool parseBool(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text == "true" || text == "1";
}

}  // namespace

std::string formatAccountsCsv(const std::vector<model::Account>& accounts) {
  std::string out = csv::formatRow(accountColumns());
  for (const auto& acc : accounts) {
    out += csv::formatRow({
        acc.username,
        acc.password,
        acc.first_name,
        acc.last_name,
        acc.dob,
        acc.gender,
        acc.account_type,
        acc.account_number,
        model::formatAmount(acc.balance),
        std::to_string(acc.failed_attempts),
        acc.locked ? "true" : "false",
    });
  }
  return out;
}

std::vector<model::Account> parseAccountsCsv(std::istream& in) {
  std::vector<model::Account> accounts;
  csv::Reader reader(in);

  std::vector<std::string> cells;
  if (!reader.next(cells)) {
    return accounts;
  }
  const auto index = csv::indexHeader(cells);

  while (reader.next(cells)) {
    csv::Row row(index, cells);

    model::Account acc;
    acc.account_number = row.get("accountNumber");
    acc.username = row.get("username");
    if (acc.account_number.empty() || acc.username.empty()) {
      LEDGER_LOG_BUILDER(LogLevel::WARN, "Skipping accounts.csv row without identity")
          .field("line", reader.lineNumber());
      continue;
    }

    auto balance = model::parseAmount(row.get("balance"));
    if (!row.get("balance").empty() && !balance) {
      LEDGER_LOG_BUILDER(LogLevel::WARN, "Skipping accounts.csv row with bad balance")
          .field("line", reader.lineNumber())
          .field("account", acc.account_number);
      continue;
    }

    acc.password = row.get("password");
    acc.first_name = row.get("firstName");
    acc.last_name = row.get("lastName");
    acc.dob = row.get("dob");
    acc.gender = row.get("gender");
    acc.account_type = row.get("accountType");
    acc.balance = balance.value_or(0.0);

    const std::string& attempts = row.get("failedAttempts");
    if (!attempts.empty()) {
      char* end = nullptr;
      long value = std::strtol(attempts.c_str(), &end, 10);
      acc.failed_attempts = (end && *end == '\0') ? static_cast<int>(value) : 0;
    }
    acc.locked = parseBool(row.get("locked"));

    accounts.push_back(std::move(acc));
  }
  return accounts;
}

}  // namespace storage
}  // namespace ledger
