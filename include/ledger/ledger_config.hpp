#ifndef LEDGER_LEDGER_CONFIG_HPP_
#define LEDGER_LEDGER_CONFIG_HPP_

#include <filesystem>
#include <string>

namespace ledger {

/**
 * Where the ledger keeps its files. Every file name is relative to
 * data_dir; the defaults match the layout the banking application expects.
 */
struct LedgerConfig {
  std::string data_dir = "data";
  std::string accounts_json = "bank_data.json";
  std::string accounts_csv = "accounts.csv";
  std::string activity_log = "account_activity.csv";
  std::string customers_json = "customers.json";
  std::string loans_json = "loans.json";
  std::string account_numbers = "account_numbers.txt";
  std::string customer_ids = "customer_ids.txt";
  std::string nach_ids = "nach_ids.txt";
  std::string transaction_ids = "transaction_ids.json";
  std::string log_level = "info";

  std::filesystem::path pathOf(const std::string& file_name) const {
    return std::filesystem::path(data_dir) / file_name;
  }

  /**
   * Reads overrides from a JSON object with the member names as keys.
   * Absent keys keep their defaults, unknown keys are ignored. Throws
   * std::runtime_error if the file is unreadable, is not a JSON object, or
   * a known key is not a string.
   */
  static LedgerConfig fromJsonFile(const std::filesystem::path& path);
};

}  // namespace ledger

#endif  // LEDGER_LEDGER_CONFIG_HPP_
