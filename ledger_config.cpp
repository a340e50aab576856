#include "ledger/ledger_config.hpp"
#include "ledger/storage/atomic_file.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>
#include <vector>

namespace ledger {

LedgerConfig LedgerConfig::fromJsonFile(const std::filesystem::path& path) {
  auto content = storage::readFile(path);
  if (!content) {
    throw std::runtime_error("Cannot read config file " + path.string());
  }

  auto doc = nlohmann::json::parse(*content, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    throw std::runtime_error("Config file " + path.string() + " is not a JSON object");
  }

  LedgerConfig config;
  const std::vector<std::pair<const char*, std::string*>> keys = {
      {"data_dir", &config.data_dir},
      {"accounts_json", &config.accounts_json},
      {"accounts_csv", &config.accounts_csv},
      {"activity_log", &config.activity_log},
      {"customers_json", &config.customers_json},
      {"loans_json", &config.loans_json},
      {"account_numbers", &config.account_numbers},
      {"customer_ids", &config.customer_ids},
      {"nach_ids", &config.nach_ids},
      {"transaction_ids", &config.transaction_ids},
      {"log_level", &config.log_level},
  };

  for (const auto& [key, target] : keys) {
    auto it = doc.find(key);
    if (it == doc.end()) continue;
    if (!it->is_string()) {
      throw std::runtime_error(std::string("Config key '") + key + "' must be a string");
    }
    *target = it->get<std::string>();
  }
  return config;
}

}  // namespace ledger
