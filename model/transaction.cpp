#include "ledger/model/transaction.hpp"
#include "ledger/model/json_fields.hpp"

#include <sstream>

namespace ledger {
namespace model {

namespace {

constexpr const char* kEntity = "transaction";

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

Metadata metadataFromJson(const nlohmann::json& obj) {
  Metadata result;
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (it->is_string()) {
      result[it.key()] = it->get<std::string>();
    } else if (!it->is_null()) {
      result[it.key()] = it->dump();
    }
  }
  return result;
}

}  // namespace

Metadata parseMetadata(const std::string& text) {
  std::string trimmed = trim(text);
  if (trimmed.empty()) {
    return {};
  }

  if (trimmed.front() == '{') {
    auto parsed = nlohmann::json::parse(trimmed, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      return {};
    }
    return metadataFromJson(parsed);
  }

  // Legacy "category=Transport;merchant=Metro" form
  Metadata result;
  std::stringstream ss(trimmed);
  std::string part;
  while (std::getline(ss, part, ';')) {
    auto eq = part.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim(part.substr(0, eq));
    if (key.empty()) continue;
    result[key] = trim(part.substr(eq + 1));
  }
  return result;
}

std::string serializeMetadata(const Metadata& metadata) {
  if (metadata.empty()) {
    return "";
  }
  nlohmann::json j = metadata;
  return j.dump();
}

bool Transaction::operator==(const Transaction& other) const {
  return id == other.id && type == other.type && amount == other.amount &&
         resulting_balance == other.resulting_balance && timestamp == other.timestamp &&
         cheque_id == other.cheque_id && category == other.category &&
         merchant == other.merchant && payment_method == other.payment_method &&
         metadata == other.metadata;
}

void to_json(nlohmann::json& j, const Transaction& txn) {
  j = nlohmann::json{
      {"id", txn.id},
      {"type", txn.type},
      {"amount", txn.amount},
      {"resultingBalance", txn.resulting_balance},
      {"timestamp", txn.timestamp},
      {"chequeId", nullable(txn.cheque_id)},
      {"category", nullable(txn.category)},
      {"merchant", nullable(txn.merchant)},
      {"paymentMethod", nullable(txn.payment_method)},
      {"metadata", txn.metadata.empty() ? nlohmann::json(nullptr) : nlohmann::json(txn.metadata)},
  };
}

void from_json(const nlohmann::json& j, Transaction& txn) {
  // Older snapshots may lack an id; the store issues one on load
  txn.id = fieldOr<std::string>(j, "id", kEntity, "");
  txn.type = requireField<std::string>(j, "type", kEntity);
  txn.amount = requireField<double>(j, "amount", kEntity);
  txn.resulting_balance = requireField<double>(j, "resultingBalance", kEntity);
  txn.timestamp = fieldOr<std::string>(j, "timestamp", kEntity, "");
  txn.cheque_id = optionalField<std::string>(j, "chequeId", kEntity);
  txn.category = optionalField<std::string>(j, "category", kEntity);
  txn.merchant = optionalField<std::string>(j, "merchant", kEntity);
  txn.payment_method = optionalField<std::string>(j, "paymentMethod", kEntity);

  txn.metadata.clear();
  auto it = j.find("metadata");
  if (it != j.end()) {
    if (it->is_object()) {
      txn.metadata = metadataFromJson(*it);
    } else if (it->is_string()) {
      txn.metadata = parseMetadata(it->get<std::string>());
    } else if (!it->is_null()) {
      throw SchemaError(std::string(kEntity) + ": field 'metadata' has wrong type");
    }
  }
}

}  // namespace model
}  // namespace ledger
