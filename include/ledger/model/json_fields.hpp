#ifndef LEDGER_JSON_FIELDS_HPP_
#define LEDGER_JSON_FIELDS_HPP_

#include "ledger/errors.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ledger {
namespace model {

// Schema helpers shared by the entity from_json functions. All failures
// surface as SchemaError naming the offending field.

template <typename T>
T requireField(const nlohmann::json& j, const char* key, const char* entity) {
  if (!j.is_object()) {
    throw SchemaError(std::string(entity) + ": expected a JSON object");
  }
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    throw SchemaError(std::string(entity) + ": missing required field '" + key + "'");
  }
  try {
    return it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw SchemaError(std::string(entity) + ": field '" + key + "' has wrong type (" +
                      e.what() + ")");
  }
}

template <typename T>
T fieldOr(const nlohmann::json& j, const char* key, const char* entity, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  try {
    return it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw SchemaError(std::string(entity) + ": field '" + key + "' has wrong type (" +
                      e.what() + ")");
  }
}

template <typename T>
std::optional<T> optionalField(const nlohmann::json& j, const char* key, const char* entity) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  try {
    return it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw SchemaError(std::string(entity) + ": field '" + key + "' has wrong type (" +
                      e.what() + ")");
  }
}

template <typename T>
nlohmann::json nullable(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace model
}  // namespace ledger

#endif  // LEDGER_JSON_FIELDS_HPP_
