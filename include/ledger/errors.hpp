#ifndef LEDGER_ERRORS_HPP_
#define LEDGER_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace ledger {

/**
 * A snapshot document that does not match the expected schema:
 * missing required field, wrong JSON type, or unparseable text.
 */
class SchemaError : public std::runtime_error {
 public:
  explicit SchemaError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Base for identifier allocation failures. These are fatal to the
 * operation that needed the identifier.
 */
class IdAllocationError : public std::runtime_error {
 public:
  explicit IdAllocationError(const std::string& what) : std::runtime_error(what) {}
};

// Every candidate within the attempt cap was already issued
class IdExhaustedError : public IdAllocationError {
 public:
  explicit IdExhaustedError(const std::string& what) : IdAllocationError(what) {}
};

// The updated identifier set could not be written to disk
class IdPersistError : public IdAllocationError {
 public:
  explicit IdPersistError(const std::string& what) : IdAllocationError(what) {}
};

// A balance-affecting event could not be made durable
class ActivityLogError : public std::runtime_error {
 public:
  explicit ActivityLogError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace ledger

#endif  // LEDGER_ERRORS_HPP_
