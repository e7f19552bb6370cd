#pragma once

#include <stdexcept>
#include <string>

namespace saga::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller error: Execute() was asked for a saga type nobody registered.
class UnregisteredSagaType : public std::runtime_error {
 public:
  explicit UnregisteredSagaType(const std::string& saga_type) : std::runtime_error("Saga type not registered: " + saga_type) {
  }
};

// Programming error in a saga registration.
class InvalidDefinition : public std::runtime_error {
 public:
  explicit InvalidDefinition(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutionConflict : public std::runtime_error {
 public:
  explicit ExecutionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A saga state transition could not be persisted.

  Fatal for the saga run: past this point the stored state can no longer
  be trusted, so it is never folded into the step failure path.
*/
class StoreFailure : public std::runtime_error {
 public:
  explicit StoreFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace saga::util
