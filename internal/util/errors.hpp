#pragma once

#include <stdexcept>
#include <string>

namespace offline::util {

/*
  Central error types.

  Components throw these; the repository layer reports writes as
  db::Result and callers translate failures into StorageError.
*/

// Value or payload cannot be durably encoded. Always reaches the caller.
class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durable store I/O failure.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A sync run is already active on this orchestrator.
class AlreadyInProgress : public std::runtime_error {
 public:
  explicit AlreadyInProgress(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Remote collaborator failed or threw while handling one operation.
class RemoteDispatchError : public std::runtime_error {
 public:
  explicit RemoteDispatchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

} // namespace offline::util
