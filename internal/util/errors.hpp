#pragma once

#include <stdexcept>
#include <string>

namespace credpool::util {

/*
  Central error types.

  Thrown by the core layers and translated by the caller
  (credpoolctl maps them to exit codes).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Credential is still held by a user or instance.
class StillAssigned : public InvalidState {
 public:
  explicit StillAssigned(const std::string& msg) : InvalidState(msg) {
  }
};

// Config text is missing required WireGuard fields.
class MalformedConfig : public std::runtime_error {
 public:
  explicit MalformedConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ArchiveError : public std::runtime_error {
 public:
  explicit ArchiveError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage contention that survived the retry budget.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace credpool::util
