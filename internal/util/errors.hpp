#pragma once

#include <stdexcept>
#include <string>

namespace chatrelay::util {

/*
  Central error types.

  HTTP handlers translate ValidationError to 4xx, everything else to 500.
  Detached tasks catch std::exception at their boundary and log.
*/

// Outbound network or protocol-client failure. Retried, then dropped.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Rejected input at a process boundary. Never retried.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A cancellation context fired while waiting.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg = "cancelled") : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chatrelay::util
