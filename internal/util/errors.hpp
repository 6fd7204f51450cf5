#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace workflow::util {

/*
  Central error types.

  Expected outcomes (state mismatch, lease denied) are plain `false`
  returns and never use these.
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QuotaExceeded : public std::runtime_error {
 public:
  QuotaExceeded(const std::string& msg, std::string service_name, long long wait_seconds)
      : std::runtime_error(msg), service_name_(std::move(service_name)), wait_seconds_(wait_seconds) {
  }

  const std::string& ServiceName() const {
    return service_name_;
  }

  // Seconds until the earliest exhausted quota resets.
  long long WaitSeconds() const {
    return wait_seconds_;
  }

 private:
  std::string service_name_;
  long long   wait_seconds_;
};

// The store rejected or lost the operation; nothing was committed.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace workflow::util
