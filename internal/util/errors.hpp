#pragma once

#include <stdexcept>
#include <string>

namespace asyncprof::util {

/*
  Central error types.

  None of these cross the coordinator boundary: ProfilerCoordinator catches
  them and degrades to "profile less".
*/

class BackendUnavailable : public std::runtime_error {
 public:
  explicit BackendUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BackendStartError : public std::runtime_error {
 public:
  explicit BackendStartError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class HookConflict : public std::runtime_error {
 public:
  explicit HookConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace asyncprof::util
