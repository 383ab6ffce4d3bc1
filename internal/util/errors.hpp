#pragma once

#include <stdexcept>
#include <string>

namespace favorites::util {

/*
  Central error types.

  Background stages catch these and collapse them into the outcome
  reported to the caller (export failed, mutation failed).
*/

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A required column is missing or a row cannot be decoded.
class DataCorruption : public std::runtime_error {
 public:
  explicit DataCorruption(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeliveryError : public std::runtime_error {
 public:
  explicit DeliveryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace favorites::util
