#pragma once

#include <stdexcept>
#include <string>

namespace bridge::util {

/*
  Central error taxonomy.

  Every error aborts the whole call; the message is the reason tag.
  These get translated later to gRPC status codes.
*/

// Malformed or insufficient input: bad handle, underfunded reward,
// empty result, tampered payload.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operation is not valid for the request's current lifecycle position.
class StateError : public std::runtime_error {
 public:
  explicit StateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Signature, VRF or sortition check failed, or the caller is not an
// active reporter.
class AuthorizationError : public std::runtime_error {
 public:
  explicit AuthorizationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Inclusion or result proof rejected by the block relay.
class ProofError : public std::runtime_error {
 public:
  explicit ProofError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace bridge::util
