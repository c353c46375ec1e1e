#pragma once

#include <optional>

#include "internal/util/bytes.hpp"

namespace bridge::crypto {

// Recovers the signer identity of (message, signature); nullopt when invalid.
class SignatureScheme {
 public:
  virtual ~SignatureScheme() = default;

  virtual std::optional<util::Address> Recover(const util::Bytes& message, const util::Bytes& signature) = 0;
};

} // namespace bridge::crypto
