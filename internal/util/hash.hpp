#pragma once

#include "internal/util/bytes.hpp"

namespace bridge::util {

Hash256 Sha256(const std::uint8_t* data, std::size_t size);

inline Hash256 Sha256(const Bytes& data) {
  return Sha256(data.data(), data.size());
}

// SHA-256 over the concatenation a || b.
Hash256 Sha256Concat(const std::uint8_t* a, std::size_t a_size, const std::uint8_t* b, std::size_t b_size);

template <typename A, typename B>
Hash256 HashPair(const A& a, const B& b) {
  return Sha256Concat(a.data(), a.size(), b.data(), b.size());
}

// Identity bound to a public key: last 20 bytes of its SHA-256.
Address DeriveAddress(const Bytes& public_key);

} // namespace bridge::util
