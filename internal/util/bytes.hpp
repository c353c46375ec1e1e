#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bridge::util {

/*
  Fixed and variable width byte types shared by every layer.

  Transport carries them as protobuf `bytes` (std::string); storage as BLOBs.
*/

using Bytes   = std::vector<std::uint8_t>;
using Hash256 = std::array<std::uint8_t, 32>;
using Address = std::array<std::uint8_t, 20>;

template <std::size_t N>
bool IsZero(const std::array<std::uint8_t, N>& value) {
  for (auto b : value) {
    if (b != 0) return false;
  }
  return true;
}

std::string ToHex(const std::uint8_t* data, std::size_t size);

template <std::size_t N>
std::string ToHex(const std::array<std::uint8_t, N>& value) {
  return ToHex(value.data(), value.size());
}

inline std::string ToHex(const Bytes& value) {
  return ToHex(value.data(), value.size());
}

// Accepts an optional 0x prefix. Throws ValidationError on malformed input.
Bytes FromHex(std::string_view hex);

Bytes       ToBytes(std::string_view raw);
std::string ToString(const Bytes& bytes);

// Exact-width conversions. Throw ValidationError when the width does not match.
Hash256 ToHash256(std::string_view raw);
Address ToAddress(std::string_view raw);
Address AddressFromHex(std::string_view hex);

template <std::size_t N>
std::string ToString(const std::array<std::uint8_t, N>& value) {
  return std::string(reinterpret_cast<const char*>(value.data()), value.size());
}

} // namespace bridge::util
