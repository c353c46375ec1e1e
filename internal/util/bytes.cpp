#include "bytes.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace bridge::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

template <std::size_t N>
std::array<std::uint8_t, N> ToFixed(std::string_view raw, const char* what) {
  if (raw.size() != N) {
    throw ValidationError(std::string(what) + " must be " + std::to_string(N) + " bytes, got " + std::to_string(raw.size()));
  }
  std::array<std::uint8_t, N> out{};
  std::copy(raw.begin(), raw.end(), out.begin());
  return out;
}

} // namespace

std::string ToHex(const std::uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

Bytes FromHex(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  if (hex.size() % 2 != 0) {
    throw ValidationError("hex string has odd length");
  }

  Bytes out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw ValidationError("hex string contains non-hex character");
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

Bytes ToBytes(std::string_view raw) {
  return Bytes(raw.begin(), raw.end());
}

std::string ToString(const Bytes& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

Hash256 ToHash256(std::string_view raw) {
  return ToFixed<32>(raw, "hash");
}

Address ToAddress(std::string_view raw) {
  return ToFixed<20>(raw, "address");
}

Address AddressFromHex(std::string_view hex) {
  const auto raw = FromHex(hex);
  return ToFixed<20>(std::string_view(reinterpret_cast<const char*>(raw.data()), raw.size()), "address");
}

} // namespace bridge::util
