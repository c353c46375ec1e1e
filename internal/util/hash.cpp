#include "hash.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace bridge::util {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // namespace

Hash256 Sha256Concat(const std::uint8_t* a, std::size_t a_size, const std::uint8_t* b, std::size_t b_size) {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
  }

  Hash256      out{};
  unsigned int out_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), a, a_size) != 1 ||
      EVP_DigestUpdate(ctx.get(), b, b_size) != 1 || EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("sha256: digest failed");
  }
  return out;
}

Hash256 Sha256(const std::uint8_t* data, std::size_t size) {
  return Sha256Concat(data, size, nullptr, 0);
}

Address DeriveAddress(const Bytes& public_key) {
  const auto digest = Sha256(public_key);
  Address    out{};
  std::copy(digest.end() - out.size(), digest.end(), out.begin());
  return out;
}

} // namespace bridge::util
