#include "sodium_crypto.hpp"

#include <sodium.h>

#include <stdexcept>

#include "internal/util/hash.hpp"

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support"
#endif

namespace bridge::crypto {

namespace {

void EnsureSodium() {
  static const bool ready = sodium_init() >= 0;
  if (!ready) {
    throw std::runtime_error("unable to initialize libsodium");
  }
}

} // namespace

SodiumVrfVerifier::SodiumVrfVerifier() {
  EnsureSodium();
}

bool SodiumVrfVerifier::FastVerify(const util::Bytes& public_key, const util::Bytes& proof, const util::Bytes& message, const util::Bytes&,
                                   const util::Bytes&) {
  if (public_key.size() != crypto_vrf_PUBLICKEYBYTES || proof.size() != crypto_vrf_PROOFBYTES) {
    return false;
  }
  util::Bytes output(crypto_vrf_OUTPUTBYTES);
  return crypto_vrf_verify(output.data(), public_key.data(), proof.data(), message.data(), message.size()) == 0;
}

util::Bytes SodiumVrfVerifier::GammaToHash(const util::Bytes& proof) {
  if (proof.size() != crypto_vrf_PROOFBYTES) {
    throw std::invalid_argument("vrf proof has wrong length");
  }
  util::Bytes output(crypto_vrf_OUTPUTBYTES);
  if (crypto_vrf_proof_to_hash(output.data(), proof.data()) != 0) {
    throw std::invalid_argument("vrf proof does not decode");
  }
  return output;
}

SodiumSignatureScheme::SodiumSignatureScheme() {
  EnsureSodium();
}

std::optional<util::Address> SodiumSignatureScheme::Recover(const util::Bytes& message, const util::Bytes& signature) {
  if (signature.size() != crypto_sign_PUBLICKEYBYTES + crypto_sign_BYTES) {
    return std::nullopt;
  }
  const auto* public_key = signature.data();
  const auto* sig        = signature.data() + crypto_sign_PUBLICKEYBYTES;
  if (crypto_sign_verify_detached(sig, message.data(), message.size(), public_key) != 0) {
    return std::nullopt;
  }
  return util::DeriveAddress(util::Bytes(public_key, public_key + crypto_sign_PUBLICKEYBYTES));
}

} // namespace bridge::crypto
