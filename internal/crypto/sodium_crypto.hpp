#pragma once

#include "internal/crypto/signature.hpp"
#include "internal/crypto/vrf.hpp"

namespace bridge::crypto {

/*
  libsodium backend.

  VRF: ECVRF-ED25519-SHA512 (crypto_vrf_*). Only built when libsodium
  exposes the VRF API.

  Signatures: Ed25519 detached signatures shipped as
  public_key(32) || signature(64) so the signer can be recovered.
*/

class SodiumVrfVerifier final : public VrfVerifier {
 public:
  SodiumVrfVerifier();

  bool FastVerify(const util::Bytes& public_key, const util::Bytes& proof, const util::Bytes& message, const util::Bytes& u_point,
                  const util::Bytes& v_components) override;

  util::Bytes GammaToHash(const util::Bytes& proof) override;
};

class SodiumSignatureScheme final : public SignatureScheme {
 public:
  SodiumSignatureScheme();

  std::optional<util::Address> Recover(const util::Bytes& message, const util::Bytes& signature) override;
};

} // namespace bridge::crypto
