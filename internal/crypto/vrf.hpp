#pragma once

#include "internal/util/bytes.hpp"

namespace bridge::crypto {

/*
  VRF capability.

  u_point and v_components are the precomputed helper points of the fast
  verification path; backends that verify natively may ignore them.
*/
class VrfVerifier {
 public:
  virtual ~VrfVerifier() = default;

  virtual bool FastVerify(const util::Bytes& public_key, const util::Bytes& proof, const util::Bytes& message, const util::Bytes& u_point,
                          const util::Bytes& v_components) = 0;

  // VRF output of a verified proof. At least 32 bytes.
  virtual util::Bytes GammaToHash(const util::Bytes& proof) = 0;
};

} // namespace bridge::crypto
