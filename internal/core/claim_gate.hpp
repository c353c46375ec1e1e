#pragma once

#include <cstdint>
#include <vector>

#include "internal/collab/block_relay.hpp"
#include "internal/collab/reporter_population.hpp"
#include "internal/core/board_params.hpp"
#include "internal/core/ledger.hpp"
#include "internal/crypto/signature.hpp"
#include "internal/crypto/vrf.hpp"
#include "internal/host/call_context.hpp"

namespace bridge::core {

struct ClaimSubmission {
  std::vector<uint64_t> ids;
  util::Bytes           vrf_proof;
  util::Bytes           public_key;
  util::Bytes           u_point;
  util::Bytes           v_components;

  // Signature over SHA-256(caller address).
  util::Bytes signature;
};

/*
  VRF sortition gate in front of request claims.

  Checks run in order: signature binding, VRF proof, sortition, then
  claimability of every listed request. The batch is all-or-nothing.
*/
class ClaimGate {
 public:
  ClaimGate(Ledger& ledger, collab::BlockRelay& relay, collab::ReporterPopulation& population, crypto::VrfVerifier& vrf,
            crypto::SignatureScheme& signatures, BoardParams params);

  void Claim(const host::CallContext& ctx, const ClaimSubmission& submission);

  // True when the claim key may claim under the current beacon and population.
  bool Eligible(const util::Bytes& vrf_proof);

 private:
  void VerifySignature(const host::CallContext& ctx, const ClaimSubmission& submission);
  void VerifyVrf(const ClaimSubmission& submission);

  Ledger&                     ledger_;
  collab::BlockRelay&         relay_;
  collab::ReporterPopulation& population_;
  crypto::VrfVerifier&        vrf_;
  crypto::SignatureScheme&    signatures_;
  BoardParams                 params_;
};

} // namespace bridge::core
