#include "guards.hpp"

#include "internal/model/request_state.hpp"
#include "internal/util/errors.hpp"

namespace bridge::core::guards {

void RequireNotIncluded(const db::model::RequestRecord& record) {
  if (model::IsIncluded(record)) {
    throw util::StateError("already included");
  }
}

void RequireActiveClaim(const db::model::RequestRecord& record, uint64_t block_number, uint64_t expiry_blocks) {
  if (model::IsClaimable(record, block_number, expiry_blocks)) {
    throw util::StateError("has not yet been claimed");
  }
}

void RequireClaimable(const db::model::RequestRecord& record, uint64_t block_number, uint64_t expiry_blocks) {
  if (!model::IsClaimable(record, block_number, expiry_blocks)) {
    throw util::StateError("one of the listed requests was already claimed");
  }
}

void RequireEpochAfter(const db::model::RequestRecord& record, uint64_t epoch) {
  if (epoch <= record.epoch) {
    throw util::StateError("epoch must be greater than the request epoch");
  }
}

void RequireIncluded(const db::model::RequestRecord& record) {
  if (!model::IsIncluded(record)) {
    throw util::StateError("not yet included");
  }
}

void RequireNoResult(const db::model::RequestRecord& record) {
  if (model::HasResult(record)) {
    throw util::StateError("result already reported");
  }
}

void RequireEpochNotBefore(const db::model::RequestRecord& record, uint64_t epoch) {
  if (epoch < record.epoch) {
    throw util::StateError("result epoch predates inclusion");
  }
}

void RequireNonEmptyResult(const util::Bytes& result) {
  if (result.empty()) {
    throw util::ValidationError("result is empty");
  }
}

void RequireReporter(collab::ReporterPopulation& population, const util::Address& caller) {
  if (!population.IsMember(caller)) {
    throw util::AuthorizationError("caller is not an active reporter");
  }
}

void RequireProof(const std::vector<util::Hash256>& proof) {
  if (proof.empty()) {
    throw util::ValidationError("proof is empty");
  }
}

} // namespace bridge::core::guards
