#pragma once

#include <cstdint>
#include <vector>

#include "internal/collab/reporter_population.hpp"
#include "internal/db/model/request_record.hpp"

namespace bridge::core::guards {

// Preconditions of the mutating operations. Each throws the typed error
// named in its tag and otherwise has no effect.

void RequireNotIncluded(const db::model::RequestRecord& record);
void RequireActiveClaim(const db::model::RequestRecord& record, uint64_t block_number, uint64_t expiry_blocks);
void RequireClaimable(const db::model::RequestRecord& record, uint64_t block_number, uint64_t expiry_blocks);
void RequireEpochAfter(const db::model::RequestRecord& record, uint64_t epoch);

void RequireIncluded(const db::model::RequestRecord& record);
void RequireNoResult(const db::model::RequestRecord& record);
void RequireEpochNotBefore(const db::model::RequestRecord& record, uint64_t epoch);
void RequireNonEmptyResult(const util::Bytes& result);
void RequireReporter(collab::ReporterPopulation& population, const util::Address& caller);

void RequireProof(const std::vector<util::Hash256>& proof);

} // namespace bridge::core::guards
