#pragma once

#include <cstdint>

#include "internal/util/bytes.hpp"

namespace bridge::collab {

// Set of identities eligible for sortition. Consulted, never owned.
class ReporterPopulation {
 public:
  virtual ~ReporterPopulation() = default;

  virtual uint64_t ActiveCount()                                    = 0;
  virtual bool     IsMember(const util::Address& address)           = 0;
  virtual void     PushActivity(const util::Address& address, uint64_t block_number) = 0;
};

} // namespace bridge::collab
