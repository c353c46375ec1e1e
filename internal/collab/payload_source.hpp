#pragma once

#include <string>

#include "internal/util/bytes.hpp"

namespace bridge::collab {

// Content store behind a request's payload reference.
class PayloadSource {
 public:
  virtual ~PayloadSource() = default;

  // Throws ValidationError for an unknown reference.
  virtual util::Bytes PayloadBytes(const std::string& payload_ref) = 0;
};

} // namespace bridge::collab
