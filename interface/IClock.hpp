#pragma once

#include "Types.hpp"

namespace bz {

/**
 * Time source used for creation stamps and deadline comparisons.
 */
class IClock {
public:
  virtual ~IClock() = default;

  // Current time in milliseconds, monotonic non-decreasing
  virtual Timestamp now() const = 0;
};

} // namespace bz
