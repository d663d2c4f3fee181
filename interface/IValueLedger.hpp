#pragma once

#include "Types.hpp"
#include "../lib/ResultOrError.hpp"

namespace bz {

/**
 * Value transfer primitive consumed by the escrow engine.
 * Every call is atomic: it either moves the full amount or nothing.
 */
class IValueLedger {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  virtual ~IValueLedger() = default;

  // Move amount from source principal into the custody account
  virtual Roe<void> depositIntoCustody(const std::string &custodyId,
                                       const Principal &source,
                                       int64_t amount) = 0;

  // Move amount out of the custody account to a principal
  virtual Roe<void> transfer(int64_t amount, const std::string &custodyId,
                             const Principal &to) = 0;
};

} // namespace bz
