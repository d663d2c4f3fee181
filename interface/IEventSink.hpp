#pragma once

#include "Types.hpp"

namespace bz {

/**
 * Optional audit consumer. The engine never depends on what a sink does
 * with an event.
 */
class IEventSink {
public:
  virtual ~IEventSink() = default;

  virtual void emit(const EscrowEvent &event) = 0;
};

} // namespace bz
