#pragma once

#include <cstdint>
#include <string>

namespace bz {

// Authenticated calling identity, supplied by the host per call
using Principal = std::string;

// Milliseconds since the epoch
using Timestamp = int64_t;

/**
 * Audit record emitted for every successful mutation of a transaction.
 */
struct EscrowEvent {
  std::string transactionId;
  std::string action;
  Principal principal;
  Timestamp timestamp{ 0 };
  int64_t amount{ 0 }; // value moved by the action, 0 if none
};

} // namespace bz
