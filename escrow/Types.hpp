#ifndef BAZAAR_ESCROW_TYPES_HPP
#define BAZAAR_ESCROW_TYPES_HPP

#include "../interface/Types.hpp"

#include <cstdint>
#include <string>

namespace bz {

// Lifecycle label of a transaction. Open-like labels (Open, Resolved,
// Completed, Cancelled, Refunded) all mean the record is free to be
// accepted again.
enum class Status : uint8_t {
  Open = 0,
  Accepted = 1,
  Fulfilled = 2,
  Disputed = 3,
  Resolved = 4,
  Completed = 5,
  Cancelled = 6,
  Refunded = 7
};

enum class Role : uint8_t { CustomerOnly, StoreOnly, CustomerOrStore };

inline std::string statusToString(Status status) {
  switch (status) {
  case Status::Open:
    return "open";
  case Status::Accepted:
    return "accepted";
  case Status::Fulfilled:
    return "fulfilled";
  case Status::Disputed:
    return "disputed";
  case Status::Resolved:
    return "resolved";
  case Status::Completed:
    return "completed";
  case Status::Cancelled:
    return "cancelled";
  case Status::Refunded:
    return "refunded";
  default:
    return "unknown";
  }
}

inline bool parseStatus(const std::string &name, Status &status) {
  for (uint8_t i = 0; i <= static_cast<uint8_t>(Status::Refunded); ++i) {
    auto candidate = static_cast<Status>(i);
    if (statusToString(candidate) == name) {
      status = candidate;
      return true;
    }
  }
  return false;
}

inline std::string roleToString(Role role) {
  switch (role) {
  case Role::CustomerOnly:
    return "customer";
  case Role::StoreOnly:
    return "store";
  case Role::CustomerOrStore:
    return "customer-or-store";
  default:
    return "unknown";
  }
}

} // namespace bz

#endif // BAZAAR_ESCROW_TYPES_HPP
