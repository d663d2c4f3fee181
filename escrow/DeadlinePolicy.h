#ifndef BAZAAR_DEADLINE_POLICY_H
#define BAZAAR_DEADLINE_POLICY_H

#include "Types.hpp"

namespace bz {
namespace deadline {

// Fulfilment window is open strictly before the deadline
inline bool isBefore(Timestamp now, Timestamp deadline) { return now < deadline; }

// Payment release is possible strictly after the deadline
inline bool isAfter(Timestamp now, Timestamp deadline) { return now > deadline; }

/**
 * deadline = createdAt + duration
 * @return false if duration is negative or the sum overflows
 */
bool computeDeadline(Timestamp createdAt, int64_t duration, Timestamp &out);

/**
 * deadline + extension, same overflow rules as computeDeadline
 */
bool extendDeadline(Timestamp deadline, int64_t extension, Timestamp &out);

} // namespace deadline
} // namespace bz

#endif // BAZAAR_DEADLINE_POLICY_H
