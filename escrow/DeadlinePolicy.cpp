#include "DeadlinePolicy.h"
#include "../lib/Utilities.h"

namespace bz {
namespace deadline {

bool computeDeadline(Timestamp createdAt, int64_t duration, Timestamp &out) {
  return utl::safeAdd(createdAt, duration, out);
}

bool extendDeadline(Timestamp deadline, int64_t extension, Timestamp &out) {
  return utl::safeAdd(deadline, extension, out);
}

} // namespace deadline
} // namespace bz
