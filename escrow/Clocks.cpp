#include "Clocks.h"
#include "../lib/Utilities.h"

namespace bz {

Timestamp SystemClock::now() const { return utl::getCurrentTimeMs(); }

} // namespace bz
