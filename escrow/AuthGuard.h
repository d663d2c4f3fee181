#ifndef BAZAAR_AUTH_GUARD_H
#define BAZAAR_AUTH_GUARD_H

#include "Transaction.h"
#include "Types.hpp"

namespace bz {
namespace guard {

/**
 * Decide whether principal holds the required role on the transaction.
 * StoreOnly requires an assigned store equal to the principal.
 * Pure; the caller maps a denial to its own error code.
 */
bool isAllowed(const Principal &principal, Role role, const Transaction &tx);

} // namespace guard
} // namespace bz

#endif // BAZAAR_AUTH_GUARD_H
