#include "AuthGuard.h"

namespace bz {
namespace guard {

bool isAllowed(const Principal &principal, Role role, const Transaction &tx) {
  switch (role) {
  case Role::CustomerOnly:
    return tx.isCustomer(principal);
  case Role::StoreOnly:
    return tx.isStore(principal);
  case Role::CustomerOrStore:
    return tx.isCustomer(principal) || tx.isStore(principal);
  default:
    return false;
  }
}

} // namespace guard
} // namespace bz
