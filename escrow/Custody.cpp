#include "Custody.h"

#include <limits>

namespace bz {

Custody::Roe<void> Custody::checkDeposit(int64_t amount) const {
  if (amount < 0) {
    return Error(E_INPUT, "Deposit amount must be non-negative");
  }
  if (balance_ > std::numeric_limits<int64_t>::max() - amount ||
      totalDeposited_ > std::numeric_limits<int64_t>::max() - amount) {
    return Error(E_OVERFLOW, "Deposit would cause balance overflow");
  }
  return {};
}

Custody::Roe<void> Custody::deposit(int64_t amount) {
  auto check = checkDeposit(amount);
  if (!check) {
    return check;
  }
  balance_ += amount;
  totalDeposited_ += amount;
  return {};
}

Custody::Roe<void> Custody::checkWithdraw(int64_t amount) const {
  if (amount < 0) {
    return Error(E_INPUT, "Withdrawal amount must be non-negative");
  }
  if (balance_ < amount) {
    return Error(E_INSUFFICIENT, "Insufficient escrow: balance " +
                                     std::to_string(balance_) +
                                     ", requested " + std::to_string(amount));
  }
  return {};
}

Custody::Roe<int64_t> Custody::withdraw(int64_t amount) {
  auto check = checkWithdraw(amount);
  if (!check) {
    return check.error();
  }
  balance_ -= amount;
  totalWithdrawn_ += amount;
  return amount;
}

int64_t Custody::withdrawAll() {
  int64_t amount = balance_;
  balance_ = 0;
  totalWithdrawn_ += amount;
  return amount;
}

} // namespace bz
