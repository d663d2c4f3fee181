#ifndef BAZAAR_CUSTODY_H
#define BAZAAR_CUSTODY_H

#include "../lib/ResultOrError.hpp"

#include <cstdint>

namespace bz {

/**
 * Custody - Escrowed balance bound to a single transaction.
 *
 * Balance never goes negative. Running totals of deposits and withdrawals
 * are kept so that deposited - withdrawn == balance can be checked at any
 * time.
 */
class Custody {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INPUT = 1;
  constexpr static int32_t E_INSUFFICIENT = 2;
  constexpr static int32_t E_OVERFLOW = 3;

  Custody() = default;
  ~Custody() = default;

  int64_t getBalance() const { return balance_; }
  bool isEmpty() const { return balance_ == 0; }
  bool hasBalance(int64_t amount) const { return balance_ >= amount; }

  int64_t getTotalDeposited() const { return totalDeposited_; }
  int64_t getTotalWithdrawn() const { return totalWithdrawn_; }

  Roe<void> deposit(int64_t amount);

  /** Withdraw amount; fails without change if amount exceeds the balance. */
  Roe<int64_t> withdraw(int64_t amount);

  /** Withdraw the whole balance, returning it. Never fails. */
  int64_t withdrawAll();

  /** Check that withdraw(amount) would succeed, without changing anything. */
  Roe<void> checkWithdraw(int64_t amount) const;
  Roe<void> checkDeposit(int64_t amount) const;

private:
  int64_t balance_{ 0 };
  int64_t totalDeposited_{ 0 };
  int64_t totalWithdrawn_{ 0 };
};

} // namespace bz

#endif // BAZAAR_CUSTODY_H
