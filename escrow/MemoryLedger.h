#ifndef BAZAAR_MEMORY_LEDGER_H
#define BAZAAR_MEMORY_LEDGER_H

#include "../interface/IValueLedger.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace bz {

/**
 * MemoryLedger - In-process value ledger.
 *
 * Holds spendable balances per principal and escrowed balances per custody
 * account. Value only enters through credit(); every other operation moves
 * it, so getTotalSupply() is constant across deposits and transfers.
 */
class MemoryLedger : public IValueLedger {
public:
  constexpr static int32_t E_ACCOUNT = 1;
  constexpr static int32_t E_BALANCE = 2;
  constexpr static int32_t E_INPUT = 3;

  MemoryLedger() = default;
  ~MemoryLedger() override = default;

  /** Mint amount into a principal's balance (funding from outside). */
  Roe<void> credit(const Principal &principal, int64_t amount);

  Roe<void> depositIntoCustody(const std::string &custodyId,
                               const Principal &source,
                               int64_t amount) override;

  Roe<void> transfer(int64_t amount, const std::string &custodyId,
                     const Principal &to) override;

  int64_t getBalance(const Principal &principal) const;
  int64_t getCustodyBalance(const std::string &custodyId) const;
  int64_t getTotalSupply() const;

private:
  static Roe<void> checkedAdd(int64_t &target, int64_t amount);

  mutable std::mutex mutex_;
  std::map<Principal, int64_t> mBalances_;
  std::map<std::string, int64_t> mCustody_;
};

} // namespace bz

#endif // BAZAAR_MEMORY_LEDGER_H
