#include "MemoryLedger.h"

#include <limits>

namespace bz {

MemoryLedger::Roe<void> MemoryLedger::checkedAdd(int64_t &target,
                                                 int64_t amount) {
  if (target > std::numeric_limits<int64_t>::max() - amount) {
    return Error(E_BALANCE, "Deposit would cause balance overflow");
  }
  target += amount;
  return {};
}

MemoryLedger::Roe<void> MemoryLedger::credit(const Principal &principal,
                                             int64_t amount) {
  if (amount < 0) {
    return Error(E_INPUT, "Credit amount must be non-negative");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return checkedAdd(mBalances_[principal], amount);
}

MemoryLedger::Roe<void>
MemoryLedger::depositIntoCustody(const std::string &custodyId,
                                 const Principal &source, int64_t amount) {
  if (amount < 0) {
    return Error(E_INPUT, "Deposit amount must be non-negative");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mBalances_.find(source);
  int64_t available = it == mBalances_.end() ? 0 : it->second;
  if (available < amount) {
    return Error(E_BALANCE, "Insufficient balance for " + source +
                                ": available " + std::to_string(available) +
                                ", requested " + std::to_string(amount));
  }

  int64_t &custody = mCustody_[custodyId];
  if (custody > std::numeric_limits<int64_t>::max() - amount) {
    return Error(E_BALANCE, "Deposit would cause custody overflow");
  }

  mBalances_[source] = available - amount;
  custody += amount;
  return {};
}

MemoryLedger::Roe<void> MemoryLedger::transfer(int64_t amount,
                                               const std::string &custodyId,
                                               const Principal &to) {
  if (amount < 0) {
    return Error(E_INPUT, "Transfer amount must be non-negative");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mCustody_.find(custodyId);
  if (it == mCustody_.end()) {
    if (amount == 0) {
      return {};
    }
    return Error(E_ACCOUNT, "Custody account not found: " + custodyId);
  }
  if (it->second < amount) {
    return Error(E_BALANCE, "Insufficient custody balance for transfer");
  }

  int64_t &destination = mBalances_[to];
  if (destination > std::numeric_limits<int64_t>::max() - amount) {
    return Error(E_BALANCE, "Transfer would cause destination overflow");
  }

  it->second -= amount;
  destination += amount;
  return {};
}

int64_t MemoryLedger::getBalance(const Principal &principal) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mBalances_.find(principal);
  return it == mBalances_.end() ? 0 : it->second;
}

int64_t MemoryLedger::getCustodyBalance(const std::string &custodyId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mCustody_.find(custodyId);
  return it == mCustody_.end() ? 0 : it->second;
}

int64_t MemoryLedger::getTotalSupply() const {
  std::lock_guard<std::mutex> lock(mutex_);
  int64_t total = 0;
  for (const auto &[principal, balance] : mBalances_) {
    total += balance;
  }
  for (const auto &[custodyId, balance] : mCustody_) {
    total += balance;
  }
  return total;
}

} // namespace bz
