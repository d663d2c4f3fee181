#ifndef BAZAAR_ESCROW_ENGINE_H
#define BAZAAR_ESCROW_ENGINE_H

#include "EngineConfig.h"
#include "ReviewBook.h"
#include "StoreStatistics.h"
#include "Transaction.h"
#include "Types.hpp"
#include "../interface/IClock.hpp"
#include "../interface/IEventSink.hpp"
#include "../interface/IValueLedger.hpp"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bz {

/**
 * EscrowEngine - Lifecycle state machine for marketplace transactions.
 *
 * Owns every transaction record and the escrow held for it. Each operation
 * locks the record it targets for its whole duration, validates the caller's
 * role, the record state and the deadline against that locked snapshot, and
 * only then moves value through the ledger and mutates the record. A failed
 * operation leaves the record exactly as it was.
 *
 * Value paid out of custody always goes to the customer or the store that
 * was assigned when the payout was decided, and each episode's escrow is
 * drained by at most one of resolveDispute, releasePayment,
 * cancelTransaction and requestRefund.
 */
class EscrowEngine : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_TRANSACTION = 1;
  constexpr static int32_t E_INVALID_ITEM = 2;
  constexpr static int32_t E_DISPUTE = 3;
  constexpr static int32_t E_ALREADY_RESOLVED = 4;
  constexpr static int32_t E_NOT_STORE = 5;
  constexpr static int32_t E_INVALID_WITHDRAWAL = 6;
  constexpr static int32_t E_DEADLINE_PASSED = 7;
  constexpr static int32_t E_INSUFFICIENT_ESCROW = 8;
  constexpr static int32_t E_INVALID_RATING = 9;
  constexpr static int32_t E_NOT_FOUND = 10;
  constexpr static int32_t E_INPUT = 11;
  constexpr static int32_t E_LEDGER = 12;

  /** Symbolic name of an error code, e.g. "InsufficientEscrow". */
  static std::string errorName(int32_t code);

  EscrowEngine(IValueLedger &ledger, const IClock &clock,
               const EngineConfig &config = EngineConfig());
  ~EscrowEngine() override = default;

  /** Optional audit sink; nullptr disables event emission. */
  void setEventSink(IEventSink *sink);

  // Lifecycle

  /**
   * Open a new transaction with customer as its owner.
   * deadline = now + duration.
   * @return Id of the new transaction
   */
  Roe<std::string> createTransaction(const Principal &customer,
                                     const std::string &item, int64_t quantity,
                                     int64_t price, int64_t duration);

  Roe<void> acceptTransaction(const std::string &id, const Principal &principal);

  /** Store marks the work done; only before the deadline. */
  Roe<void> fulfillTransaction(const std::string &id,
                               const Principal &principal);

  /** Store marks the work done without the deadline check. Idempotent. */
  Roe<void> markComplete(const std::string &id, const Principal &principal);

  Roe<void> disputeTransaction(const std::string &id,
                               const Principal &principal);

  /**
   * Close an open dispute. The whole escrow goes to the store when resolved
   * is true, back to the customer otherwise; the episode is then reset.
   * Either counterpart may resolve.
   * @return Amount paid out
   */
  Roe<int64_t> resolveDispute(const std::string &id, const Principal &principal,
                              bool resolved);

  /**
   * Customer pays the store after fulfilment, once the deadline has passed.
   * Records a review and updates the store's statistics.
   */
  Roe<ItemReview> releasePayment(const std::string &id,
                                 const Principal &principal,
                                 const std::string &review, int32_t rating);

  Roe<void> addFunds(const std::string &id, const Principal &principal,
                     int64_t amount);

  /** @return Amount refunded to the customer */
  Roe<int64_t> cancelTransaction(const std::string &id,
                                 const Principal &principal);

  /** @return Amount refunded to the customer */
  Roe<int64_t> requestRefund(const std::string &id, const Principal &principal);

  Roe<void> rateStore(const std::string &id, const Principal &principal,
                      int32_t rating);

  // Detail updates, customer only and only while no store is assigned

  Roe<void> updateItem(const std::string &id, const Principal &principal,
                       const std::string &item);
  Roe<void> updatePrice(const std::string &id, const Principal &principal,
                        int64_t price);
  Roe<void> updateQuantity(const std::string &id, const Principal &principal,
                           int64_t quantity);
  Roe<void> updateDeadline(const std::string &id, const Principal &principal,
                           Timestamp deadline);
  /** Only the open-like labels Open and Cancelled may be set directly. */
  Roe<void> updateStatus(const std::string &id, const Principal &principal,
                         Status status);

  // Store-side adjustments

  Roe<void> extendDeadline(const std::string &id, const Principal &principal,
                           int64_t extension);
  Roe<void> partialRefund(const std::string &id, const Principal &principal,
                          int64_t amount);

  // Accessors

  Roe<std::string> getItem(const std::string &id) const;
  Roe<int64_t> getPrice(const std::string &id) const;
  Roe<Status> getStatus(const std::string &id) const;
  Roe<Timestamp> getDeadline(const std::string &id) const;
  Roe<int64_t> getEscrow(const std::string &id) const;
  Roe<Transaction> getDetails(const std::string &id) const;

  bool hasTransaction(const std::string &id) const;
  std::vector<std::string> getTransactionIds() const;
  size_t getTransactionCount() const;

  const StoreStatistics &getStatistics() const { return statistics_; }
  const ReviewBook &getReviews() const { return reviews_; }
  const EngineConfig &getConfig() const { return config_; }

private:
  using EventList = std::vector<EscrowEvent>;

  struct Slot {
    std::mutex mutex;
    Transaction tx;
  };

  std::shared_ptr<Slot> findSlot(const std::string &id) const;

  /**
   * Run fn on the locked record. fn must return Roe<T> and must not mutate
   * the record before all of its checks have passed.
   */
  template <typename T, typename Fn>
  Roe<T> withTransaction(const std::string &id, Fn fn) {
    auto spSlot = findSlot(id);
    if (!spSlot) {
      return Error(E_NOT_FOUND, "Transaction not found: " + id);
    }
    EventList events;
    Roe<T> result = runLocked<T>(*spSlot, events, fn);
    // Sinks run without the record lock so they may call back into the engine
    publishEvents(events);
    return result;
  }

  template <typename T, typename Fn>
  Roe<T> runLocked(Slot &slot, EventList &events, Fn &fn) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    return fn(slot.tx, events);
  }

  template <typename T, typename Fn>
  Roe<T> readTransaction(const std::string &id, Fn fn) const {
    auto spSlot = findSlot(id);
    if (!spSlot) {
      return Error(E_NOT_FOUND, "Transaction not found: " + id);
    }
    std::lock_guard<std::mutex> lock(spSlot->mutex);
    return fn(spSlot->tx);
  }

  Error reject(const char *action, const Transaction &tx, int32_t code,
               const std::string &message) const;

  /**
   * Common guard of the detail updates: customer only, no store assigned.
   */
  Roe<void> checkDetailUpdate(const char *action, const Transaction &tx,
                              const Principal &principal) const;

  /** Shared by fulfillTransaction and markComplete. */
  Roe<void> fulfil(const std::string &id, const Principal &principal,
                   bool enforceDeadline);

  /**
   * Move amount from the record's custody to a principal. The ledger moves
   * first; custody is only debited if the ledger accepted the transfer.
   */
  Roe<void> payOut(Transaction &tx, const Principal &to, int64_t amount,
                   const char *action);

  /** Drain the whole escrow to a principal. @return amount moved */
  Roe<int64_t> payOutAll(Transaction &tx, const Principal &to,
                         const char *action);

  /** Build an event under the record lock; published once it is released. */
  void queueEvent(EventList &events, const Transaction &tx,
                  const std::string &action, const Principal &principal,
                  int64_t amount = 0) const;
  void publishEvents(const EventList &events);

  std::string generateId(const Principal &customer, Timestamp now);

  IValueLedger &ledger_;
  const IClock &clock_;
  EngineConfig config_;
  IEventSink *eventSink_{ nullptr };

  StoreStatistics statistics_;
  ReviewBook reviews_;

  mutable std::mutex registryMutex_;
  std::map<std::string, std::shared_ptr<Slot>> mSlots_;
  uint64_t nonce_{ 0 };
};

} // namespace bz

#endif // BAZAAR_ESCROW_ENGINE_H
