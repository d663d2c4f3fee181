#include "EscrowEngine.h"
#include "AuthGuard.h"
#include "DeadlinePolicy.h"
#include "../lib/Utilities.h"

namespace bz {

std::string EscrowEngine::errorName(int32_t code) {
  switch (code) {
  case E_INVALID_TRANSACTION:
    return "InvalidTransaction";
  case E_INVALID_ITEM:
    return "InvalidItem";
  case E_DISPUTE:
    return "Dispute";
  case E_ALREADY_RESOLVED:
    return "AlreadyResolved";
  case E_NOT_STORE:
    return "NotStore";
  case E_INVALID_WITHDRAWAL:
    return "InvalidWithdrawal";
  case E_DEADLINE_PASSED:
    return "DeadlinePassed";
  case E_INSUFFICIENT_ESCROW:
    return "InsufficientEscrow";
  case E_INVALID_RATING:
    return "InvalidRating";
  case E_NOT_FOUND:
    return "NotFound";
  case E_INPUT:
    return "InvalidInput";
  case E_LEDGER:
    return "Ledger";
  default:
    return "Unknown";
  }
}

EscrowEngine::EscrowEngine(IValueLedger &ledger, const IClock &clock,
                           const EngineConfig &config)
    : Module("bazaar.escrow"), ledger_(ledger), clock_(clock),
      config_(config) {}

void EscrowEngine::setEventSink(IEventSink *sink) { eventSink_ = sink; }

std::shared_ptr<EscrowEngine::Slot>
EscrowEngine::findSlot(const std::string &id) const {
  std::lock_guard<std::mutex> lock(registryMutex_);
  auto it = mSlots_.find(id);
  if (it == mSlots_.end()) {
    return nullptr;
  }
  return it->second;
}

EscrowEngine::Error EscrowEngine::reject(const char *action,
                                         const Transaction &tx, int32_t code,
                                         const std::string &message) const {
  log().debug << action << " rejected for " << tx.id << ": "
              << errorName(code) << " (" << message << ")";
  return Error(code, message);
}

void EscrowEngine::queueEvent(EventList &events, const Transaction &tx,
                              const std::string &action,
                              const Principal &principal, int64_t amount) const {
  if (!eventSink_) {
    return;
  }
  EscrowEvent event;
  event.transactionId = tx.id;
  event.action = action;
  event.principal = principal;
  event.timestamp = clock_.now();
  event.amount = amount;
  events.push_back(event);
}

void EscrowEngine::publishEvents(const EventList &events) {
  if (!eventSink_) {
    return;
  }
  for (const auto &event : events) {
    eventSink_->emit(event);
  }
}

std::string EscrowEngine::generateId(const Principal &customer, Timestamp now) {
  // Caller holds registryMutex_
  std::string id;
  do {
    ++nonce_;
    id = utl::sha256(customer + ":" + std::to_string(now) + ":" +
                     std::to_string(nonce_))
             .substr(0, 32);
  } while (mSlots_.find(id) != mSlots_.end());
  return id;
}

EscrowEngine::Roe<void> EscrowEngine::payOut(Transaction &tx,
                                             const Principal &to,
                                             int64_t amount,
                                             const char *action) {
  auto check = tx.escrow.checkWithdraw(amount);
  if (!check) {
    int32_t code = check.error().code == Custody::E_INSUFFICIENT
                       ? E_INSUFFICIENT_ESCROW
                       : E_INPUT;
    return reject(action, tx, code, check.error().message);
  }
  if (amount == 0) {
    return {};
  }

  auto transferResult = ledger_.transfer(amount, tx.id, to);
  if (!transferResult) {
    log().error << action << " on " << tx.id << ": ledger refused transfer of "
                << amount << " to " << to << ": "
                << transferResult.error().message;
    return Error(E_LEDGER, "Ledger transfer failed: " +
                               transferResult.error().message);
  }

  auto withdrawResult = tx.escrow.withdraw(amount);
  if (!withdrawResult) {
    // checkWithdraw passed under the same lock
    log().critical << action << " on " << tx.id
                   << ": custody out of sync with ledger: "
                   << withdrawResult.error().message;
    return Error(E_LEDGER, withdrawResult.error().message);
  }
  return {};
}

EscrowEngine::Roe<int64_t> EscrowEngine::payOutAll(Transaction &tx,
                                                   const Principal &to,
                                                   const char *action) {
  int64_t amount = tx.escrow.getBalance();
  auto result = payOut(tx, to, amount, action);
  if (!result) {
    return result.error();
  }
  return amount;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

EscrowEngine::Roe<std::string>
EscrowEngine::createTransaction(const Principal &customer,
                                const std::string &item, int64_t quantity,
                                int64_t price, int64_t duration) {
  if (quantity < 0) {
    return Error(E_INPUT, "Quantity must be non-negative");
  }
  if (price < 0) {
    return Error(E_INPUT, "Price must be non-negative");
  }

  Timestamp now = clock_.now();
  Timestamp deadline = 0;
  if (!deadline::computeDeadline(now, duration, deadline)) {
    return Error(E_INPUT, "Invalid duration: " + std::to_string(duration));
  }

  auto spSlot = std::make_shared<Slot>();
  Transaction &tx = spSlot->tx;
  tx.customer = customer;
  tx.item = item;
  tx.quantity = quantity;
  tx.price = price;
  tx.status = Status::Open;
  tx.createdAt = now;
  tx.deadline = deadline;

  std::string id;
  EventList events;
  {
    std::lock_guard<std::mutex> lock(registryMutex_);
    id = generateId(customer, now);
    tx.id = id;
    queueEvent(events, tx, "created", customer);
    mSlots_[id] = spSlot;
  }

  log().info << "Created transaction " << id << " for " << customer
             << " (item '" << item << "', qty " << quantity << ", price "
             << price << ", deadline " << deadline << ")";
  publishEvents(events);
  return id;
}

EscrowEngine::Roe<void>
EscrowEngine::acceptTransaction(const std::string &id,
                                const Principal &principal) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    if (tx.hasStore()) {
      return reject("accept", tx, E_INVALID_TRANSACTION,
                    "Transaction already accepted");
    }

    tx.store = principal;
    tx.status = Status::Accepted;
    log().info << "Transaction " << tx.id << " accepted by " << principal;
    queueEvent(events, tx, "accepted", principal);
    return {};
  });
}

EscrowEngine::Roe<void> EscrowEngine::fulfil(const std::string &id,
                                             const Principal &principal,
                                             bool enforceDeadline) {
  const char *action = enforceDeadline ? "fulfill" : "complete";
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    if (!tx.hasStore()) {
      return reject(action, tx, E_INVALID_TRANSACTION,
                    "Transaction has no assigned store");
    }
    if (!guard::isAllowed(principal, Role::StoreOnly, tx)) {
      return reject(action, tx, E_INVALID_ITEM,
                    "Only the assigned store can fulfil the transaction");
    }
    if (enforceDeadline && !deadline::isBefore(clock_.now(), tx.deadline)) {
      return reject(action, tx, E_DEADLINE_PASSED,
                    "Fulfilment deadline has passed");
    }

    tx.fulfilled = true;
    tx.status = Status::Fulfilled;
    log().info << "Transaction " << tx.id << " fulfilled by " << principal;
    queueEvent(events, tx, enforceDeadline ? "fulfilled" : "marked_complete", principal);
    return {};
  });
}

EscrowEngine::Roe<void>
EscrowEngine::fulfillTransaction(const std::string &id,
                                 const Principal &principal) {
  return fulfil(id, principal, true);
}

EscrowEngine::Roe<void> EscrowEngine::markComplete(const std::string &id,
                                                   const Principal &principal) {
  return fulfil(id, principal, false);
}

EscrowEngine::Roe<void>
EscrowEngine::disputeTransaction(const std::string &id,
                                 const Principal &principal) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    if (!guard::isAllowed(principal, Role::CustomerOnly, tx)) {
      return reject("dispute", tx, E_DISPUTE,
                    "Only the customer can raise a dispute");
    }
    if (!tx.hasStore()) {
      return reject("dispute", tx, E_INVALID_TRANSACTION,
                    "Nothing to dispute before a store accepts");
    }

    tx.dispute = true;
    tx.status = Status::Disputed;
    log().info << "Transaction " << tx.id << " disputed by " << principal;
    queueEvent(events, tx, "disputed", principal);
    return {};
  });
}

EscrowEngine::Roe<int64_t>
EscrowEngine::resolveDispute(const std::string &id, const Principal &principal,
                             bool resolved) {
  return withTransaction<int64_t>(id, [&](Transaction &tx, EventList &events) -> Roe<int64_t> {
    if (!guard::isAllowed(principal, Role::CustomerOrStore, tx)) {
      return reject("resolve", tx, E_DISPUTE,
                    "Only the customer or the assigned store can resolve");
    }
    if (!tx.dispute) {
      return reject("resolve", tx, E_ALREADY_RESOLVED,
                    "No open dispute on the transaction");
    }
    if (!tx.hasStore()) {
      return reject("resolve", tx, E_INVALID_TRANSACTION,
                    "Transaction has no assigned store");
    }

    Principal recipient = resolved ? *tx.store : tx.customer;
    auto paid = payOutAll(tx, recipient, "resolve");
    if (!paid) {
      return paid;
    }

    tx.resetEpisode(Status::Resolved);
    log().info << "Dispute on " << tx.id << " resolved by " << principal
               << ": " << paid.value() << " paid to " << recipient;
    queueEvent(events, tx, resolved ? "resolved_for_store" : "resolved_for_customer",
              principal, paid.value());
    return paid;
  });
}

EscrowEngine::Roe<ItemReview>
EscrowEngine::releasePayment(const std::string &id, const Principal &principal,
                             const std::string &review, int32_t rating) {
  return withTransaction<ItemReview>(
      id, [&](Transaction &tx, EventList &events) -> Roe<ItemReview> {
        if (!guard::isAllowed(principal, Role::CustomerOnly, tx)) {
          return reject("release", tx, E_NOT_STORE,
                        "Only the customer can release payment");
        }
        if (!config_.isValidRating(rating)) {
          return reject("release", tx, E_INVALID_RATING,
                        "Rating must be between " +
                            std::to_string(config_.minRating) + " and " +
                            std::to_string(config_.maxRating));
        }
        Timestamp now = clock_.now();
        if (!deadline::isAfter(now, tx.deadline)) {
          return reject("release", tx, E_DEADLINE_PASSED,
                        "Payment can only be released after the deadline");
        }
        if (!tx.hasStore()) {
          return reject("release", tx, E_INVALID_TRANSACTION,
                        "Transaction has no assigned store");
        }
        if (!tx.fulfilled || tx.dispute) {
          return reject("release", tx, E_INVALID_WITHDRAWAL,
                        "Payment requires fulfilment and no open dispute");
        }
        if (tx.escrow.isEmpty()) {
          return reject("release", tx, E_INSUFFICIENT_ESCROW,
                        "No escrow to release");
        }

        Principal store = *tx.store;
        auto paid = payOutAll(tx, store, "release");
        if (!paid) {
          return paid.error();
        }

        ItemReview entry =
            reviews_.record(tx.id, store, tx.customer, review, rating, now);
        auto stats = statistics_.update(store, paid.value(), rating);

        if (!tx.isRatedThisEpisode()) {
          tx.rating = rating;
          tx.ratedEpisode = tx.episode;
        }
        tx.resetEpisode(Status::Completed);

        log().info << "Payment of " << paid.value() << " on " << tx.id
                   << " released to " << store << " (rating " << rating
                   << ", store average " << stats.averageRating << ")";
        queueEvent(events, tx, "released", principal, paid.value());
        return entry;
      });
}

EscrowEngine::Roe<void> EscrowEngine::addFunds(const std::string &id,
                                               const Principal &principal,
                                               int64_t amount) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    if (!guard::isAllowed(principal, Role::CustomerOnly, tx)) {
      return reject("fund", tx, E_NOT_STORE,
                    "Only the customer can add funds");
    }
    auto check = tx.escrow.checkDeposit(amount);
    if (!check) {
      return reject("fund", tx, E_INPUT, check.error().message);
    }

    auto depositResult = ledger_.depositIntoCustody(tx.id, principal, amount);
    if (!depositResult) {
      log().warning << "fund on " << tx.id << ": ledger refused deposit of "
                    << amount << " from " << principal << ": "
                    << depositResult.error().message;
      return Error(E_LEDGER, "Ledger deposit failed: " +
                                 depositResult.error().message);
    }

    auto result = tx.escrow.deposit(amount);
    if (!result) {
      // checkDeposit passed under the same lock
      log().critical << "fund on " << tx.id
                     << ": custody out of sync with ledger: "
                     << result.error().message;
      return Error(E_LEDGER, result.error().message);
    }

    log().info << "Added " << amount << " to escrow of " << tx.id
               << " (balance " << tx.escrow.getBalance() << ")";
    queueEvent(events, tx, "funded", principal, amount);
    return {};
  });
}

EscrowEngine::Roe<int64_t>
EscrowEngine::cancelTransaction(const std::string &id,
                                const Principal &principal) {
  return withTransaction<int64_t>(id, [&](Transaction &tx, EventList &events) -> Roe<int64_t> {
    if (!guard::isAllowed(principal, Role::CustomerOrStore, tx)) {
      return reject("cancel", tx, E_NOT_STORE,
                    "Only the customer or the assigned store can cancel");
    }
    if (tx.fulfilled || tx.dispute) {
      return reject("cancel", tx, E_INVALID_WITHDRAWAL,
                    "Cannot cancel a fulfilled or disputed transaction");
    }

    auto refunded = payOutAll(tx, tx.customer, "cancel");
    if (!refunded) {
      return refunded;
    }

    tx.resetEpisode(Status::Cancelled);
    log().info << "Transaction " << tx.id << " cancelled by " << principal
               << ", refunded " << refunded.value();
    queueEvent(events, tx, "cancelled", principal, refunded.value());
    return refunded;
  });
}

EscrowEngine::Roe<int64_t>
EscrowEngine::requestRefund(const std::string &id, const Principal &principal) {
  return withTransaction<int64_t>(id, [&](Transaction &tx, EventList &events) -> Roe<int64_t> {
    if (!guard::isAllowed(principal, Role::CustomerOnly, tx)) {
      return reject("refund", tx, E_NOT_STORE,
                    "Only the customer can request a refund");
    }
    if (tx.fulfilled || tx.dispute) {
      return reject("refund", tx, E_INVALID_WITHDRAWAL,
                    "Cannot refund a fulfilled or disputed transaction");
    }

    auto refunded = payOutAll(tx, tx.customer, "refund");
    if (!refunded) {
      return refunded;
    }

    tx.resetEpisode(Status::Refunded);
    log().info << "Transaction " << tx.id << " refunded "
               << refunded.value() << " to " << tx.customer;
    queueEvent(events, tx, "refunded", principal, refunded.value());
    return refunded;
  });
}

EscrowEngine::Roe<void> EscrowEngine::rateStore(const std::string &id,
                                                const Principal &principal,
                                                int32_t rating) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    if (!guard::isAllowed(principal, Role::CustomerOnly, tx)) {
      return reject("rate", tx, E_NOT_STORE, "Only the customer can rate");
    }
    if (!config_.isValidRating(rating)) {
      return reject("rate", tx, E_INVALID_RATING,
                    "Rating must be between " +
                        std::to_string(config_.minRating) + " and " +
                        std::to_string(config_.maxRating));
    }
    if (tx.isRatedThisEpisode()) {
      return reject("rate", tx, E_INVALID_RATING,
                    "Transaction already rated in this episode");
    }

    tx.rating = rating;
    tx.ratedEpisode = tx.episode;
    log().info << "Transaction " << tx.id << " rated " << rating;
    queueEvent(events, tx, "rated", principal);
    return {};
  });
}

// ---------------------------------------------------------------------------
// Detail updates
// ---------------------------------------------------------------------------

EscrowEngine::Roe<void>
EscrowEngine::checkDetailUpdate(const char *action, const Transaction &tx,
                                const Principal &principal) const {
  if (!guard::isAllowed(principal, Role::CustomerOnly, tx)) {
    return reject(action, tx, E_NOT_STORE,
                  "Only the customer can update transaction details");
  }
  if (tx.hasStore()) {
    return reject(action, tx, E_INVALID_TRANSACTION,
                  "Details are frozen once a store has accepted");
  }
  return {};
}

EscrowEngine::Roe<void> EscrowEngine::updateItem(const std::string &id,
                                                 const Principal &principal,
                                                 const std::string &item) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    auto check = checkDetailUpdate("update_item", tx, principal);
    if (!check) {
      return check;
    }
    tx.item = item;
    queueEvent(events, tx, "updated_item", principal);
    return {};
  });
}

EscrowEngine::Roe<void> EscrowEngine::updatePrice(const std::string &id,
                                                  const Principal &principal,
                                                  int64_t price) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    auto check = checkDetailUpdate("update_price", tx, principal);
    if (!check) {
      return check;
    }
    if (price < 0) {
      return reject("update_price", tx, E_INPUT,
                    "Price must be non-negative");
    }
    tx.price = price;
    queueEvent(events, tx, "updated_price", principal);
    return {};
  });
}

EscrowEngine::Roe<void> EscrowEngine::updateQuantity(const std::string &id,
                                                     const Principal &principal,
                                                     int64_t quantity) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    auto check = checkDetailUpdate("update_quantity", tx, principal);
    if (!check) {
      return check;
    }
    if (quantity < 0) {
      return reject("update_quantity", tx, E_INPUT,
                    "Quantity must be non-negative");
    }
    tx.quantity = quantity;
    queueEvent(events, tx, "updated_quantity", principal);
    return {};
  });
}

EscrowEngine::Roe<void> EscrowEngine::updateDeadline(const std::string &id,
                                                     const Principal &principal,
                                                     Timestamp deadline) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    auto check = checkDetailUpdate("update_deadline", tx, principal);
    if (!check) {
      return check;
    }
    if (deadline < 0) {
      return reject("update_deadline", tx, E_INPUT,
                    "Deadline must be non-negative");
    }
    tx.deadline = deadline;
    queueEvent(events, tx, "updated_deadline", principal);
    return {};
  });
}

EscrowEngine::Roe<void> EscrowEngine::updateStatus(const std::string &id,
                                                   const Principal &principal,
                                                   Status status) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    auto check = checkDetailUpdate("update_status", tx, principal);
    if (!check) {
      return check;
    }
    if (status != Status::Open && status != Status::Cancelled) {
      return reject("update_status", tx, E_INVALID_TRANSACTION,
                    "Status '" + statusToString(status) +
                        "' cannot be set directly");
    }
    tx.status = status;
    queueEvent(events, tx, "updated_status", principal);
    return {};
  });
}

// ---------------------------------------------------------------------------
// Store-side adjustments
// ---------------------------------------------------------------------------

EscrowEngine::Roe<void> EscrowEngine::extendDeadline(const std::string &id,
                                                     const Principal &principal,
                                                     int64_t extension) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    if (!guard::isAllowed(principal, Role::StoreOnly, tx)) {
      return reject("extend", tx, E_NOT_STORE,
                    "Only the assigned store can extend the deadline");
    }
    Timestamp extended = 0;
    if (!deadline::extendDeadline(tx.deadline, extension, extended)) {
      return reject("extend", tx, E_INPUT,
                    "Invalid extension: " + std::to_string(extension));
    }

    tx.deadline = extended;
    log().info << "Deadline of " << tx.id << " extended to " << extended;
    queueEvent(events, tx, "deadline_extended", principal);
    return {};
  });
}

EscrowEngine::Roe<void> EscrowEngine::partialRefund(const std::string &id,
                                                    const Principal &principal,
                                                    int64_t amount) {
  return withTransaction<void>(id, [&](Transaction &tx, EventList &events) -> Roe<void> {
    if (!guard::isAllowed(principal, Role::StoreOnly, tx)) {
      return reject("partial_refund", tx, E_NOT_STORE,
                    "Only the assigned store can issue a partial refund");
    }

    auto result = payOut(tx, tx.customer, amount, "partial_refund");
    if (!result) {
      return result;
    }

    log().info << "Store " << principal << " refunded " << amount << " of "
               << tx.id << " (balance " << tx.escrow.getBalance() << ")";
    queueEvent(events, tx, "partial_refund", principal, amount);
    return {};
  });
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

EscrowEngine::Roe<std::string>
EscrowEngine::getItem(const std::string &id) const {
  return readTransaction<std::string>(
      id, [](const Transaction &tx) -> Roe<std::string> { return tx.item; });
}

EscrowEngine::Roe<int64_t> EscrowEngine::getPrice(const std::string &id) const {
  return readTransaction<int64_t>(
      id, [](const Transaction &tx) -> Roe<int64_t> { return tx.price; });
}

EscrowEngine::Roe<Status> EscrowEngine::getStatus(const std::string &id) const {
  return readTransaction<Status>(
      id, [](const Transaction &tx) -> Roe<Status> { return tx.status; });
}

EscrowEngine::Roe<Timestamp>
EscrowEngine::getDeadline(const std::string &id) const {
  return readTransaction<Timestamp>(
      id, [](const Transaction &tx) -> Roe<Timestamp> { return tx.deadline; });
}

EscrowEngine::Roe<int64_t>
EscrowEngine::getEscrow(const std::string &id) const {
  return readTransaction<int64_t>(id, [](const Transaction &tx) -> Roe<int64_t> {
    return tx.escrow.getBalance();
  });
}

EscrowEngine::Roe<Transaction>
EscrowEngine::getDetails(const std::string &id) const {
  return readTransaction<Transaction>(
      id, [](const Transaction &tx) -> Roe<Transaction> { return tx; });
}

bool EscrowEngine::hasTransaction(const std::string &id) const {
  return findSlot(id) != nullptr;
}

std::vector<std::string> EscrowEngine::getTransactionIds() const {
  std::lock_guard<std::mutex> lock(registryMutex_);
  std::vector<std::string> ids;
  ids.reserve(mSlots_.size());
  for (const auto &[id, spSlot] : mSlots_) {
    ids.push_back(id);
  }
  return ids;
}

size_t EscrowEngine::getTransactionCount() const {
  std::lock_guard<std::mutex> lock(registryMutex_);
  return mSlots_.size();
}

} // namespace bz
