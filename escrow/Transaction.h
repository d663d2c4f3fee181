#ifndef BAZAAR_TRANSACTION_H
#define BAZAAR_TRANSACTION_H

#include "Custody.h"
#include "Types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace bz {

/**
 * Transaction - One purchase negotiation between a customer and a store.
 *
 * The record is reused across episodes: resolution, cancellation, refund and
 * payment release put it back into an open-like state with no store, no
 * dispute and nothing fulfilled.
 */
struct Transaction {
  std::string id;
  Principal customer;
  std::optional<Principal> store;
  std::string item;
  int64_t quantity{ 0 };
  int64_t price{ 0 };
  Custody escrow;
  bool dispute{ false };
  bool fulfilled{ false };
  std::optional<int32_t> rating;
  uint64_t ratedEpisode{ 0 };
  Status status{ Status::Open };
  Timestamp createdAt{ 0 };
  Timestamp deadline{ 0 };
  uint64_t episode{ 1 };

  bool hasStore() const { return store.has_value(); }
  bool isStore(const Principal &principal) const {
    return store.has_value() && *store == principal;
  }
  bool isCustomer(const Principal &principal) const {
    return customer == principal;
  }
  bool isRatedThisEpisode() const {
    return rating.has_value() && ratedEpisode == episode;
  }

  /**
   * Close the current episode: clear store, dispute and fulfilment, set the
   * closing status and start the next episode. The last rating is kept.
   */
  void resetEpisode(Status closingStatus);

  nlohmann::json toJson() const;
};

} // namespace bz

#endif // BAZAAR_TRANSACTION_H
