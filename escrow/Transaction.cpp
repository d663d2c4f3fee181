#include "Transaction.h"
#include "../lib/Utilities.h"

namespace bz {

void Transaction::resetEpisode(Status closingStatus) {
  store.reset();
  fulfilled = false;
  dispute = false;
  status = closingStatus;
  ++episode;
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["customer"] = utl::toJsonSafeString(customer);
  j["store"] = store ? nlohmann::json(utl::toJsonSafeString(*store))
                     : nlohmann::json(nullptr);
  j["item"] = utl::toJsonSafeString(item);
  j["quantity"] = quantity;
  j["price"] = price;
  j["escrow"] = escrow.getBalance();
  j["dispute"] = dispute;
  j["fulfilled"] = fulfilled;
  j["rating"] = rating ? nlohmann::json(*rating) : nlohmann::json(nullptr);
  j["status"] = statusToString(status);
  j["createdAt"] = createdAt;
  j["deadline"] = deadline;
  j["episode"] = episode;
  return j;
}

} // namespace bz
