#include "ReviewBook.h"
#include "../lib/Utilities.h"

namespace bz {

nlohmann::json ItemReview::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["transactionId"] = transactionId;
  j["store"] = utl::toJsonSafeString(store);
  j["customer"] = utl::toJsonSafeString(customer);
  j["review"] = utl::toJsonSafeString(review);
  j["rating"] = rating;
  j["timestamp"] = timestamp;
  return j;
}

ItemReview ReviewBook::record(const std::string &transactionId,
                              const Principal &store,
                              const Principal &customer,
                              const std::string &review, int32_t rating,
                              Timestamp timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);
  ItemReview entry;
  entry.id = reviews_.size() + 1;
  entry.transactionId = transactionId;
  entry.store = store;
  entry.customer = customer;
  entry.review = review;
  entry.rating = rating;
  entry.timestamp = timestamp;
  reviews_.push_back(entry);
  return entry;
}

ReviewBook::Roe<ItemReview> ReviewBook::get(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (id == 0 || id > reviews_.size()) {
    return Error(E_NOT_FOUND, "Review not found: " + std::to_string(id));
  }
  return reviews_[id - 1];
}

std::vector<ItemReview>
ReviewBook::getReviewsForStore(const Principal &store) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ItemReview> result;
  for (const auto &review : reviews_) {
    if (review.store == store) {
      result.push_back(review);
    }
  }
  return result;
}

std::vector<ItemReview>
ReviewBook::getReviewsByCustomer(const Principal &customer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ItemReview> result;
  for (const auto &review : reviews_) {
    if (review.customer == customer) {
      result.push_back(review);
    }
  }
  return result;
}

size_t ReviewBook::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reviews_.size();
}

} // namespace bz
