#ifndef BAZAAR_REVIEW_BOOK_H
#define BAZAAR_REVIEW_BOOK_H

#include "../interface/Types.hpp"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace bz {

/**
 * Review left by a customer when releasing payment. Never modified after
 * it is recorded.
 */
struct ItemReview {
  uint64_t id{ 0 };
  std::string transactionId;
  Principal store;
  Principal customer;
  std::string review;
  int32_t rating{ 0 };
  Timestamp timestamp{ 0 };

  nlohmann::json toJson() const;
};

/**
 * ReviewBook - Append-only store of item reviews.
 * A review is visible to the store it rates and to the customer who wrote it.
 */
class ReviewBook {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_NOT_FOUND = 1;

  ReviewBook() = default;
  ~ReviewBook() = default;

  ItemReview record(const std::string &transactionId, const Principal &store,
                    const Principal &customer, const std::string &review,
                    int32_t rating, Timestamp timestamp);

  Roe<ItemReview> get(uint64_t id) const;
  std::vector<ItemReview> getReviewsForStore(const Principal &store) const;
  std::vector<ItemReview> getReviewsByCustomer(const Principal &customer) const;
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<ItemReview> reviews_;
};

} // namespace bz

#endif // BAZAAR_REVIEW_BOOK_H
