#ifndef BAZAAR_STORE_STATISTICS_H
#define BAZAAR_STORE_STATISTICS_H

#include "../interface/Types.hpp"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <vector>

namespace bz {

/**
 * StoreStatistics - Running per-store totals fed by completed payments.
 *
 * Records are created on first use. All access is serialized on one mutex,
 * so concurrent releases against the same store apply their
 * read-modify-write one after another.
 */
class StoreStatistics {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_NOT_FOUND = 1;

  struct Record {
    uint64_t totalTransactions{ 0 };
    int64_t totalRevenue{ 0 };
    double averageRating{ 0.0 };

    nlohmann::json toJson() const;
  };

  StoreStatistics() = default;
  ~StoreStatistics() = default;

  /**
   * Count one more completed transaction for store.
   * avg = (avg * (n - 1) + rating) / n. Revenue saturates at INT64_MAX.
   * @return The record after the update
   */
  Record update(const Principal &store, int64_t revenue, int32_t rating);

  Roe<Record> get(const Principal &store) const;
  bool has(const Principal &store) const;
  std::vector<Principal> getStores() const;
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<Principal, Record> mRecords_;
};

} // namespace bz

#endif // BAZAAR_STORE_STATISTICS_H
