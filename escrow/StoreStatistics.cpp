#include "StoreStatistics.h"

#include <limits>

namespace bz {

nlohmann::json StoreStatistics::Record::toJson() const {
  nlohmann::json j;
  j["totalTransactions"] = totalTransactions;
  j["totalRevenue"] = totalRevenue;
  j["averageRating"] = averageRating;
  return j;
}

StoreStatistics::Record StoreStatistics::update(const Principal &store,
                                                int64_t revenue,
                                                int32_t rating) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &record = mRecords_[store];

  record.totalTransactions += 1;
  if (revenue > 0) {
    if (record.totalRevenue > std::numeric_limits<int64_t>::max() - revenue) {
      record.totalRevenue = std::numeric_limits<int64_t>::max();
    } else {
      record.totalRevenue += revenue;
    }
  }

  double n = static_cast<double>(record.totalTransactions);
  record.averageRating = (record.averageRating * (n - 1) + rating) / n;
  return record;
}

StoreStatistics::Roe<StoreStatistics::Record>
StoreStatistics::get(const Principal &store) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mRecords_.find(store);
  if (it == mRecords_.end()) {
    return Error(E_NOT_FOUND, "No statistics for store: " + store);
  }
  return it->second;
}

bool StoreStatistics::has(const Principal &store) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mRecords_.find(store) != mRecords_.end();
}

std::vector<Principal> StoreStatistics::getStores() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Principal> stores;
  for (const auto &[store, record] : mRecords_) {
    stores.push_back(store);
  }
  return stores;
}

size_t StoreStatistics::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mRecords_.size();
}

} // namespace bz
