#ifndef BAZAAR_CLOCKS_H
#define BAZAAR_CLOCKS_H

#include "../interface/IClock.hpp"

#include <atomic>

namespace bz {

// Wall clock in milliseconds
class SystemClock : public IClock {
public:
  Timestamp now() const override;
};

/**
 * Clock that only moves when told to. Used by tests and by request replay.
 */
class ManualClock : public IClock {
public:
  explicit ManualClock(Timestamp start = 0) : now_(start) {}

  Timestamp now() const override { return now_.load(); }

  void set(Timestamp value) { now_.store(value); }

private:
  std::atomic<Timestamp> now_;
};

} // namespace bz

#endif // BAZAAR_CLOCKS_H
