#ifndef BAZAAR_EVENT_SINKS_H
#define BAZAAR_EVENT_SINKS_H

#include "../interface/IEventSink.hpp"
#include "../lib/Module.h"

#include <mutex>
#include <nlohmann/json.hpp>
#include <vector>

namespace bz {

nlohmann::json eventToJson(const EscrowEvent &event);

/**
 * Keeps every event in memory, in emission order.
 */
class MemoryEventSink : public IEventSink {
public:
  void emit(const EscrowEvent &event) override;

  std::vector<EscrowEvent> getEvents() const;
  std::vector<EscrowEvent>
  getEventsForTransaction(const std::string &transactionId) const;
  size_t size() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<EscrowEvent> events_;
};

/**
 * Writes each event as one JSON line to its logger at INFO level.
 */
class LoggingEventSink : public IEventSink, public Module {
public:
  explicit LoggingEventSink(const std::string &loggerName = "bazaar.events");

  void emit(const EscrowEvent &event) override;
};

/**
 * Forwards to several sinks; null entries are skipped.
 */
class FanoutEventSink : public IEventSink {
public:
  void addSink(IEventSink *sink);
  void emit(const EscrowEvent &event) override;

private:
  std::vector<IEventSink *> sinks_;
};

} // namespace bz

#endif // BAZAAR_EVENT_SINKS_H
