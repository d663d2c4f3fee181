#include "EventSinks.h"
#include "../lib/Utilities.h"

namespace bz {

nlohmann::json eventToJson(const EscrowEvent &event) {
  nlohmann::json j;
  j["transactionId"] = event.transactionId;
  j["action"] = event.action;
  j["principal"] = utl::toJsonSafeString(event.principal);
  j["timestamp"] = event.timestamp;
  j["amount"] = event.amount;
  return j;
}

void MemoryEventSink::emit(const EscrowEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<EscrowEvent> MemoryEventSink::getEvents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<EscrowEvent> MemoryEventSink::getEventsForTransaction(
    const std::string &transactionId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<EscrowEvent> result;
  for (const auto &event : events_) {
    if (event.transactionId == transactionId) {
      result.push_back(event);
    }
  }
  return result;
}

size_t MemoryEventSink::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

void MemoryEventSink::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
}

LoggingEventSink::LoggingEventSink(const std::string &loggerName)
    : Module(loggerName) {}

void LoggingEventSink::emit(const EscrowEvent &event) {
  log().info << eventToJson(event).dump();
}

void FanoutEventSink::addSink(IEventSink *sink) {
  if (sink) {
    sinks_.push_back(sink);
  }
}

void FanoutEventSink::emit(const EscrowEvent &event) {
  for (auto *sink : sinks_) {
    sink->emit(event);
  }
}

} // namespace bz
