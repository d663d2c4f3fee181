#ifndef BAZAAR_ESCROW_SERVER_H
#define BAZAAR_ESCROW_SERVER_H

#include "../escrow/Clocks.h"
#include "../escrow/EngineConfig.h"
#include "../escrow/EscrowEngine.h"
#include "../escrow/EventSinks.h"
#include "../escrow/MemoryLedger.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace bz {

/**
 * EscrowServer - Host for one EscrowEngine, driven by JSON requests.
 *
 * A request is a JSON object with a "type" naming the operation and a
 * "principal" naming the already-authenticated caller, e.g.
 *   {"type":"accept","principal":"storeA","id":"..."}
 *
 * Engine failures keep the engine's error code (positive); malformed
 * requests and configuration problems use the negative codes below.
 */
class EscrowServer : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_CONFIG = -1;
  static constexpr const int32_t E_REQUEST = -2;
  static constexpr const int32_t E_STATE = -3;

  struct InitConfig {
    EngineConfig engine;
    bool manualClock{ false };
    Timestamp startTime{ 0 };
  };

  EscrowServer();
  ~EscrowServer() override = default;

  Roe<void> init(const InitConfig &config);
  bool isInitialized() const { return spEngine_ != nullptr; }

  Roe<std::string> handleJsonRequest(const std::string &payload);
  Roe<std::string> handleJsonRequest(const nlohmann::json &reqJson);

  /**
   * Handle one request line and always produce a JSON response line:
   * {"ok":true,...} on success, {"ok":false,"error":{...}} otherwise.
   */
  std::string handleRequestLine(const std::string &line);

  EscrowEngine &getEngine() { return *spEngine_; }
  MemoryLedger &getLedger() { return ledger_; }
  const MemoryEventSink &getEvents() const { return memorySink_; }

private:
  Roe<nlohmann::json> dispatch(const std::string &type,
                               const nlohmann::json &reqJson);

  Roe<nlohmann::json> hCreate(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hAccept(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hFulfill(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hComplete(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hDispute(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hResolve(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hRelease(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hFund(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hCancel(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hRefund(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hRate(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hUpdate(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hExtend(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hPartialRefund(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hGet(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hList(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hStats(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hReviews(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hCredit(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hBalance(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hTick(const nlohmann::json &reqJson);
  Roe<nlohmann::json> hVersion(const nlohmann::json &reqJson);

  // Response carrying the transaction snapshot after a mutation
  Roe<nlohmann::json> snapshot(const std::string &id);

  static Roe<std::string> getString(const nlohmann::json &reqJson,
                                    const char *key);
  static Roe<int64_t> getInt(const nlohmann::json &reqJson, const char *key);
  static Roe<bool> getBool(const nlohmann::json &reqJson, const char *key);
  static Error fromEngine(const EscrowEngine::Error &error);
  static std::string errorName(int32_t code);

  // {"ok":false,"error":{...}} line; invalid UTF-8 in the message is replaced
  static std::string errorResponse(const RoeErrorBase &error);

  MemoryLedger ledger_;
  MemoryEventSink memorySink_;
  LoggingEventSink loggingSink_;
  FanoutEventSink fanoutSink_;
  std::unique_ptr<IClock> spClock_;
  ManualClock *manualClock_{ nullptr };
  std::unique_ptr<EscrowEngine> spEngine_;
};

} // namespace bz

#endif // BAZAAR_ESCROW_SERVER_H
