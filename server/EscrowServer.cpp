#include "EscrowServer.h"
#include "../lib/Lib.h"
#include "../lib/Utilities.h"

#include <exception>
#include <limits>
#include <vector>

namespace bz {

EscrowServer::EscrowServer()
    : Module("bazaar.server"), loggingSink_("bazaar.server.events") {}

EscrowServer::Roe<void> EscrowServer::init(const InitConfig &config) {
  if (spEngine_) {
    return Error(E_STATE, "Server already initialized");
  }

  if (config.manualClock) {
    auto spManual = std::make_unique<ManualClock>(config.startTime);
    manualClock_ = spManual.get();
    spClock_ = std::move(spManual);
  } else {
    spClock_ = std::make_unique<SystemClock>();
  }

  fanoutSink_.addSink(&memorySink_);
  if (config.engine.logEvents) {
    fanoutSink_.addSink(&loggingSink_);
  }

  spEngine_ = std::make_unique<EscrowEngine>(ledger_, *spClock_, config.engine);
  spEngine_->setEventSink(&fanoutSink_);

  log().info << "Escrow server initialized (ratings " << config.engine.minRating
             << ".." << config.engine.maxRating << ", "
             << (config.manualClock ? "manual" : "system") << " clock)";
  return {};
}

std::string EscrowServer::errorName(int32_t code) {
  switch (code) {
  case E_CONFIG:
    return "Config";
  case E_REQUEST:
    return "BadRequest";
  case E_STATE:
    return "State";
  default:
    return EscrowEngine::errorName(code);
  }
}

EscrowServer::Error EscrowServer::fromEngine(const EscrowEngine::Error &error) {
  return Error(error.code, error.message);
}

EscrowServer::Roe<std::string>
EscrowServer::getString(const nlohmann::json &reqJson, const char *key) {
  if (!reqJson.contains(key)) {
    return Error(E_REQUEST, std::string("missing ") + key + " field");
  }
  if (!reqJson[key].is_string()) {
    return Error(E_REQUEST, std::string(key) + " must be a string");
  }
  return reqJson[key].get<std::string>();
}

EscrowServer::Roe<int64_t> EscrowServer::getInt(const nlohmann::json &reqJson,
                                                const char *key) {
  if (!reqJson.contains(key)) {
    return Error(E_REQUEST, std::string("missing ") + key + " field");
  }
  const auto &value = reqJson[key];
  if (!value.is_number_integer()) {
    return Error(E_REQUEST, std::string(key) + " must be an integer");
  }
  if (value.is_number_unsigned() &&
      value.get<uint64_t>() >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return Error(E_REQUEST, std::string(key) + " is out of range");
  }
  return value.get<int64_t>();
}

EscrowServer::Roe<bool> EscrowServer::getBool(const nlohmann::json &reqJson,
                                              const char *key) {
  if (!reqJson.contains(key)) {
    return Error(E_REQUEST, std::string("missing ") + key + " field");
  }
  if (!reqJson[key].is_boolean()) {
    return Error(E_REQUEST, std::string(key) + " must be a boolean");
  }
  return reqJson[key].get<bool>();
}

std::string EscrowServer::errorResponse(const RoeErrorBase &error) {
  nlohmann::json resp;
  resp["ok"] = false;
  resp["error"]["code"] = error.code;
  resp["error"]["name"] = errorName(error.code);
  resp["error"]["message"] = error.message;
  return resp.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string EscrowServer::handleRequestLine(const std::string &line) {
  try {
    auto result = handleJsonRequest(line);
    if (result) {
      return result.value();
    }
    return errorResponse(result.error());
  } catch (const std::exception &e) {
    log().error << "Exception while handling request: " << e.what();
    return errorResponse(
        Error(E_REQUEST, std::string("Request failed: ") + e.what()));
  }
}

EscrowServer::Roe<std::string>
EscrowServer::handleJsonRequest(const std::string &payload) {
  auto jsonResult = utl::parseJsonRequest(payload);
  if (jsonResult.isError()) {
    return Error(E_REQUEST, "Failed to parse request JSON: " +
                                jsonResult.error().message);
  }
  return handleJsonRequest(jsonResult.value());
}

EscrowServer::Roe<std::string>
EscrowServer::handleJsonRequest(const nlohmann::json &reqJson) {
  if (!spEngine_) {
    return Error(E_STATE, "Server not initialized");
  }
  if (!reqJson.is_object() || !reqJson.contains("type") ||
      !reqJson["type"].is_string()) {
    return Error(E_REQUEST, "Missing type field in request JSON");
  }
  std::string type = reqJson["type"].get<std::string>();

  auto result = dispatch(type, reqJson);
  if (!result) {
    log().debug << "Request '" << type << "' failed: " << result.error();
    return result.error();
  }

  nlohmann::json resp = result.value();
  resp["ok"] = true;
  return resp.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::dispatch(const std::string &type, const nlohmann::json &reqJson) {
  if (type == "create") {
    return hCreate(reqJson);
  } else if (type == "accept") {
    return hAccept(reqJson);
  } else if (type == "fulfill") {
    return hFulfill(reqJson);
  } else if (type == "complete") {
    return hComplete(reqJson);
  } else if (type == "dispute") {
    return hDispute(reqJson);
  } else if (type == "resolve") {
    return hResolve(reqJson);
  } else if (type == "release") {
    return hRelease(reqJson);
  } else if (type == "fund") {
    return hFund(reqJson);
  } else if (type == "cancel") {
    return hCancel(reqJson);
  } else if (type == "refund") {
    return hRefund(reqJson);
  } else if (type == "rate") {
    return hRate(reqJson);
  } else if (type == "update") {
    return hUpdate(reqJson);
  } else if (type == "extend") {
    return hExtend(reqJson);
  } else if (type == "partialRefund") {
    return hPartialRefund(reqJson);
  } else if (type == "get") {
    return hGet(reqJson);
  } else if (type == "list") {
    return hList(reqJson);
  } else if (type == "stats") {
    return hStats(reqJson);
  } else if (type == "reviews") {
    return hReviews(reqJson);
  } else if (type == "credit") {
    return hCredit(reqJson);
  } else if (type == "balance") {
    return hBalance(reqJson);
  } else if (type == "tick") {
    return hTick(reqJson);
  } else if (type == "version") {
    return hVersion(reqJson);
  } else {
    return Error(E_REQUEST, "Unknown request type: " + type);
  }
}

EscrowServer::Roe<nlohmann::json> EscrowServer::snapshot(const std::string &id) {
  auto details = spEngine_->getDetails(id);
  if (!details) {
    return fromEngine(details.error());
  }
  nlohmann::json resp;
  resp["transaction"] = details.value().toJson();
  return resp;
}

// Lifecycle handlers

EscrowServer::Roe<nlohmann::json>
EscrowServer::hCreate(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto item = getString(reqJson, "item");
  if (!item) {
    return item.error();
  }
  auto quantity = getInt(reqJson, "quantity");
  if (!quantity) {
    return quantity.error();
  }
  auto price = getInt(reqJson, "price");
  if (!price) {
    return price.error();
  }
  auto duration = getInt(reqJson, "duration");
  if (!duration) {
    return duration.error();
  }

  auto idResult =
      spEngine_->createTransaction(principal.value(), item.value(),
                                   quantity.value(), price.value(),
                                   duration.value());
  if (!idResult) {
    return fromEngine(idResult.error());
  }
  return snapshot(idResult.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hAccept(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto result = spEngine_->acceptTransaction(id.value(), principal.value());
  if (!result) {
    return fromEngine(result.error());
  }
  return snapshot(id.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hFulfill(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto result = spEngine_->fulfillTransaction(id.value(), principal.value());
  if (!result) {
    return fromEngine(result.error());
  }
  return snapshot(id.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hComplete(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto result = spEngine_->markComplete(id.value(), principal.value());
  if (!result) {
    return fromEngine(result.error());
  }
  return snapshot(id.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hDispute(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto result = spEngine_->disputeTransaction(id.value(), principal.value());
  if (!result) {
    return fromEngine(result.error());
  }
  return snapshot(id.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hResolve(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto resolved = getBool(reqJson, "resolved");
  if (!resolved) {
    return resolved.error();
  }
  auto paid = spEngine_->resolveDispute(id.value(), principal.value(),
                                        resolved.value());
  if (!paid) {
    return fromEngine(paid.error());
  }
  auto resp = snapshot(id.value());
  if (resp) {
    resp.value()["paid"] = paid.value();
  }
  return resp;
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hRelease(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto rating = getInt(reqJson, "rating");
  if (!rating) {
    return rating.error();
  }
  if (rating.value() < std::numeric_limits<int32_t>::min() ||
      rating.value() > std::numeric_limits<int32_t>::max()) {
    return Error(EscrowEngine::E_INVALID_RATING, "rating is out of range");
  }
  std::string review;
  if (reqJson.contains("review")) {
    auto text = getString(reqJson, "review");
    if (!text) {
      return text.error();
    }
    review = text.value();
  }

  auto entry = spEngine_->releasePayment(id.value(), principal.value(), review,
                                         static_cast<int32_t>(rating.value()));
  if (!entry) {
    return fromEngine(entry.error());
  }
  auto resp = snapshot(id.value());
  if (resp) {
    resp.value()["review"] = entry.value().toJson();
  }
  return resp;
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hFund(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto amount = getInt(reqJson, "amount");
  if (!amount) {
    return amount.error();
  }
  auto result =
      spEngine_->addFunds(id.value(), principal.value(), amount.value());
  if (!result) {
    return fromEngine(result.error());
  }
  return snapshot(id.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hCancel(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto refunded = spEngine_->cancelTransaction(id.value(), principal.value());
  if (!refunded) {
    return fromEngine(refunded.error());
  }
  auto resp = snapshot(id.value());
  if (resp) {
    resp.value()["refunded"] = refunded.value();
  }
  return resp;
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hRefund(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto refunded = spEngine_->requestRefund(id.value(), principal.value());
  if (!refunded) {
    return fromEngine(refunded.error());
  }
  auto resp = snapshot(id.value());
  if (resp) {
    resp.value()["refunded"] = refunded.value();
  }
  return resp;
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hRate(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto rating = getInt(reqJson, "rating");
  if (!rating) {
    return rating.error();
  }
  if (rating.value() < std::numeric_limits<int32_t>::min() ||
      rating.value() > std::numeric_limits<int32_t>::max()) {
    return Error(EscrowEngine::E_INVALID_RATING, "rating is out of range");
  }
  auto result = spEngine_->rateStore(id.value(), principal.value(),
                                     static_cast<int32_t>(rating.value()));
  if (!result) {
    return fromEngine(result.error());
  }
  return snapshot(id.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hUpdate(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto field = getString(reqJson, "field");
  if (!field) {
    return field.error();
  }

  EscrowEngine::Roe<void> result;
  if (field.value() == "item") {
    auto value = getString(reqJson, "value");
    if (!value) {
      return value.error();
    }
    result = spEngine_->updateItem(id.value(), principal.value(), value.value());
  } else if (field.value() == "status") {
    auto value = getString(reqJson, "value");
    if (!value) {
      return value.error();
    }
    Status status = Status::Open;
    if (!parseStatus(value.value(), status)) {
      return Error(E_REQUEST, "unknown status: " + value.value());
    }
    result = spEngine_->updateStatus(id.value(), principal.value(), status);
  } else if (field.value() == "price" || field.value() == "quantity" ||
             field.value() == "deadline") {
    auto value = getInt(reqJson, "value");
    if (!value) {
      return value.error();
    }
    if (field.value() == "price") {
      result =
          spEngine_->updatePrice(id.value(), principal.value(), value.value());
    } else if (field.value() == "quantity") {
      result = spEngine_->updateQuantity(id.value(), principal.value(),
                                         value.value());
    } else {
      result = spEngine_->updateDeadline(id.value(), principal.value(),
                                         value.value());
    }
  } else {
    return Error(E_REQUEST, "unknown field: " + field.value());
  }

  if (!result) {
    return fromEngine(result.error());
  }
  return snapshot(id.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hExtend(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto extension = getInt(reqJson, "extension");
  if (!extension) {
    return extension.error();
  }
  auto result = spEngine_->extendDeadline(id.value(), principal.value(),
                                          extension.value());
  if (!result) {
    return fromEngine(result.error());
  }
  return snapshot(id.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hPartialRefund(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  auto amount = getInt(reqJson, "amount");
  if (!amount) {
    return amount.error();
  }
  auto result =
      spEngine_->partialRefund(id.value(), principal.value(), amount.value());
  if (!result) {
    return fromEngine(result.error());
  }
  return snapshot(id.value());
}

// Query handlers

EscrowServer::Roe<nlohmann::json>
EscrowServer::hGet(const nlohmann::json &reqJson) {
  auto id = getString(reqJson, "id");
  if (!id) {
    return id.error();
  }
  return snapshot(id.value());
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hList(const nlohmann::json &reqJson) {
  nlohmann::json resp;
  resp["ids"] = spEngine_->getTransactionIds();
  return resp;
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hVersion(const nlohmann::json &reqJson) {
  nlohmann::json resp;
  resp["build"] = Lib::getBuildInfo();
  return resp;
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hStats(const nlohmann::json &reqJson) {
  auto store = getString(reqJson, "store");
  if (!store) {
    return store.error();
  }
  auto record = spEngine_->getStatistics().get(store.value());
  if (!record) {
    return Error(EscrowEngine::E_NOT_FOUND, record.error().message);
  }
  nlohmann::json resp;
  resp["store"] = store.value();
  resp["statistics"] = record.value().toJson();
  return resp;
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hReviews(const nlohmann::json &reqJson) {
  std::vector<ItemReview> reviews;
  nlohmann::json resp;
  if (reqJson.contains("store")) {
    auto store = getString(reqJson, "store");
    if (!store) {
      return store.error();
    }
    reviews = spEngine_->getReviews().getReviewsForStore(store.value());
    resp["store"] = store.value();
  } else if (reqJson.contains("customer")) {
    auto customer = getString(reqJson, "customer");
    if (!customer) {
      return customer.error();
    }
    reviews = spEngine_->getReviews().getReviewsByCustomer(customer.value());
    resp["customer"] = customer.value();
  } else {
    return Error(E_REQUEST, "missing store or customer field");
  }

  resp["reviews"] = nlohmann::json::array();
  for (const auto &review : reviews) {
    resp["reviews"].push_back(review.toJson());
  }
  return resp;
}

// Host-side handlers: funding principals and driving the manual clock

EscrowServer::Roe<nlohmann::json>
EscrowServer::hCredit(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  auto amount = getInt(reqJson, "amount");
  if (!amount) {
    return amount.error();
  }
  auto result = ledger_.credit(principal.value(), amount.value());
  if (!result) {
    return Error(E_REQUEST, "Credit failed: " + result.error().message);
  }
  nlohmann::json resp;
  resp["principal"] = principal.value();
  resp["balance"] = ledger_.getBalance(principal.value());
  return resp;
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hBalance(const nlohmann::json &reqJson) {
  auto principal = getString(reqJson, "principal");
  if (!principal) {
    return principal.error();
  }
  nlohmann::json resp;
  resp["principal"] = principal.value();
  resp["balance"] = ledger_.getBalance(principal.value());
  return resp;
}

EscrowServer::Roe<nlohmann::json>
EscrowServer::hTick(const nlohmann::json &reqJson) {
  if (!manualClock_) {
    return Error(E_STATE, "Clock is not manual");
  }
  if (reqJson.contains("time")) {
    auto time = getInt(reqJson, "time");
    if (!time) {
      return time.error();
    }
    if (time.value() < manualClock_->now()) {
      return Error(E_REQUEST, "Clock cannot move backwards");
    }
    manualClock_->set(time.value());
  } else {
    auto delta = getInt(reqJson, "delta");
    if (!delta) {
      return delta.error();
    }
    if (delta.value() < 0) {
      return Error(E_REQUEST, "delta must be non-negative");
    }
    Timestamp next = 0;
    if (!utl::safeAdd(manualClock_->now(), delta.value(), next)) {
      return Error(E_REQUEST, "delta moves the clock past its range");
    }
    manualClock_->set(next);
  }
  nlohmann::json resp;
  resp["now"] = manualClock_->now();
  return resp;
}

} // namespace bz
