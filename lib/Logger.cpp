#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace bz {
namespace logging {

static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

static std::recursive_mutex &getRegistryMutex() {
  static std::recursive_mutex mutex;
  return mutex;
}

static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &
getLoggerRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&time, &local);

  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

bool parseLevel(const std::string &name, Level &level) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (Level l : { Level::DEBUG, Level::INFO, Level::WARNING, Level::ERROR,
                   Level::CRITICAL }) {
    if (levelToString(l) == upper) {
      level = l;
      return true;
    }
  }
  return false;
}

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  std::clog << message << std::endl;
}

// FileHandler implementation
FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &loggerName,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// LogProxy implementation
LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

// LogStream implementation
LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode Implementation ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {
  // Only the root writes to the console; children propagate to it
  if (name_.empty()) {
    addHandler(std::make_shared<ConsoleHandler>());
  }
}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;

  auto current = shared_from_this();
  while (current && !current->getName().empty()) {
    parts.push_back(current->getName());
    current = current->getParent();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::addChild(std::shared_ptr<LoggerNode> child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.push_back(child);
}

void LoggerNode::removeChild(LoggerNode *child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.erase(std::remove_if(children_.begin(), children_.end(),
                                 [child](const std::weak_ptr<LoggerNode> &weak) {
                                   auto ptr = weak.lock();
                                   return !ptr || ptr.get() == child;
                                 }),
                  children_.end());
}

std::vector<std::shared_ptr<LoggerNode>> LoggerNode::getChildren() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<LoggerNode>> result;
  for (const auto &weak : children_) {
    if (auto child = weak.lock()) {
      result.push_back(child);
    }
  }
  return result;
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  logFrom(level, message, getFullName());
}

void LoggerNode::logFrom(Level level, const std::string &message,
                         const std::string &originName) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!spHandlers_.empty()) {
      std::string formatted = formatMessage(level, message, originName);
      for (auto &spHandler : spHandlers_) {
        spHandler->emit(level, originName, formatted);
      }
    }
  }

  if (propagate_) {
    auto parentNode = getParent();
    if (parentNode) {
      parentNode->logFrom(level, message, originName);
    }
  }
}

std::string LoggerNode::formatMessage(Level level, const std::string &message,
                                      const std::string &originName) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger Implementation ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(node) {}

// Proxies hold a pointer to their owning Logger, so copies rebind them
Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

Logger Logger::getParent() const {
  return Logger(spNode_ ? spNode_->getParent() : nullptr);
}

std::vector<Logger> Logger::getChildren() const {
  std::vector<Logger> result;
  if (!spNode_) {
    return result;
  }
  for (const auto &child : spNode_->getChildren()) {
    result.push_back(Logger(child));
  }
  return result;
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  redirectTo(logging::getLogger(targetLoggerName));
}

void Logger::redirectTo(const Logger &targetLogger) {
  auto targetNode = targetLogger.spNode_;
  if (!targetNode) {
    throw std::invalid_argument("Cannot redirect to null logger");
  }
  if (targetNode == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  // Reject cycles: the target must not be a descendant of this logger
  auto ancestor = targetNode;
  while (ancestor) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
    ancestor = ancestor->getParent();
  }

  auto oldParent = spNode_->getParent();
  if (oldParent) {
    oldParent->removeChild(spNode_.get());
  }

  spNode_->setParent(targetNode);
  targetNode->addChild(spNode_);
}

// ========== Global logger management ==========

Logger getLogger(const std::string &name) {
  std::string trimmedName = trimLeadingDot(name);
  std::lock_guard<std::recursive_mutex> lock(getRegistryMutex());
  auto &registry = getLoggerRegistry();

  auto it = registry.find(trimmedName);
  if (it != registry.end()) {
    return Logger(it->second);
  }

  std::string nodeName = trimmedName;
  std::string parentPath;
  auto lastDot = trimmedName.rfind('.');
  if (lastDot != std::string::npos) {
    parentPath = trimmedName.substr(0, lastDot);
    nodeName = trimmedName.substr(lastDot + 1);
  }

  auto node = std::make_shared<LoggerNode>(nodeName);
  registry[trimmedName] = node;

  if (!trimmedName.empty()) {
    // Parent is created on demand; the root for top-level names
    getLogger(parentPath);
    auto parentNode = registry[trimLeadingDot(parentPath)];
    node->setParent(parentNode);
    parentNode->addChild(node);
  }

  return Logger(node);
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace bz
