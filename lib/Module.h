#ifndef BAZAAR_MODULE_H
#define BAZAAR_MODULE_H

#include "Logger.h"
#include <string>

namespace bz {

/**
 * Base class for modules that need logging functionality.
 * Provides a common interface for logger management across components.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "bazaar.escrow")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Move this module's logger under another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  /**
   * Get the logger instance for this module.
   *
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  mutable logging::Logger logger_;
};

} // namespace bz

#endif // BAZAAR_MODULE_H
