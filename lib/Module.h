#pragma once

#include "Logger.h"
#include <string>

namespace qc {

/**
 * Base class for components that log under their own hierarchical name.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "qchain.node.server")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Re-parent this module's logger under another logger, so that a node
   * instance can collect the output of the components it owns.
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  /**
   * Get the logger instance for this module.
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

  const std::string &getLoggerName() const { return loggerName_; }

private:
  std::string loggerName_;
  mutable logging::Logger logger_;
};

} // namespace qc
