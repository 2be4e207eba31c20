#pragma once

#include "Logger.h"
#include <string>

namespace cl {

/**
 * Base class for components that log.
 * Every module owns a named logger; owners may redirect it under their own
 * logger so that a node's output reads as one tree.
 */
class Module {
public:
  /**
   * @param name Hierarchical logger name (e.g. "cl.Ledger")
   */
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  void redirectLogger(const std::string &targetLoggerName);

  logging::Logger &log() const { return logger_; }

private:
  mutable logging::Logger logger_;
};

} // namespace cl
