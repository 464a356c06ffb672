#include "Module.h"

namespace qc {

Module::Module(const std::string &name)
    : loggerName_(name), logger_(logging::getLogger(name)) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  logger_.redirectTo(targetLoggerName);
}

logging::Logger &Module::log() const { return logger_; }

} // namespace qc
