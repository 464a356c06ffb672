#include "Service.h"

namespace qc {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  isStopSet_ = true;
  if (thread_.joinable()) {
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (isRunning_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(-2, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  thread_ = std::thread(&Service::runLoop, this);

  log().debug << "Service started";
  return {};
}

void Service::stop() {
  if (!isRunning_) {
    return;
  }

  log().debug << "Stopping service";

  isStopSet_ = true;

  if (thread_.joinable()) {
    thread_.join();
  }
  isRunning_ = false;

  onStop();

  log().debug << "Service stopped";
}

} // namespace qc
