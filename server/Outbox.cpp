#include "Outbox.h"

#include <chrono>
#include <exception>

namespace qc {

Outbox::Outbox(const std::string &name) : Service(name) {}

Outbox::~Outbox() { stop(); }

bool Outbox::post(Task task) {
  if (!isRunning() || isStopSet()) {
    return false;
  }
  size_t dropped = queue_.pushBounded(std::move(task), maxPending_);
  if (dropped > 0) {
    dropped_ += dropped;
    log().warning << "Outbound queue full, dropped " << dropped
                  << " oldest tasks";
  }
  return true;
}

void Outbox::runLoop() {
  while (!isStopSet()) {
    Task task;
    if (!queue_.waitPoll(task, std::chrono::milliseconds(100))) {
      continue;
    }
    try {
      task();
    } catch (const std::exception &e) {
      log().error << "Outbound task failed: " << e.what();
    }
    ++completed_;
  }
}

void Outbox::onStop() {
  size_t dropped = queue_.size();
  queue_.clear();
  if (dropped > 0) {
    log().debug << "Dropped " << dropped << " queued outbound tasks";
  }
}

} // namespace qc
