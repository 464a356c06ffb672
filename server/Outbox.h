#ifndef QCHAIN_OUTBOX_H
#define QCHAIN_OUTBOX_H

#include "../lib/Service.h"
#include "../lib/ThreadSafeQueue.hpp"

#include <atomic>
#include <cstdint>
#include <functional>

namespace qc {

/**
 * Outbox - Runs queued outbound sends on a single worker thread
 *
 * Broadcasts are posted here so that the miner, the accept loop and the
 * request handlers never block on a slow peer. Tasks run in posting order.
 * At most maxPending tasks wait in the queue; posting past that drops the
 * oldest ones. Tasks still queued when the outbox stops are dropped.
 */
class Outbox : public Service {
public:
  using Task = std::function<void()>;

  constexpr static size_t DEFAULT_MAX_PENDING = 1024;

  explicit Outbox(const std::string &name = "qchain.node.outbox");
  ~Outbox() override;

  // Returns false when the outbox is not running; the task is dropped
  bool post(Task task);

  void setMaxPending(size_t maxPending) { maxPending_ = maxPending; }

  size_t getMaxPending() const { return maxPending_; }
  size_t getPendingCount() const { return queue_.size(); }
  uint64_t getCompletedCount() const { return completed_; }
  uint64_t getDroppedCount() const { return dropped_; }

protected:
  void runLoop() override;
  void onStop() override;

private:
  ThreadSafeQueue<Task> queue_;
  std::atomic<size_t> maxPending_{DEFAULT_MAX_PENDING};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace qc

#endif // QCHAIN_OUTBOX_H
