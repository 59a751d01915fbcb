#include "transfer_scheduler.hpp"

namespace relay::transfer {

void TransferScheduler::Enqueue(TransferTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<TransferTask> TransferScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  TransferTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TransferScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace relay::transfer
