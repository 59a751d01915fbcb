#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "transfer_task.hpp"

namespace relay::transfer {

/*
  Thread-safe blocking queue for transfer workers.
*/
class TransferScheduler {
 public:
  void Enqueue(TransferTask task);

  // blocking wait
  std::optional<TransferTask> Dequeue();

  void Shutdown();

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::queue<TransferTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace relay::transfer
