#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "transfer_scheduler.hpp"

namespace relay::transfer {

/*
  Fixed pool of threads executing delivery attempts for one destination.

  Every dequeued task pushes exactly one completion, whatever happens
  inside the sink.
*/
class TransferWorkerPool {
 public:
  TransferWorkerPool(std::shared_ptr<TransferScheduler> scheduler, std::size_t threads);
  ~TransferWorkerPool();

  void Start();

  // Attempts already running finish; queued ones are abandoned.
  void Stop();

 private:
  void Run();

  std::shared_ptr<TransferScheduler> scheduler_;
  std::size_t                        thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace relay::transfer
