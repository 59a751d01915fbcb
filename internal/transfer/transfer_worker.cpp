#include "transfer_worker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace relay::transfer {

using relay::observability::StringField;

TransferWorkerPool::TransferWorkerPool(std::shared_ptr<TransferScheduler> scheduler, std::size_t threads)
    : scheduler_(std::move(scheduler)), thread_count_(threads == 0 ? 1 : threads) {
}

TransferWorkerPool::~TransferWorkerPool() {
  Stop();
}

void TransferWorkerPool::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&TransferWorkerPool::Run, this);
  }
}

void TransferWorkerPool::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void TransferWorkerPool::Run() {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    const auto     started = std::chrono::steady_clock::now();
    AttemptOutcome outcome;
    try {
      outcome.status = task->sink->Deliver(task->ref, task->staged_file, started + task->timeout);
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("Transfer attempt raised", {StringField("payload", task->ref.Key()), StringField("destination", task->sink->Name()),
                                                  StringField("error", e.what())});
      outcome.status = util::Status::Err(util::ErrorCode::kTransportFailure, e.what());
    }
    outcome.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

    task->completions->Push(CompletedAttempt{std::move(task->ref), task->destination, std::move(outcome)});
  }
}

} // namespace relay::transfer
