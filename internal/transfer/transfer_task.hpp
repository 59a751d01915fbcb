#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/model/payload.hpp"
#include "internal/transfer/destination_sink.hpp"
#include "internal/util/status.hpp"

namespace relay::transfer {

struct AttemptOutcome {
  util::Status status;
  double       duration_ms = 0.0;
};

// Result of one attempt, tagged with the destination it went to.
struct CompletedAttempt {
  model::PayloadRef ref;
  std::size_t       destination = 0; // index into the configured destinations
  AttemptOutcome    outcome;
};

/*
  Attempts finished by the workers and not yet applied to the records.

  Workers push as they finish; the transfer cycle drains whatever has
  arrived, so no attempt waits on another.
*/
class CompletionQueue {
 public:
  void Push(CompletedAttempt attempt) {
    {
      std::lock_guard lock(mutex_);
      done_.push_back(std::move(attempt));
    }
    cv_.notify_all();
  }

  // Returns at once with everything that has arrived, or waits until
  // something arrives or the deadline passes.
  std::vector<CompletedAttempt> WaitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(mutex_);
    cv_.wait_until(lock, deadline, [&] { return !done_.empty(); });
    std::vector<CompletedAttempt> drained;
    drained.swap(done_);
    return drained;
  }

  std::vector<CompletedAttempt> Drain() {
    std::lock_guard               lock(mutex_);
    std::vector<CompletedAttempt> drained;
    drained.swap(done_);
    return drained;
  }

 private:
  std::mutex                    mutex_;
  std::condition_variable       cv_;
  std::vector<CompletedAttempt> done_;
};

/*
  One delivery attempt of one payload to one destination.

  The timeout starts when a worker picks the task up, not when queued.
*/
struct TransferTask {
  model::PayloadRef     ref;
  std::filesystem::path staged_file;

  DestinationSinkPtr        sink;
  std::size_t               destination = 0;
  std::chrono::milliseconds timeout{0};

  std::shared_ptr<CompletionQueue> completions;
};

} // namespace relay::transfer
