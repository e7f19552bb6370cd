#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace saga::core {

/*
  Runs step invocations under a deadline.

  Each invocation gets its own std::jthread; the caller blocks until the
  invocation finishes, its deadline passes, or the runner shuts down. A
  deadline or shutdown requests stop on the invocation and leaves the
  thread to finish on its own: it is tracked as abandoned and reaped once
  it completes. Shutdown() waits up to the grace period for abandoned
  threads and detaches the ones still running; the work they run owns
  everything it touches.
*/
class StepRunner {
 public:
  using Work = std::function<google::protobuf::Value(std::stop_token)>;

  enum class OutcomeKind {
    kCompleted,
    kFailed,
    kTimedOut,
    kCancelled,
  };

  struct Outcome {
    OutcomeKind             kind = OutcomeKind::kFailed;
    google::protobuf::Value value;
    std::string             error;

    bool Ok() const {
      return kind == OutcomeKind::kCompleted;
    }
  };

  explicit StepRunner(std::chrono::milliseconds shutdown_grace = std::chrono::seconds(10));
  ~StepRunner();

  StepRunner(const StepRunner&)            = delete;
  StepRunner& operator=(const StepRunner&) = delete;

  Outcome Run(Work work, std::chrono::milliseconds timeout);

  // Cancels in-flight invocations, then joins or detaches every thread.
  // Returns the number of detached threads. Idempotent.
  std::size_t Shutdown();

  std::size_t AbandonedCount();

 private:
  struct Invocation {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    done      = false;
    bool                    cancelled = false;
    Outcome                 outcome;
    std::stop_source        stop;
  };

  struct Abandoned {
    std::shared_ptr<Invocation> invocation;
    std::jthread                thread;
  };

  void ReapLocked();

  const std::chrono::milliseconds shutdown_grace_;

  std::mutex                             mutex_;
  std::condition_variable                idle_cv_;
  bool                                   shutting_down_ = false;
  std::list<std::shared_ptr<Invocation>> active_;
  std::vector<Abandoned>                 abandoned_;
};

} // namespace saga::core
