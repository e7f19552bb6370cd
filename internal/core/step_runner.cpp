#include "step_runner.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"

namespace saga::core {

StepRunner::StepRunner(std::chrono::milliseconds shutdown_grace) : shutdown_grace_(shutdown_grace) {
}

StepRunner::~StepRunner() {
  Shutdown();
}

StepRunner::Outcome StepRunner::Run(Work work, std::chrono::milliseconds timeout) {
  auto invocation = std::make_shared<Invocation>();

  std::list<std::shared_ptr<Invocation>>::iterator slot;
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      invocation->outcome.kind  = OutcomeKind::kCancelled;
      invocation->outcome.error = "orchestrator is shutting down";
      return invocation->outcome;
    }
    slot = active_.insert(active_.end(), invocation);
  }

  std::jthread worker([invocation, work = std::move(work)](std::stop_token stop) {
    Outcome outcome;
    try {
      outcome.value = work(stop);
      outcome.kind  = OutcomeKind::kCompleted;
    } catch (const std::exception& e) {
      outcome.kind  = OutcomeKind::kFailed;
      outcome.error = e.what();
    } catch (...) {
      // non-standard exceptions are still step failures
      outcome.kind  = OutcomeKind::kFailed;
      outcome.error = "unknown error";
    }

    std::lock_guard lock(invocation->mutex);
    invocation->outcome = std::move(outcome);
    invocation->done    = true;
    invocation->cv.notify_all();
  });

  {
    std::lock_guard lock(invocation->mutex);
    invocation->stop = worker.get_stop_source();
  }

  bool finished = false;
  bool cancelled = false;
  {
    std::unique_lock lock(invocation->mutex);
    finished  = invocation->cv.wait_for(lock, timeout, [&] { return invocation->done || invocation->cancelled; }) && invocation->done;
    cancelled = invocation->cancelled;
  }

  Outcome result;
  if (finished) {
    worker.join();
    std::lock_guard lock(invocation->mutex);
    result = invocation->outcome;
  } else {
    worker.request_stop();
    result.kind  = cancelled ? OutcomeKind::kCancelled : OutcomeKind::kTimedOut;
    result.error = cancelled ? "orchestrator is shutting down" : "deadline exceeded";
  }

  {
    std::lock_guard lock(mutex_);
    active_.erase(slot);
    if (!finished) {
      abandoned_.push_back({invocation, std::move(worker)});
    }
    ReapLocked();
    idle_cv_.notify_all();
  }

  return result;
}

void StepRunner::ReapLocked() {
  auto finished = std::partition(abandoned_.begin(), abandoned_.end(), [](Abandoned& entry) {
    std::lock_guard lock(entry.invocation->mutex);
    return !entry.invocation->done;
  });

  for (auto it = finished; it != abandoned_.end(); ++it) {
    it->thread.join();
  }
  abandoned_.erase(finished, abandoned_.end());
}

std::size_t StepRunner::Shutdown() {
  std::vector<Abandoned> to_join;
  {
    std::unique_lock lock(mutex_);
    shutting_down_ = true;

    for (auto& invocation : active_) {
      std::lock_guard inv_lock(invocation->mutex);
      invocation->cancelled = true;
      invocation->stop.request_stop();
      invocation->cv.notify_all();
    }

    // callers blocked in Run() move their workers to abandoned_ on wake-up
    idle_cv_.wait(lock, [this] { return active_.empty(); });
    to_join.swap(abandoned_);
  }

  const auto  deadline = std::chrono::steady_clock::now() + shutdown_grace_;
  std::size_t detached = 0;

  for (auto& entry : to_join) {
    bool done = false;
    {
      std::unique_lock lock(entry.invocation->mutex);
      done = entry.invocation->cv.wait_until(lock, deadline, [&] { return entry.invocation->done; });
    }

    if (done) {
      entry.thread.join();
    } else {
      entry.thread.detach();
      ++detached;
    }
  }

  if (detached > 0) {
    SAGA_LOG_WARN("Detached step threads that ignored cancellation",
                  {observability::IntField("detached", static_cast<std::int64_t>(detached)),
                   observability::IntField("grace_ms", shutdown_grace_.count())});
  }
  return detached;
}

std::size_t StepRunner::AbandonedCount() {
  std::lock_guard lock(mutex_);
  ReapLocked();
  return abandoned_.size();
}

} // namespace saga::core
