#include "linkwatch/diag/scheduler.hpp"

#include "linkwatch/observability/global.hpp"

#include <string>

namespace linkwatch::diag {

std::string_view scheduler_state_name(const SchedulerState state) {
  return state == SchedulerState::Running ? "running" : "idle";
}

Scheduler::Scheduler(RunFn run, CancelFn cancel, const config::RefreshInterval interval)
    : run_(std::move(run)), cancel_(std::move(cancel)), interval_(interval) {}

Scheduler::~Scheduler() { stop(); }

void Scheduler::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  stop_requested_ = false;
  thread_ = std::thread([this]() { run_loop(); });
}

void Scheduler::stop() {
  bool cancel_active = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    stop_requested_ = true;
    pending_ = false;
    cancel_active = state_ == SchedulerState::Running;
    if (pass_token_.has_value()) {
      pass_token_->cancel();
    }
  }
  if (cancel_active && cancel_) {
    cancel_();
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

bool Scheduler::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void Scheduler::run_now() {
  bool cancel_active = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = true;
    cancel_active = state_ == SchedulerState::Running;
    if (pass_token_.has_value()) {
      pass_token_->cancel();
    }
  }
  if (cancel_active && cancel_) {
    cancel_();
  }
  cv_.notify_all();
}

void Scheduler::set_interval(const config::RefreshInterval interval) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (interval_ == interval) {
      return;
    }
    interval_ = interval;
    interval_changed_ = true;
  }
  cv_.notify_all();
}

config::RefreshInterval Scheduler::interval() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return interval_;
}

SchedulerState Scheduler::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::uint64_t Scheduler::passes_started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return passes_started_;
}

void Scheduler::run_loop() {
  using SteadyClock = std::chrono::steady_clock;
  std::unique_lock<std::mutex> lock(mutex_);

  const auto next_due_from = [this](const SteadyClock::time_point from) {
    const auto period = config::refresh_interval_duration(interval_);
    return period.count() == 0 ? SteadyClock::time_point::max() : from + period;
  };

  auto next_due = next_due_from(SteadyClock::now());
  const auto wake = [this]() { return stop_requested_ || pending_ || interval_changed_; };

  while (!stop_requested_) {
    if (!wake()) {
      if (next_due == SteadyClock::time_point::max()) {
        cv_.wait(lock, wake);
      } else {
        cv_.wait_until(lock, next_due, wake);
      }
    }
    if (stop_requested_) {
      break;
    }
    if (interval_changed_) {
      interval_changed_ = false;
      next_due = next_due_from(SteadyClock::now());
    }

    std::string trigger;
    if (pending_) {
      pending_ = false;
      trigger = "manual";
    } else if (SteadyClock::now() >= next_due) {
      trigger = "interval";
    } else {
      continue;
    }

    const CancellationToken token;
    state_ = SchedulerState::Running;
    pass_token_ = token;
    ++passes_started_;
    lock.unlock();
    observability::record_scheduler_tick(trigger);
    if (run_) {
      run_(token);
    }
    lock.lock();
    pass_token_.reset();
    state_ = SchedulerState::Idle;
    next_due = next_due_from(SteadyClock::now());
  }
  state_ = SchedulerState::Idle;
}

} // namespace linkwatch::diag
