#pragma once

#include "linkwatch/config/schema.hpp"
#include "linkwatch/diag/probe.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

namespace linkwatch::diag {

enum class SchedulerState {
  Idle,
  Running,
};

[[nodiscard]] std::string_view scheduler_state_name(SchedulerState state);

/// Triggers diagnostic passes on a fixed interval and on demand. One loop
/// thread runs every scheduled pass, so at most one is in flight.
class Scheduler {
public:
  using RunFn = std::function<void(const CancellationToken &)>;
  using CancelFn = std::function<void()>;

  /// `run` executes one blocking pass and must stop once its token is cancelled;
  /// `cancel` aborts whatever the pass has already started.
  Scheduler(RunFn run, CancelFn cancel,
            config::RefreshInterval interval = config::RefreshInterval::Off);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  /// Starts a pass now. A pass already running is cancelled and replaced;
  /// repeated requests collapse into one.
  void run_now();
  void set_interval(config::RefreshInterval interval);
  [[nodiscard]] config::RefreshInterval interval() const;
  [[nodiscard]] SchedulerState state() const;
  [[nodiscard]] std::uint64_t passes_started() const;

private:
  void run_loop();

  RunFn run_;
  CancelFn cancel_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  config::RefreshInterval interval_;
  SchedulerState state_ = SchedulerState::Idle;
  bool pending_ = false;
  bool interval_changed_ = false;
  bool stop_requested_ = false;
  bool running_ = false;
  std::uint64_t passes_started_ = 0;
  // Created together with the Running state, so a cancel never misses a pass.
  std::optional<CancellationToken> pass_token_;
  std::thread thread_;
};

} // namespace linkwatch::diag
