#include "linkwatch/diag/orchestrator.hpp"

#include "linkwatch/observability/global.hpp"

#include <system_error>
#include <thread>

namespace linkwatch::diag {

namespace {

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

Orchestrator::Orchestrator(OrchestratorOptions options) : options_(options) {}

void Orchestrator::set_options(const OrchestratorOptions &options) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  options_ = options;
}

OrchestratorOptions Orchestrator::options() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return options_;
}

void Orchestrator::set_publish_callback(PublishCallback callback) {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  publish_callback_ = std::move(callback);
}

void Orchestrator::cancel_active() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  cancel_locked();
}

void Orchestrator::cancel_locked() {
  if (active_token_.has_value()) {
    active_token_->cancel();
  }
  if (active_state_ != nullptr) {
    {
      std::lock_guard<std::mutex> lock(active_state_->mutex);
      active_state_->cancelled = true;
    }
    active_state_->cv.notify_all();
  }
}

bool Orchestrator::is_running() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return running_;
}

std::uint64_t Orchestrator::passes_published() const {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  return published_count_;
}

void Orchestrator::release_active(const std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (generation_ == generation) {
    active_token_.reset();
    active_state_.reset();
  }
  running_ = false;
}

void Orchestrator::launch_probe(const std::shared_ptr<RunState> &state, const std::size_t index,
                                std::shared_ptr<Probe> probe,
                                const std::chrono::milliseconds timeout,
                                const CancellationToken &token) {
  auto worker = [state, index, probe = std::move(probe), timeout, token]() {
    const auto started = std::chrono::steady_clock::now();
    CheckResult result;
    try {
      result = probe->execute(timeout, token);
    } catch (const std::exception &e) {
      result = make_unavailable_result(std::string("probe failed: ") + e.what());
    } catch (...) {
      result = make_unavailable_result("probe failed with an unknown exception");
    }
    if (result.latency.count() == 0) {
      result.latency = elapsed_since(started);
    }

    {
      std::lock_guard<std::mutex> lock(state->mutex);
      // A slot already filled here was sealed by the deadline.
      if (!state->slots[index].has_value()) {
        state->slots[index] = std::move(result);
        --state->remaining;
      }
    }
    state->cv.notify_all();
  };

  try {
    std::thread(std::move(worker)).detach();
  } catch (const std::system_error &e) {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->slots[index] = make_unavailable_result(std::string("unable to start probe: ") + e.what());
    --state->remaining;
  }
}

std::shared_ptr<const DiagnosticPass> Orchestrator::run(std::vector<RegisteredCheck> checks) {
  return run(std::move(checks), CancellationToken());
}

std::shared_ptr<const DiagnosticPass> Orchestrator::run(std::vector<RegisteredCheck> checks,
                                                        const CancellationToken &token) {
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    generation = ++generation_;
    cancel_locked();
    active_token_ = token;
    active_state_.reset();
  }

  std::unique_lock<std::mutex> slot(run_mutex_);

  OrchestratorOptions options;
  std::uint64_t pass_id = 0;
  auto state = std::make_shared<RunState>(checks.size());
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (generation_ != generation || token.is_cancelled()) {
      if (generation_ == generation) {
        active_token_.reset();
      }
      return nullptr;
    }
    options = options_;
    pass_id = ++next_pass_id_;
    active_state_ = state;
    running_ = true;
  }

  observability::record_pass_start(pass_id, checks.size());
  const auto started_steady = std::chrono::steady_clock::now();
  const auto started_at = Clock::now();
  const auto deadline = started_steady + options.run_deadline;

  for (std::size_t i = 0; i < checks.size(); ++i) {
    launch_probe(state, i, checks[i].probe, options.probe_timeout, token);
  }

  std::vector<CheckResult> results;
  results.reserve(checks.size());
  bool preempted = false;
  {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait_until(lock, deadline, [&state, &token]() {
      return state->remaining == 0 || state->cancelled || token.is_cancelled();
    });

    if (state->cancelled || token.is_cancelled()) {
      preempted = true;
      state->cv.wait_for(lock, options.cancel_grace, [&state]() { return state->remaining == 0; });
    } else {
      for (auto &entry : state->slots) {
        if (!entry.has_value()) {
          CheckResult timed_out = make_timeout_result(Status::Unknown);
          timed_out.latency = elapsed_since(started_steady);
          entry = std::move(timed_out);
        }
        results.push_back(*entry);
      }
    }
  }

  if (preempted) {
    release_active(generation);
    observability::record_pass_preempted(pass_id);
    return nullptr;
  }
  // Stragglers past the deadline stop at their next cancellation point.
  token.cancel();

  auto pass = std::make_shared<DiagnosticPass>();
  pass->pass_id = pass_id;
  pass->started_at = started_at;
  for (std::size_t i = 0; i < results.size(); ++i) {
    results[i].check_id = checks[i].definition.id;
    results[i].display_name = checks[i].definition.display_name;
    if (results[i].timestamp == Clock::time_point{}) {
      results[i].timestamp = Clock::now();
    }
  }
  pass->results = std::move(results);
  pass->overall_status = aggregate_status(pass->results);
  pass->finished_at = Clock::now();

  std::shared_ptr<const DiagnosticPass> sealed = pass;
  const bool published = publish(generation, sealed);
  release_active(generation);
  if (!published) {
    observability::record_pass_preempted(pass_id);
    return nullptr;
  }

  for (const auto &result : sealed->results) {
    observability::record_probe_result(result.check_id, std::string(status_name(result.status)),
                                       result.headline, result.latency);
  }
  observability::record_pass_end(pass_id, std::string(status_name(sealed->overall_status)),
                                 elapsed_since(started_steady));
  return sealed;
}

bool Orchestrator::publish(const std::uint64_t generation,
                           const std::shared_ptr<const DiagnosticPass> &pass) {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    if (generation_ != generation) {
      return false;
    }
  }
  if (pass->pass_id <= last_published_id_) {
    observability::record_error("orchestrator", "rejected duplicate publication of pass " +
                                                    std::to_string(pass->pass_id));
    return false;
  }
  last_published_id_ = pass->pass_id;
  ++published_count_;
  if (publish_callback_) {
    publish_callback_(pass);
  }
  return true;
}

} // namespace linkwatch::diag
