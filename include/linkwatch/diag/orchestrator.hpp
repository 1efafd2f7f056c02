#pragma once

#include "linkwatch/diag/probe.hpp"
#include "linkwatch/diag/registry.hpp"
#include "linkwatch/diag/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace linkwatch::diag {

struct OrchestratorOptions {
  std::chrono::milliseconds probe_timeout{5000};
  std::chrono::milliseconds run_deadline{15000};
  std::chrono::milliseconds cancel_grace{250};
};

using PublishCallback = std::function<void(const std::shared_ptr<const DiagnosticPass> &)>;

/// Runs one diagnostic pass at a time. Starting a pass cancels the one in flight;
/// the cancelled pass returns nullptr and never reaches the publish callback.
class Orchestrator {
public:
  explicit Orchestrator(OrchestratorOptions options = {});

  void set_options(const OrchestratorOptions &options);
  [[nodiscard]] OrchestratorOptions options() const;
  void set_publish_callback(PublishCallback callback);

  /// Blocks until the pass is sealed or preempted. `checks` is the registry
  /// snapshot taken by the caller; results come back in the same order.
  [[nodiscard]] std::shared_ptr<const DiagnosticPass> run(std::vector<RegisteredCheck> checks);
  /// Same, with a token owned by the caller. A token cancelled before the pass
  /// takes the run slot yields nullptr without running any probe.
  [[nodiscard]] std::shared_ptr<const DiagnosticPass> run(std::vector<RegisteredCheck> checks,
                                                          const CancellationToken &token);

  /// Cancels the in-flight pass, if any, without starting another.
  void cancel_active();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint64_t passes_published() const;

private:
  struct RunState {
    explicit RunState(std::size_t count) : slots(count), remaining(count) {}

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::optional<CheckResult>> slots;
    std::size_t remaining = 0;
    bool cancelled = false;
  };

  void cancel_locked();
  void launch_probe(const std::shared_ptr<RunState> &state, std::size_t index,
                    std::shared_ptr<Probe> probe, std::chrono::milliseconds timeout,
                    const CancellationToken &token);
  [[nodiscard]] bool publish(std::uint64_t generation,
                             const std::shared_ptr<const DiagnosticPass> &pass);
  void release_active(std::uint64_t generation);

  mutable std::mutex state_mutex_;
  OrchestratorOptions options_;
  PublishCallback publish_callback_;
  std::uint64_t generation_ = 0;
  std::uint64_t next_pass_id_ = 0;
  std::optional<CancellationToken> active_token_;
  std::shared_ptr<RunState> active_state_;
  bool running_ = false;

  std::mutex run_mutex_;
  mutable std::mutex publish_mutex_;
  std::uint64_t last_published_id_ = 0;
  std::uint64_t published_count_ = 0;
};

} // namespace linkwatch::diag
