#pragma once

#include "linkwatch/diag/types.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace linkwatch::diag {

/// Shared cancellation flag. Copies observe the same state.
class CancellationToken {
public:
  CancellationToken();

  void cancel() const;
  [[nodiscard]] bool is_cancelled() const;
  /// Sleeps up to `duration`; returns true as soon as the token is cancelled.
  [[nodiscard]] bool wait_for(std::chrono::milliseconds duration) const;

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
  };

  std::shared_ptr<State> state_;
};

/// One unit of diagnostic work. Implementations map their own failures into the
/// returned result and must return within `timeout`; they never throw on
/// timeouts or unavailable collaborators.
class Probe {
public:
  virtual ~Probe() = default;

  [[nodiscard]] virtual CheckResult execute(std::chrono::milliseconds timeout,
                                            const CancellationToken &cancel) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] CheckResult make_result(Status status, std::string headline, DetailMap detail = {});
[[nodiscard]] CheckResult make_unavailable_result(std::string error);
[[nodiscard]] CheckResult make_timeout_result(Status status);

} // namespace linkwatch::diag
