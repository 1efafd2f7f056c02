#include "linkwatch/diag/probe.hpp"

namespace linkwatch::diag {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() const {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::wait_for(const std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->cv.wait_for(lock, duration, [this]() { return state_->cancelled; });
}

CheckResult make_result(const Status status, std::string headline, DetailMap detail) {
  CheckResult result;
  result.status = status;
  result.headline = std::move(headline);
  result.detail = std::move(detail);
  result.timestamp = Clock::now();
  return result;
}

CheckResult make_unavailable_result(std::string error) {
  CheckResult result = make_result(Status::Unknown, "UNAVAILABLE");
  result.error = std::move(error);
  return result;
}

CheckResult make_timeout_result(const Status status) {
  CheckResult result = make_result(status, status == Status::Critical ? "DOWN" : "TIMEOUT");
  result.error = "timed out";
  return result;
}

} // namespace linkwatch::diag
