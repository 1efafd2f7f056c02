#include "linkwatch/diag/pass_cell.hpp"

namespace linkwatch::diag {

void PassCell::store(std::shared_ptr<const DiagnosticPass> pass) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pass_ = std::move(pass);
    ++version_;
  }
  cv_.notify_all();
}

std::shared_ptr<const DiagnosticPass> PassCell::load() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pass_;
}

std::uint64_t PassCell::version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}

bool PassCell::wait_for_version(const std::uint64_t seen,
                                const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this, seen]() { return version_ > seen; });
}

} // namespace linkwatch::diag
