#pragma once

#include "linkwatch/diag/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace linkwatch::diag {

/// Latest published pass. One writer (the publish step), any number of readers.
class PassCell {
public:
  void store(std::shared_ptr<const DiagnosticPass> pass);
  [[nodiscard]] std::shared_ptr<const DiagnosticPass> load() const;
  [[nodiscard]] std::uint64_t version() const;

  /// Waits until version() exceeds `seen`. Returns false on timeout.
  [[nodiscard]] bool wait_for_version(std::uint64_t seen, std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::shared_ptr<const DiagnosticPass> pass_;
  std::uint64_t version_ = 0;
};

} // namespace linkwatch::diag
