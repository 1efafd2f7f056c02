#pragma once

#include "linkwatch/diag/types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace linkwatch::diag {

/// Live view of currently failing checks, one entry per check id.
///
/// A non-OK result opens or continues the entry for its check; an OK result
/// closes it. Checks that are absent from a pass (disabled) keep their entry
/// unchanged until they report again.
class ErrorLog {
public:
  static constexpr std::size_t DEFAULT_RECENT_LIMIT = 5;

  explicit ErrorLog(std::size_t recent_limit = DEFAULT_RECENT_LIMIT);

  void apply(const DiagnosticPass &pass);

  /// Most recently seen first; ties keep the order of the pass that touched them.
  [[nodiscard]] std::vector<ErrorLogEntry> entries() const;
  [[nodiscard]] std::optional<ErrorLogEntry> find(const CheckId &id) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool empty() const;
  void clear();
  bool forget(const CheckId &id);

private:
  struct Slot {
    ErrorLogEntry entry;
    std::uint64_t pass_id = 0;
    std::size_t position = 0;
  };

  std::size_t recent_limit_;
  mutable std::mutex mutex_;
  std::map<CheckId, Slot> slots_;
};

[[nodiscard]] std::string error_log_message(const CheckResult &result);

} // namespace linkwatch::diag
