#pragma once

#include "linkwatch/common/result.hpp"
#include "linkwatch/diag/probe.hpp"
#include "linkwatch/diag/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace linkwatch::diag {

struct RegisteredCheck {
  CheckDefinition definition;
  std::shared_ptr<Probe> probe;
};

/// Known checks in registration order. All accessors copy under the lock, so a
/// snapshot taken at pass start is unaffected by later toggles.
class CheckRegistry {
public:
  [[nodiscard]] common::Status add(CheckDefinition definition, std::shared_ptr<Probe> probe);

  [[nodiscard]] std::vector<RegisteredCheck> list_enabled() const;
  [[nodiscard]] std::vector<CheckDefinition> list_all() const;
  [[nodiscard]] std::optional<CheckDefinition> find(const CheckId &id) const;
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] common::Status set_enabled(const CheckId &id, bool enabled);
  /// Enables exactly the given ids. Rejected as a whole if any id is unknown.
  [[nodiscard]] common::Status apply_enabled_set(const std::set<CheckId> &enabled);
  [[nodiscard]] std::set<CheckId> enabled_ids() const;
  /// Swaps in new probes and display names for registered ids. Enabled flags
  /// and order are kept. Rejected as a whole if any id is unknown.
  [[nodiscard]] common::Status replace_probes(std::vector<RegisteredCheck> replacements);

private:
  mutable std::mutex mutex_;
  std::vector<RegisteredCheck> checks_;
};

} // namespace linkwatch::diag
