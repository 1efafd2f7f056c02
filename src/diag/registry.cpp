#include "linkwatch/diag/registry.hpp"

#include "linkwatch/common/strings.hpp"

#include <algorithm>

namespace linkwatch::diag {

common::Status CheckRegistry::add(CheckDefinition definition, std::shared_ptr<Probe> probe) {
  if (common::trim(definition.id).empty()) {
    return common::Status::error(common::ErrorKind::ConfigurationError, "check id is required");
  }
  if (probe == nullptr) {
    return common::Status::error(common::ErrorKind::ConfigurationError,
                                 "check '" + definition.id + "' has no probe");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const bool duplicate =
      std::any_of(checks_.begin(), checks_.end(), [&definition](const RegisteredCheck &check) {
        return check.definition.id == definition.id;
      });
  if (duplicate) {
    return common::Status::error(common::ErrorKind::ConfigurationError,
                                 "duplicate check id: " + definition.id);
  }
  if (definition.display_name.empty()) {
    definition.display_name = common::to_upper(definition.id);
  }
  checks_.push_back({.definition = std::move(definition), .probe = std::move(probe)});
  return common::Status::success();
}

std::vector<RegisteredCheck> CheckRegistry::list_enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RegisteredCheck> out;
  for (const auto &check : checks_) {
    if (check.definition.enabled) {
      out.push_back(check);
    }
  }
  return out;
}

std::vector<CheckDefinition> CheckRegistry::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CheckDefinition> out;
  out.reserve(checks_.size());
  for (const auto &check : checks_) {
    out.push_back(check.definition);
  }
  return out;
}

std::optional<CheckDefinition> CheckRegistry::find(const CheckId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &check : checks_) {
    if (check.definition.id == id) {
      return check.definition;
    }
  }
  return std::nullopt;
}

std::size_t CheckRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return checks_.size();
}

common::Status CheckRegistry::set_enabled(const CheckId &id, const bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &check : checks_) {
    if (check.definition.id == id) {
      check.definition.enabled = enabled;
      return common::Status::success();
    }
  }
  return common::Status::error(common::ErrorKind::ConfigurationError, "unknown check id: " + id);
}

common::Status CheckRegistry::apply_enabled_set(const std::set<CheckId> &enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &id : enabled) {
    const bool known =
        std::any_of(checks_.begin(), checks_.end(),
                    [&id](const RegisteredCheck &check) { return check.definition.id == id; });
    if (!known) {
      return common::Status::error(common::ErrorKind::ConfigurationError,
                                   "unknown check id: " + id);
    }
  }
  for (auto &check : checks_) {
    check.definition.enabled = enabled.contains(check.definition.id);
  }
  return common::Status::success();
}

std::set<CheckId> CheckRegistry::enabled_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<CheckId> out;
  for (const auto &check : checks_) {
    if (check.definition.enabled) {
      out.insert(check.definition.id);
    }
  }
  return out;
}

common::Status CheckRegistry::replace_probes(std::vector<RegisteredCheck> replacements) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::size_t> targets;
  targets.reserve(replacements.size());
  for (const auto &replacement : replacements) {
    const auto found =
        std::find_if(checks_.begin(), checks_.end(), [&replacement](const RegisteredCheck &check) {
          return check.definition.id == replacement.definition.id;
        });
    if (found == checks_.end()) {
      return common::Status::error(common::ErrorKind::ConfigurationError,
                                   "unknown check id: " + replacement.definition.id);
    }
    if (replacement.probe == nullptr) {
      return common::Status::error(common::ErrorKind::ConfigurationError,
                                   "check '" + replacement.definition.id + "' has no probe");
    }
    targets.push_back(static_cast<std::size_t>(found - checks_.begin()));
  }
  for (std::size_t i = 0; i < replacements.size(); ++i) {
    auto &check = checks_[targets[i]];
    check.probe = std::move(replacements[i].probe);
    if (!replacements[i].definition.display_name.empty()) {
      check.definition.display_name = std::move(replacements[i].definition.display_name);
    }
  }
  return common::Status::success();
}

} // namespace linkwatch::diag
