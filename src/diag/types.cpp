#include "linkwatch/diag/types.hpp"

#include "linkwatch/common/strings.hpp"

#include <algorithm>

namespace linkwatch::diag {

std::string_view status_name(const Status status) {
  switch (status) {
  case Status::Ok:
    return "OK";
  case Status::Unknown:
    return "UNKNOWN";
  case Status::Warning:
    return "WARNING";
  case Status::Critical:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

std::optional<Status> status_from_string(std::string_view text) {
  const std::string normalized = common::to_upper(common::trim(std::string(text)));
  if (normalized == "OK") {
    return Status::Ok;
  }
  if (normalized == "UNKNOWN") {
    return Status::Unknown;
  }
  if (normalized == "WARNING" || normalized == "WARN") {
    return Status::Warning;
  }
  if (normalized == "CRITICAL" || normalized == "ERROR") {
    return Status::Critical;
  }
  return std::nullopt;
}

std::string_view category_name(const Category category) {
  switch (category) {
  case Category::System:
    return "system";
  case Category::Network:
    return "network";
  case Category::ApiProvider:
    return "api";
  case Category::Process:
    return "process";
  }
  return "system";
}

DetailMap::DetailMap(std::initializer_list<Entry> entries) {
  for (const auto &[key, value] : entries) {
    set(key, value);
  }
}

void DetailMap::set(const std::string &key, std::string value) {
  const auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&key](const Entry &entry) { return entry.first == key; });
  if (it != entries_.end()) {
    it->second = std::move(value);
    return;
  }
  entries_.emplace_back(key, std::move(value));
}

std::optional<std::string> DetailMap::get(const std::string &key) const {
  const auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&key](const Entry &entry) { return entry.first == key; });
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const CheckResult *DiagnosticPass::find(const CheckId &id) const {
  const auto it = std::find_if(results.begin(), results.end(),
                               [&id](const CheckResult &result) { return result.check_id == id; });
  return it == results.end() ? nullptr : &*it;
}

Status aggregate_status(const std::vector<CheckResult> &results) {
  if (results.empty()) {
    return Status::Unknown;
  }
  Status overall = Status::Ok;
  for (const auto &result : results) {
    overall = max_severity(overall, result.status);
  }
  return overall;
}

} // namespace linkwatch::diag
