#include "linkwatch/diag/error_log.hpp"

#include <algorithm>

namespace linkwatch::diag {

std::string error_log_message(const CheckResult &result) {
  if (result.error.has_value() && !result.error->empty()) {
    return result.headline + ": " + *result.error;
  }
  return result.headline;
}

ErrorLog::ErrorLog(const std::size_t recent_limit)
    : recent_limit_(recent_limit == 0 ? 1 : recent_limit) {}

void ErrorLog::apply(const DiagnosticPass &pass) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t position = 0; position < pass.results.size(); ++position) {
    const auto &result = pass.results[position];
    if (result.status == Status::Ok) {
      slots_.erase(result.check_id);
      continue;
    }

    auto [it, inserted] = slots_.try_emplace(result.check_id);
    Slot &slot = it->second;
    ErrorLogEntry &entry = slot.entry;
    if (inserted) {
      entry.check_id = result.check_id;
      entry.first_seen = result.timestamp;
    }
    entry.display_name = result.display_name;
    entry.status = result.status;
    entry.last_message = error_log_message(result);
    entry.last_seen = result.timestamp;
    ++entry.occurrence_count;
    entry.recent.push_front(result.timestamp);
    while (entry.recent.size() > recent_limit_) {
      entry.recent.pop_back();
    }
    slot.pass_id = pass.pass_id;
    slot.position = position;
  }
}

std::vector<ErrorLogEntry> ErrorLog::entries() const {
  std::vector<const Slot *> ordered;
  std::lock_guard<std::mutex> lock(mutex_);
  ordered.reserve(slots_.size());
  for (const auto &[id, slot] : slots_) {
    ordered.push_back(&slot);
  }
  std::sort(ordered.begin(), ordered.end(), [](const Slot *a, const Slot *b) {
    if (a->entry.last_seen != b->entry.last_seen) {
      return a->entry.last_seen > b->entry.last_seen;
    }
    if (a->pass_id != b->pass_id) {
      return a->pass_id > b->pass_id;
    }
    return a->position < b->position;
  });

  std::vector<ErrorLogEntry> out;
  out.reserve(ordered.size());
  for (const Slot *slot : ordered) {
    out.push_back(slot->entry);
  }
  return out;
}

std::optional<ErrorLogEntry> ErrorLog::find(const CheckId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = slots_.find(id);
  if (it == slots_.end()) {
    return std::nullopt;
  }
  return it->second.entry;
}

std::size_t ErrorLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.size();
}

bool ErrorLog::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.empty();
}

void ErrorLog::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  slots_.clear();
}

bool ErrorLog::forget(const CheckId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.erase(id) > 0;
}

} // namespace linkwatch::diag
