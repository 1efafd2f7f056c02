#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace linkwatch::diag {

using CheckId = std::string;
using Clock = std::chrono::system_clock;

enum class Category {
  System,
  Network,
  ApiProvider,
  Process,
};

/// Ascending severity. Aggregation takes the maximum.
enum class Status {
  Ok = 0,
  Unknown = 1,
  Warning = 2,
  Critical = 3,
};

[[nodiscard]] std::string_view status_name(Status status);
[[nodiscard]] std::optional<Status> status_from_string(std::string_view text);
[[nodiscard]] std::string_view category_name(Category category);
[[nodiscard]] constexpr Status max_severity(Status a, Status b) {
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

struct CheckDefinition {
  CheckId id;
  Category category = Category::System;
  std::string display_name;
  bool enabled = true;
};

/// Free-form key/value metrics; insertion order is preserved.
class DetailMap {
public:
  using Entry = std::pair<std::string, std::string>;

  DetailMap() = default;
  DetailMap(std::initializer_list<Entry> entries);

  void set(const std::string &key, std::string value);
  [[nodiscard]] std::optional<std::string> get(const std::string &key) const;
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] const std::vector<Entry> &entries() const { return entries_; }

  bool operator==(const DetailMap &) const = default;

private:
  std::vector<Entry> entries_;
};

struct CheckResult {
  CheckId check_id;
  std::string display_name;
  Status status = Status::Unknown;
  std::string headline;
  DetailMap detail;
  Clock::time_point timestamp{};
  std::chrono::milliseconds latency{0};
  std::optional<std::string> error;
};

struct DiagnosticPass {
  std::uint64_t pass_id = 0;
  Clock::time_point started_at{};
  Clock::time_point finished_at{};
  std::vector<CheckResult> results;
  Status overall_status = Status::Unknown;

  [[nodiscard]] const CheckResult *find(const CheckId &id) const;
};

/// max(results.status); Unknown for an empty pass.
[[nodiscard]] Status aggregate_status(const std::vector<CheckResult> &results);

struct ErrorLogEntry {
  CheckId check_id;
  std::string display_name;
  Status status = Status::Unknown;
  std::string last_message;
  Clock::time_point first_seen{};
  Clock::time_point last_seen{};
  std::uint64_t occurrence_count = 0;
  std::deque<Clock::time_point> recent;
};

} // namespace linkwatch::diag
