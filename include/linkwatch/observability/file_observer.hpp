#pragma once

#include "linkwatch/common/result.hpp"
#include "linkwatch/observability/log_observer.hpp"
#include "linkwatch/observability/observer.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

namespace linkwatch::observability {

/// Appends "<utc time> [LEVEL] message" lines to a history file, one per event
/// or metric. Lines are flushed as written so `watch` history survives a kill.
class FileObserver final : public IObserver {
public:
  /// Creates parent directories and opens `path` for appending.
  [[nodiscard]] static common::Result<std::unique_ptr<FileObserver>>
  open(const std::filesystem::path &path);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "file"; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  FileObserver(std::filesystem::path path, std::ofstream out);

  void write_line(const LogLine &line);

  std::filesystem::path path_;
  std::ofstream out_;
  std::mutex mutex_;
};

} // namespace linkwatch::observability
