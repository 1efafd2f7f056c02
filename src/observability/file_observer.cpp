#include "linkwatch/observability/file_observer.hpp"

#include "linkwatch/common/strings.hpp"

#include <chrono>

namespace linkwatch::observability {

common::Result<std::unique_ptr<FileObserver>>
FileObserver::open(const std::filesystem::path &path) {
  using OpenResult = common::Result<std::unique_ptr<FileObserver>>;
  if (path.empty()) {
    return OpenResult::failure(common::ErrorKind::ConfigurationError,
                               "observability.file_path is empty");
  }
  if (path.has_parent_path()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return OpenResult::failure(dir.status());
    }
  }

  std::ofstream out(path, std::ios::app);
  if (!out) {
    return OpenResult::failure(common::ErrorKind::IoError,
                               "failed to open history file: " + path.string());
  }
  return OpenResult::success(
      std::unique_ptr<FileObserver>(new FileObserver(path, std::move(out))));
}

FileObserver::FileObserver(std::filesystem::path path, std::ofstream out)
    : path_(std::move(path)), out_(std::move(out)) {}

void FileObserver::write_line(const LogLine &line) {
  const std::string stamp = common::format_utc(std::chrono::system_clock::now());
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << stamp << " [" << line.level << "] " << line.message << "\n";
  out_.flush();
}

void FileObserver::record_event(const ObserverEvent &event) { write_line(format_event(event)); }

void FileObserver::record_metric(const ObserverMetric &metric) {
  write_line(format_metric(metric));
}

void FileObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace linkwatch::observability
