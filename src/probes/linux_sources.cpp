#include "linkwatch/probes/sources.hpp"

#include "linkwatch/common/strings.hpp"

#include <ifaddrs.h>
#include <net/if.h>
#include <sys/statvfs.h>

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>

namespace linkwatch::probes {

namespace {

struct CpuSample {
  std::uint64_t idle = 0;
  std::uint64_t total = 0;
};

common::Result<std::string> read_text(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    return common::Result<std::string>::failure(common::ErrorKind::ProbeUnavailable,
                                                "unable to read " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return common::Result<std::string>::success(buffer.str());
}

common::Result<CpuSample> read_cpu_sample(const std::filesystem::path &proc_root) {
  const auto text = read_text(proc_root / "stat");
  if (!text.ok()) {
    return common::Result<CpuSample>::failure(text.status());
  }

  std::istringstream stream(text.value());
  std::string label;
  stream >> label;
  if (label != "cpu") {
    return common::Result<CpuSample>::failure(common::ErrorKind::ProbeUnavailable,
                                              "unexpected /proc/stat layout");
  }

  CpuSample sample;
  std::uint64_t value = 0;
  // user nice system idle iowait irq softirq steal
  for (int column = 0; column < 8 && stream >> value; ++column) {
    sample.total += value;
    if (column == 3 || column == 4) {
      sample.idle += value;
    }
  }
  return common::Result<CpuSample>::success(sample);
}

common::Result<double> read_ram_pct(const std::filesystem::path &proc_root) {
  const auto text = read_text(proc_root / "meminfo");
  if (!text.ok()) {
    return common::Result<double>::failure(text.status());
  }

  std::uint64_t total_kb = 0;
  std::uint64_t available_kb = 0;
  std::istringstream stream(text.value());
  std::string line;
  while (std::getline(stream, line)) {
    std::istringstream fields(line);
    std::string key;
    std::uint64_t value = 0;
    fields >> key >> value;
    if (key == "MemTotal:") {
      total_kb = value;
    } else if (key == "MemAvailable:") {
      available_kb = value;
    }
  }
  if (total_kb == 0) {
    return common::Result<double>::failure(common::ErrorKind::ProbeUnavailable,
                                           "MemTotal missing from /proc/meminfo");
  }
  const std::uint64_t used_kb = available_kb >= total_kb ? 0 : total_kb - available_kb;
  return common::Result<double>::success(100.0 * static_cast<double>(used_kb) /
                                         static_cast<double>(total_kb));
}

std::string read_disk_state() {
  struct statvfs stats {};
  if (statvfs("/", &stats) != 0 || stats.f_blocks == 0) {
    return "UNKNOWN";
  }
  const double free_ratio = static_cast<double>(stats.f_bavail) / static_cast<double>(stats.f_blocks);
  if (free_ratio < 0.02) {
    return "FULL";
  }
  if (free_ratio < 0.10) {
    return "LOW";
  }
  return "OK";
}

bool is_pid_directory(const std::string &name) {
  return !name.empty() &&
         std::all_of(name.begin(), name.end(), [](const char ch) { return ch >= '0' && ch <= '9'; });
}

std::uint64_t read_rss_bytes(const std::filesystem::path &status_path) {
  std::ifstream file(status_path);
  std::string line;
  while (std::getline(file, line)) {
    if (common::starts_with(line, "VmRSS:")) {
      std::istringstream fields(line.substr(6));
      std::uint64_t kb = 0;
      fields >> kb;
      return kb * 1024;
    }
  }
  return 0;
}

std::optional<std::uint64_t> read_u64_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  std::uint64_t value = 0;
  if (file >> value) {
    return value;
  }
  return std::nullopt;
}

std::string vendor_name(const std::string &vendor_id) {
  const std::string id = common::to_lower(common::trim(vendor_id));
  if (id == "0x10de") {
    return "NVIDIA";
  }
  if (id == "0x1002") {
    return "AMD";
  }
  if (id == "0x8086") {
    return "Intel";
  }
  return id.empty() ? "GPU" : "GPU " + id;
}

bool is_card_entry(const std::string &name) {
  return common::starts_with(name, "card") && name.size() > 4 &&
         is_pid_directory(name.substr(4));
}

} // namespace

ProcMetricSource::ProcMetricSource(std::filesystem::path proc_root,
                                   const std::chrono::milliseconds sample_gap)
    : proc_root_(std::move(proc_root)), sample_gap_(sample_gap) {}

common::Result<SystemMetrics>
ProcMetricSource::read_system_metrics(const diag::CancellationToken &cancel) {
  const auto first = read_cpu_sample(proc_root_);
  if (!first.ok()) {
    return common::Result<SystemMetrics>::failure(first.status());
  }
  if (cancel.wait_for(sample_gap_)) {
    return common::Result<SystemMetrics>::failure(common::ErrorKind::ProbeTimeout, "cancelled");
  }
  const auto second = read_cpu_sample(proc_root_);
  if (!second.ok()) {
    return common::Result<SystemMetrics>::failure(second.status());
  }

  SystemMetrics metrics;
  const auto &a = first.value();
  const auto &b = second.value();
  if (b.total > a.total) {
    const double total_delta = static_cast<double>(b.total - a.total);
    const double idle_delta = b.idle >= a.idle ? static_cast<double>(b.idle - a.idle) : 0.0;
    metrics.cpu_pct = std::clamp(100.0 * (total_delta - idle_delta) / total_delta, 0.0, 100.0);
  }

  const auto ram = read_ram_pct(proc_root_);
  if (!ram.ok()) {
    return common::Result<SystemMetrics>::failure(ram.status());
  }
  metrics.ram_pct = ram.value();
  metrics.disk_state = read_disk_state();
  return common::Result<SystemMetrics>::success(metrics);
}

ProcfsProcessSource::ProcfsProcessSource(std::filesystem::path proc_root)
    : proc_root_(std::move(proc_root)) {}

common::Result<std::vector<ProcessInfo>> ProcfsProcessSource::list_processes() {
  std::error_code ec;
  std::filesystem::directory_iterator it(proc_root_, ec);
  if (ec) {
    return common::Result<std::vector<ProcessInfo>>::failure(
        common::ErrorKind::ProbeUnavailable,
        "unable to enumerate " + proc_root_.string() + ": " + ec.message());
  }

  std::vector<ProcessInfo> processes;
  for (const auto &entry : it) {
    const std::string pid_text = entry.path().filename().string();
    if (!is_pid_directory(pid_text)) {
      continue;
    }
    // Processes can exit between listing and reading; those are skipped.
    std::ifstream comm(entry.path() / "comm");
    std::string name;
    if (!comm || !std::getline(comm, name)) {
      continue;
    }
    ProcessInfo info;
    info.pid = std::stoi(pid_text);
    info.name = common::trim(name);
    info.memory_bytes = read_rss_bytes(entry.path() / "status");
    processes.push_back(std::move(info));
  }
  std::sort(processes.begin(), processes.end(),
            [](const ProcessInfo &a, const ProcessInfo &b) { return a.pid < b.pid; });
  return common::Result<std::vector<ProcessInfo>>::success(std::move(processes));
}

std::vector<ProcessInfo> find_processes(const std::vector<ProcessInfo> &processes,
                                        const std::string &name) {
  const auto normalize = [](std::string value) {
    value = common::to_lower(common::trim(value));
    if (value.size() > 4 && value.ends_with(".exe")) {
      value.resize(value.size() - 4);
    }
    return value;
  };

  const std::string wanted = normalize(name);
  std::vector<ProcessInfo> out;
  for (const auto &process : processes) {
    if (normalize(process.name) == wanted) {
      out.push_back(process);
    }
  }
  return out;
}

common::Result<std::vector<NetworkInterface>> IfaddrsInterfaceSource::list_interfaces() {
  struct ifaddrs *addresses = nullptr;
  if (getifaddrs(&addresses) != 0) {
    return common::Result<std::vector<NetworkInterface>>::failure(
        common::ErrorKind::ProbeUnavailable, "getifaddrs failed");
  }

  std::map<std::string, bool> seen;
  std::vector<std::string> order;
  for (auto *cursor = addresses; cursor != nullptr; cursor = cursor->ifa_next) {
    if (cursor->ifa_name == nullptr) {
      continue;
    }
    const std::string name = cursor->ifa_name;
    const bool up = (cursor->ifa_flags & IFF_UP) != 0;
    auto [it, inserted] = seen.emplace(name, up);
    if (inserted) {
      order.push_back(name);
    } else {
      it->second = it->second || up;
    }
  }
  freeifaddrs(addresses);

  std::vector<NetworkInterface> out;
  out.reserve(order.size());
  for (const auto &name : order) {
    out.push_back({.name = name, .up = seen[name]});
  }
  return common::Result<std::vector<NetworkInterface>>::success(std::move(out));
}

SysfsGpuSource::SysfsGpuSource(std::filesystem::path drm_root) : drm_root_(std::move(drm_root)) {}

common::Result<std::vector<GpuInfo>> SysfsGpuSource::read_gpus() {
  std::vector<GpuInfo> gpus;
  std::error_code ec;
  if (!std::filesystem::exists(drm_root_, ec)) {
    return common::Result<std::vector<GpuInfo>>::success(std::move(gpus));
  }

  std::filesystem::directory_iterator it(drm_root_, ec);
  if (ec) {
    return common::Result<std::vector<GpuInfo>>::failure(
        common::ErrorKind::ProbeUnavailable,
        "unable to enumerate " + drm_root_.string() + ": " + ec.message());
  }

  std::vector<std::filesystem::path> cards;
  for (const auto &entry : it) {
    if (is_card_entry(entry.path().filename().string())) {
      cards.push_back(entry.path());
    }
  }
  std::sort(cards.begin(), cards.end());

  for (const auto &card : cards) {
    const auto device = card / "device";
    GpuInfo info;
    const auto vendor = read_text(device / "vendor");
    info.name = vendor_name(vendor.ok() ? vendor.value() : "");
    if (const auto busy = read_u64_file(device / "gpu_busy_percent"); busy.has_value()) {
      info.usage_pct = static_cast<double>(*busy);
    }
    if (const auto used = read_u64_file(device / "mem_info_vram_used"); used.has_value()) {
      info.memory_used_mb = *used / (1024 * 1024);
    }
    if (const auto total = read_u64_file(device / "mem_info_vram_total"); total.has_value()) {
      info.memory_total_mb = *total / (1024 * 1024);
    }
    gpus.push_back(std::move(info));
  }
  return common::Result<std::vector<GpuInfo>>::success(std::move(gpus));
}

} // namespace linkwatch::probes
