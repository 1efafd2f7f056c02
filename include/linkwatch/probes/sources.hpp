#pragma once

#include "linkwatch/common/result.hpp"
#include "linkwatch/diag/probe.hpp"
#include "linkwatch/probes/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace linkwatch::probes {

struct SystemMetrics {
  double cpu_pct = 0.0;
  double ram_pct = 0.0;
  std::string disk_state = "OK";
};

class MetricSource {
public:
  virtual ~MetricSource() = default;
  [[nodiscard]] virtual common::Result<SystemMetrics>
  read_system_metrics(const diag::CancellationToken &cancel) = 0;
};

/// Samples /proc/stat twice to compute CPU busy time; RAM from /proc/meminfo.
class ProcMetricSource final : public MetricSource {
public:
  explicit ProcMetricSource(std::filesystem::path proc_root = "/proc",
                            std::chrono::milliseconds sample_gap = std::chrono::milliseconds(200));

  [[nodiscard]] common::Result<SystemMetrics>
  read_system_metrics(const diag::CancellationToken &cancel) override;

private:
  std::filesystem::path proc_root_;
  std::chrono::milliseconds sample_gap_;
};

struct PingResult {
  bool reachable = false;
  bool cancelled = false;
  std::chrono::milliseconds latency{0};
  std::string error;
};

class Pinger {
public:
  virtual ~Pinger() = default;
  [[nodiscard]] virtual PingResult ping(const std::string &host, std::chrono::milliseconds timeout,
                                        const diag::CancellationToken &cancel) = 0;
};

/// Reachability through an HTTP HEAD; any HTTP response counts as reachable.
class HttpPinger final : public Pinger {
public:
  explicit HttpPinger(std::shared_ptr<HttpClient> client);

  [[nodiscard]] PingResult ping(const std::string &host, std::chrono::milliseconds timeout,
                                const diag::CancellationToken &cancel) override;

private:
  std::shared_ptr<HttpClient> client_;
};

struct ProcessInfo {
  int pid = 0;
  std::string name;
  std::uint64_t memory_bytes = 0;
};

class ProcessSource {
public:
  virtual ~ProcessSource() = default;
  [[nodiscard]] virtual common::Result<std::vector<ProcessInfo>> list_processes() = 0;
};

/// Walks /proc/<pid>/comm and /proc/<pid>/status (VmRSS).
class ProcfsProcessSource final : public ProcessSource {
public:
  explicit ProcfsProcessSource(std::filesystem::path proc_root = "/proc");

  [[nodiscard]] common::Result<std::vector<ProcessInfo>> list_processes() override;

private:
  std::filesystem::path proc_root_;
};

/// Processes whose name equals `name`, ignoring case and a trailing ".exe".
[[nodiscard]] std::vector<ProcessInfo> find_processes(const std::vector<ProcessInfo> &processes,
                                                      const std::string &name);

struct NetworkInterface {
  std::string name;
  bool up = false;
};

class InterfaceSource {
public:
  virtual ~InterfaceSource() = default;
  [[nodiscard]] virtual common::Result<std::vector<NetworkInterface>> list_interfaces() = 0;
};

class IfaddrsInterfaceSource final : public InterfaceSource {
public:
  [[nodiscard]] common::Result<std::vector<NetworkInterface>> list_interfaces() override;
};

struct GpuInfo {
  std::string name;
  std::optional<double> usage_pct;
  std::optional<std::uint64_t> memory_used_mb;
  std::optional<std::uint64_t> memory_total_mb;
};

class GpuSource {
public:
  virtual ~GpuSource() = default;
  [[nodiscard]] virtual common::Result<std::vector<GpuInfo>> read_gpus() = 0;
};

/// Reads /sys/class/drm/card*/device (gpu_busy_percent, mem_info_vram_*).
class SysfsGpuSource final : public GpuSource {
public:
  explicit SysfsGpuSource(std::filesystem::path drm_root = "/sys/class/drm");

  [[nodiscard]] common::Result<std::vector<GpuInfo>> read_gpus() override;

private:
  std::filesystem::path drm_root_;
};

} // namespace linkwatch::probes
