#include "linkwatch/probes/sources.hpp"

#include "linkwatch/common/strings.hpp"

namespace linkwatch::probes {

HttpPinger::HttpPinger(std::shared_ptr<HttpClient> client) : client_(std::move(client)) {}

PingResult HttpPinger::ping(const std::string &host, const std::chrono::milliseconds timeout,
                            const diag::CancellationToken &cancel) {
  PingResult result;
  const std::string url = common::starts_with(host, "http://") || common::starts_with(host, "https://")
                              ? host
                              : "https://" + host;
  const auto response = client_->head(url, {}, timeout, cancel);
  result.latency = response.latency;
  result.cancelled = response.cancelled;
  result.reachable = !response.network_error && response.status != 0;
  if (!result.reachable) {
    result.error = response.network_error_message.empty() ? "no response"
                                                          : response.network_error_message;
  }
  return result;
}

} // namespace linkwatch::probes
