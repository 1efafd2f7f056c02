#pragma once

#include "linkwatch/diag/probe.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace linkwatch::probes {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HttpHeaders headers;
  std::chrono::milliseconds latency{0};
  bool timeout = false;
  bool cancelled = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::chrono::milliseconds timeout,
                                         const diag::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual HttpResponse head(const std::string &url, const HttpHeaders &headers,
                                          std::chrono::milliseconds timeout,
                                          const diag::CancellationToken &cancel) = 0;
};

/// libcurl-backed client. Transfers abort as soon as the token is cancelled.
class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::chrono::milliseconds timeout,
                                 const diag::CancellationToken &cancel) override;
  [[nodiscard]] HttpResponse head(const std::string &url, const HttpHeaders &headers,
                                  std::chrono::milliseconds timeout,
                                  const diag::CancellationToken &cancel) override;
};

} // namespace linkwatch::probes
