#include "linkwatch/probes/probes.hpp"

#include "linkwatch/common/json_util.hpp"
#include "linkwatch/common/strings.hpp"

namespace linkwatch::probes {

namespace {

constexpr std::size_t MESSAGE_EXCERPT_CHARS = 160;

std::string default_reason(const std::uint16_t status) {
  if (status == 429) {
    return "rate limited";
  }
  if (status == 503) {
    return "server at capacity";
  }
  if (status == 529) {
    return "overloaded";
  }
  if (status >= 500 && status < 600) {
    return "server error";
  }
  return "";
}

} // namespace

std::optional<std::string> extract_error_message(const std::string &body) {
  const std::string trimmed = common::trim(body);
  if (trimmed.empty() || trimmed.front() != '{') {
    return std::nullopt;
  }

  const auto error = common::json_field(trimmed, "error");
  if (error.kind == common::JsonKind::Object) {
    const auto message = common::json_field(error.text, "message");
    if (message.kind == common::JsonKind::String && !message.text.empty()) {
      return message.text;
    }
  } else if (error.kind == common::JsonKind::String && !error.text.empty()) {
    return error.text;
  }

  const auto message = common::json_field(trimmed, "message");
  if (message.kind == common::JsonKind::String && !message.text.empty()) {
    return message.text;
  }
  return std::nullopt;
}

std::string host_of(const std::string &url) {
  std::string host = url;
  if (const auto scheme = host.find("://"); scheme != std::string::npos) {
    host = host.substr(scheme + 3);
  }
  if (const auto slash = host.find('/'); slash != std::string::npos) {
    host = host.substr(0, slash);
  }
  return host;
}

diag::CheckResult map_api_response(const HttpResponse &response, const std::string &host) {
  diag::DetailMap detail{{"HOST", host}};

  if (response.network_error || response.status == 0) {
    auto result = diag::make_result(diag::Status::Critical, "DOWN", std::move(detail));
    result.error = response.timeout                         ? "timed out"
                   : response.network_error_message.empty() ? "no response"
                                                            : response.network_error_message;
    return result;
  }

  const std::uint16_t code = response.status;
  detail.set("STATUS", std::to_string(code));
  detail.set("LATENCY", std::to_string(response.latency.count()) + "ms");

  diag::Status status = diag::Status::Unknown;
  std::string headline = "HTTP " + std::to_string(code);
  if (code >= 200 && code < 300) {
    status = diag::Status::Ok;
    headline = "AVAILABLE";
  } else if (code == 429) {
    status = diag::Status::Warning;
    headline = "RATE_LIMITED";
  } else if (code == 503 || code == 529) {
    status = diag::Status::Critical;
    headline = "OVERLOADED";
  } else if (code >= 500 && code < 600) {
    status = diag::Status::Critical;
    headline = "DOWN";
  }

  if (status != diag::Status::Ok) {
    if (auto message = extract_error_message(response.body); message.has_value()) {
      detail.set("MESSAGE", common::truncate(*message, MESSAGE_EXCERPT_CHARS));
    } else if (const std::string excerpt = common::trim(response.body);
               !excerpt.empty() && excerpt.front() != '<') {
      detail.set("MESSAGE", common::truncate(excerpt, MESSAGE_EXCERPT_CHARS));
    } else if (const std::string reason = default_reason(code); !reason.empty()) {
      detail.set("MESSAGE", reason);
    }
  }

  return diag::make_result(status, std::move(headline), std::move(detail));
}

ApiProbe::ApiProbe(std::string probe_name, std::shared_ptr<HttpClient> client,
                   ApiEndpoint endpoint)
    : probe_name_(std::move(probe_name)), client_(std::move(client)),
      endpoint_(std::move(endpoint)) {}

diag::CheckResult ApiProbe::execute(const std::chrono::milliseconds timeout,
                                    const diag::CancellationToken &cancel) {
  const HttpResponse response =
      endpoint_.use_head ? client_->head(endpoint_.url, endpoint_.headers, timeout, cancel)
                         : client_->get(endpoint_.url, endpoint_.headers, timeout, cancel);
  auto result = map_api_response(response, host_of(endpoint_.url));
  result.latency = response.latency;
  return result;
}

} // namespace linkwatch::probes
