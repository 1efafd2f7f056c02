#include "linkwatch/probes/http_client.hpp"

#include "linkwatch/common/strings.hpp"

#include <curl/curl.h>

#include <algorithm>

namespace linkwatch::probes {

namespace {

constexpr const char *USER_AGENT = "linkwatch/0.1";
// Response bodies are only mined for an error message.
constexpr std::size_t MAX_BODY_BYTES = 64 * 1024;

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  if (output->size() < MAX_BODY_BYTES) {
    output->append(ptr, std::min(total, MAX_BODY_BYTES - output->size()));
  }
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto *cancel = static_cast<const diag::CancellationToken *>(clientp);
  return cancel->is_cancelled() ? 1 : 0;
}

HttpResponse execute_request(const std::string &url, const HttpHeaders &headers,
                             const bool use_head, const std::chrono::milliseconds timeout,
                             const diag::CancellationToken &cancel) {
  HttpResponse response;
  if (cancel.is_cancelled()) {
    response.cancelled = true;
    response.network_error = true;
    response.network_error_message = "cancelled";
    return response;
  }

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel);
  if (use_head) {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const auto started = std::chrono::steady_clock::now();
  const CURLcode code = curl_easy_perform(curl);
  response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.cancelled = code == CURLE_ABORTED_BY_CALLBACK;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string &url, const HttpHeaders &headers,
                                 const std::chrono::milliseconds timeout,
                                 const diag::CancellationToken &cancel) {
  return execute_request(url, headers, false, timeout, cancel);
}

HttpResponse CurlHttpClient::head(const std::string &url, const HttpHeaders &headers,
                                  const std::chrono::milliseconds timeout,
                                  const diag::CancellationToken &cancel) {
  return execute_request(url, headers, true, timeout, cancel);
}

} // namespace linkwatch::probes
