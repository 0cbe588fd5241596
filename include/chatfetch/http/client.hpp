#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace chatfetch::http {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HeaderMap headers;
  bool timeout = false;
  bool aborted = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool success() const {
    return !network_error && status >= 200 && status < 300;
  }
};

struct StreamRequestOptions {
  std::uint64_t connect_timeout_ms = 10000;
  /// Abort when no byte arrives for this long. Zero disables the check.
  std::uint64_t idle_timeout_ms = 0;
};

struct StreamCallbacks {
  /// Final (non-1xx) status, once its header block is complete.
  std::function<void(std::uint16_t)> on_status;
  std::function<void(std::string_view)> on_chunk;
  /// Polled by the transfer; returning true aborts it.
  std::function<bool()> should_abort;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HeaderMap &headers,
                                         std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_form(const std::string &url, const HeaderMap &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  /// Runs a long-lived GET, handing the body to callbacks as it arrives. The returned
  /// response carries status and transfer errors only; the body is not accumulated.
  [[nodiscard]] virtual HttpResponse get_stream(const std::string &url, const HeaderMap &headers,
                                                const StreamRequestOptions &options,
                                                const StreamCallbacks &callbacks) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse get(const std::string &url, const HeaderMap &headers,
                                 std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_form(const std::string &url, const HeaderMap &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse get_stream(const std::string &url, const HeaderMap &headers,
                                        const StreamRequestOptions &options,
                                        const StreamCallbacks &callbacks) override;
};

/// Percent-encode everything outside the RFC 3986 unreserved set.
[[nodiscard]] std::string url_encode_component(const std::string &value);

} // namespace chatfetch::http
