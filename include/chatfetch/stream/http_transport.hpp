#pragma once

#include "chatfetch/http/client.hpp"
#include "chatfetch/stream/cancellation.hpp"
#include "chatfetch/stream/transport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chatfetch::config {
struct StreamConfig;
}

namespace chatfetch::stream {

inline constexpr const char *STREAM_ENDPOINT_PATH = "/youtube/v3/liveChat/messages/stream";

struct HttpTransportOptions {
  std::string server_address;
  std::vector<std::string> parts = {"snippet", "authorDetails"};
  std::uint64_t max_results = 0;
  std::string hl;
  std::uint64_t profile_image_size = 0;
  std::uint64_t connect_timeout_ms = 10000;
  std::uint64_t idle_timeout_ms = 0;

  [[nodiscard]] static HttpTransportOptions from_config(const config::StreamConfig &config);
};

/// Request URL for a cursor. pageToken is left out entirely on a fresh start.
[[nodiscard]] std::string build_stream_url(const HttpTransportOptions &options,
                                           const Cursor &cursor);

/// Server-streamed chat over a long-lived HTTP GET whose body is a sequence of JSON
/// batch objects. Each session runs its transfer on a worker thread.
class HttpTransport final : public Transport {
public:
  HttpTransport(http::HttpClient &http, HttpTransportOptions options, CancellationGate &gate);

  [[nodiscard]] OpenResult open(const Cursor &cursor, const auth::Credential &credential) override;

private:
  http::HttpClient &http_;
  HttpTransportOptions options_;
  CancellationGate &gate_;
};

} // namespace chatfetch::stream
