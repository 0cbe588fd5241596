#pragma once

#include "chatfetch/auth/credentials.hpp"
#include "chatfetch/common/result.hpp"
#include "chatfetch/http/client.hpp"

#include <cstdint>
#include <string>

namespace chatfetch::stream {

enum class ResolveErrorCode {
  NotFound,
  NotLive,
  Transport,
  Auth,
};

struct ResolveError {
  ResolveErrorCode code = ResolveErrorCode::Transport;
  std::uint16_t status = 0;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

using ResolveResult = common::Result<std::string, ResolveError>;

/// Maps a public video id to the live chat id the stream endpoint expects.
class VideoResolver {
public:
  virtual ~VideoResolver() = default;

  [[nodiscard]] virtual ResolveResult resolve(const std::string &video_id,
                                              const auth::Credential &credential) = 0;
};

/// videos.list with part=liveStreamingDetails; one request, no retry.
class RestVideoResolver final : public VideoResolver {
public:
  RestVideoResolver(http::HttpClient &http, std::string rest_api_address,
                    std::uint64_t timeout_ms = 30000);

  [[nodiscard]] ResolveResult resolve(const std::string &video_id,
                                      const auth::Credential &credential) override;

private:
  http::HttpClient &http_;
  std::string rest_api_address_;
  std::uint64_t timeout_ms_;
};

} // namespace chatfetch::stream
