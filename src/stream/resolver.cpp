#include "chatfetch/stream/resolver.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/common/json_util.hpp"

#include <sstream>

namespace chatfetch::stream {

namespace {

ResolveResult fail(const ResolveErrorCode code, std::string message,
                   const std::uint16_t status = 0) {
  return ResolveResult::failure(ResolveError{code, status, std::move(message)});
}

} // namespace

std::string ResolveError::to_string() const {
  std::ostringstream stream;
  stream << "Resolve error [";
  switch (code) {
  case ResolveErrorCode::NotFound:
    stream << "not_found";
    break;
  case ResolveErrorCode::NotLive:
    stream << "not_live";
    break;
  case ResolveErrorCode::Transport:
    stream << "transport";
    break;
  case ResolveErrorCode::Auth:
    stream << "auth";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

RestVideoResolver::RestVideoResolver(http::HttpClient &http, std::string rest_api_address,
                                     const std::uint64_t timeout_ms)
    : http_(http), rest_api_address_(std::move(rest_api_address)), timeout_ms_(timeout_ms) {
  while (!rest_api_address_.empty() && rest_api_address_.back() == '/') {
    rest_api_address_.pop_back();
  }
}

ResolveResult RestVideoResolver::resolve(const std::string &video_id,
                                         const auth::Credential &credential) {
  std::string url = rest_api_address_ + "/youtube/v3/videos?part=liveStreamingDetails&id=" +
                    http::url_encode_component(video_id);
  http::HeaderMap headers = {{"Accept", "application/json"}};
  if (credential.kind == auth::CredentialKind::ApiKey) {
    url += "&key=" + http::url_encode_component(credential.value);
  } else {
    auth::apply_credential(credential, headers);
  }

  const auto response = http_.get(url, headers, timeout_ms_);
  if (response.network_error) {
    return fail(ResolveErrorCode::Transport,
                "failed to fetch video data: " + response.network_error_message);
  }
  if (response.status == 401 || response.status == 403) {
    return fail(ResolveErrorCode::Auth, "video lookup was not authorized: " + response.body,
                response.status);
  }
  if (response.status < 200 || response.status >= 300) {
    return fail(ResolveErrorCode::Transport, "failed to fetch video data: " + response.body,
                response.status);
  }

  const auto top = common::json_parse_flat(response.body);
  const auto items_it = top.find("items");
  if (items_it == top.end()) {
    return fail(ResolveErrorCode::Transport, "response missing 'items' field", response.status);
  }
  const std::string items_raw = common::trim(items_it->second);
  if (items_raw.empty() || items_raw.front() != '[') {
    return fail(ResolveErrorCode::Transport, "'items' field is not an array", response.status);
  }
  const auto items = common::json_split_top_level_objects(items_raw);
  if (items.empty()) {
    return fail(ResolveErrorCode::NotFound, "no video found with id " + video_id);
  }

  const auto video = common::json_parse_flat(items.front());
  const auto details_it = video.find("liveStreamingDetails");
  if (details_it == video.end() || details_it->second == "null") {
    return fail(ResolveErrorCode::NotLive, "video " + video_id + " is not a live broadcast");
  }
  const auto details = common::json_parse_flat(details_it->second);
  const auto chat_it = details.find("activeLiveChatId");
  if (chat_it == details.end() || chat_it->second.empty() || chat_it->second == "null") {
    return fail(ResolveErrorCode::NotLive,
                "no active live chat for video " + video_id + " (stream may have ended)");
  }
  return ResolveResult::success(chat_it->second);
}

} // namespace chatfetch::stream
