#include "chatfetch/stream/http_transport.hpp"

#include "chatfetch/config/schema.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace chatfetch::stream {

namespace {

constexpr std::size_t MAX_ERROR_BODY_BYTES = 4096;

bool is_success(const std::uint16_t status) { return status >= 200 && status < 300; }

/// State shared between a session and the worker thread running its transfer.
struct StreamChannel {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<SessionEvent> events;
  std::optional<std::uint16_t> status;
  std::string error_body;
  std::string failure;
  bool finished = false;
  bool interrupted = false;
  std::atomic<bool> abort{false};
  BatchFramer framer;

  void push(SessionEvent event) {
    events.push_back(std::move(event));
    cv.notify_all();
  }
};

void handle_chunk(StreamChannel &channel, const std::string_view chunk) {
  std::lock_guard<std::mutex> lock(channel.mutex);
  if (!channel.status.has_value() || !is_success(*channel.status)) {
    const std::size_t room = MAX_ERROR_BODY_BYTES - std::min(MAX_ERROR_BODY_BYTES,
                                                             channel.error_body.size());
    channel.error_body.append(chunk.substr(0, room));
    return;
  }

  for (const auto &object : channel.framer.feed(chunk)) {
    auto batch = parse_batch(object);
    if (!batch.ok()) {
      channel.push(SessionEvent::transport_error("undecodable batch: " + batch.error()));
      channel.abort = true;
      return;
    }
    channel.push(SessionEvent::of_batch(std::move(batch.value())));
  }
}

void handle_finished(StreamChannel &channel, const http::HttpResponse &response) {
  std::lock_guard<std::mutex> lock(channel.mutex);
  channel.finished = true;
  if (!channel.status.has_value() && response.status != 0) {
    channel.status = response.status;
  }

  const bool streaming = channel.status.has_value() && is_success(*channel.status);
  if (response.aborted) {
    // Closed by us: cancellation, session teardown, or an undecodable batch already queued.
  } else if (response.network_error) {
    channel.failure = response.timeout ? "timed out: " + response.network_error_message
                                       : response.network_error_message;
    if (streaming) {
      channel.push(SessionEvent::transport_error(channel.failure));
    }
  } else if (streaming) {
    if (channel.framer.has_partial()) {
      channel.push(SessionEvent::transport_error("stream closed in the middle of a batch"));
    } else {
      channel.push(SessionEvent::end_of_stream());
    }
  }
  channel.cv.notify_all();
}

std::string describe_rejection(const std::uint16_t status, const std::string &body) {
  std::string message;
  if (status == 401 || status == 403) {
    message = "authentication failed (HTTP " + std::to_string(status) + ")";
  } else {
    message = "server returned HTTP " + std::to_string(status);
  }
  if (!body.empty()) {
    message += ": " + body;
  }
  return message;
}

class HttpTransportSession final : public TransportSession {
public:
  HttpTransportSession() : channel_(std::make_shared<StreamChannel>()) {}

  ~HttpTransportSession() override {
    subscription_.reset();
    channel_->abort = true;
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  HttpTransportSession(const HttpTransportSession &) = delete;
  HttpTransportSession &operator=(const HttpTransportSession &) = delete;

  void start(CancellationGate &gate, http::HttpClient &http, std::string url,
             http::HeaderMap headers, const http::StreamRequestOptions &options) {
    std::weak_ptr<StreamChannel> weak = channel_;
    subscription_ = gate.subscribe([weak]() {
      if (auto channel = weak.lock()) {
        std::lock_guard<std::mutex> lock(channel->mutex);
        channel->interrupted = true;
        channel->abort = true;
        channel->cv.notify_all();
      }
    });

    auto channel = channel_;
    http::HttpClient *client = &http;
    worker_ = std::thread([channel, client, url = std::move(url), headers = std::move(headers),
                           options]() {
      http::StreamCallbacks callbacks;
      callbacks.on_status = [channel](const std::uint16_t status) {
        std::lock_guard<std::mutex> lock(channel->mutex);
        channel->status = status;
        channel->cv.notify_all();
      };
      callbacks.on_chunk = [channel](const std::string_view chunk) {
        handle_chunk(*channel, chunk);
      };
      callbacks.should_abort = [channel]() { return channel->abort.load(); };

      const auto response = client->get_stream(url, headers, options, callbacks);
      handle_finished(*channel, response);
    });
  }

  /// Waits for the response headers. Non-2xx responses are drained so the error body
  /// can be reported.
  [[nodiscard]] common::Result<void, StreamError> await_established() {
    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->cv.wait(lock, [this]() {
      return channel_->interrupted || channel_->finished ||
             (channel_->status.has_value() && is_success(*channel_->status));
    });

    if (channel_->interrupted) {
      return common::Result<void, StreamError>::failure(
          StreamError::connect("connection attempt cancelled"));
    }
    if (channel_->status.has_value() && is_success(*channel_->status)) {
      return common::Result<void, StreamError>::success();
    }
    if (channel_->status.has_value()) {
      return common::Result<void, StreamError>::failure(StreamError::connect(
          describe_rejection(*channel_->status, channel_->error_body)));
    }
    return common::Result<void, StreamError>::failure(StreamError::connect(
        channel_->failure.empty() ? "connection closed before response headers"
                                  : channel_->failure));
  }

  SessionEvent next() override {
    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->cv.wait(lock, [this]() {
      return channel_->interrupted || !channel_->events.empty() || channel_->finished;
    });

    if (channel_->interrupted) {
      return SessionEvent::interrupted();
    }
    if (!channel_->events.empty()) {
      SessionEvent event = std::move(channel_->events.front());
      channel_->events.pop_front();
      return event;
    }
    if (!channel_->failure.empty()) {
      return SessionEvent::transport_error(channel_->failure);
    }
    return SessionEvent::end_of_stream();
  }

private:
  std::shared_ptr<StreamChannel> channel_;
  CancellationGate::Subscription subscription_;
  std::thread worker_;
};

} // namespace

HttpTransportOptions HttpTransportOptions::from_config(const config::StreamConfig &config) {
  HttpTransportOptions options;
  options.server_address = config.server_address;
  options.parts = config.parts;
  options.max_results = config.max_results;
  options.hl = config.hl;
  options.profile_image_size = config.profile_image_size;
  options.connect_timeout_ms = config.connect_timeout_secs * 1000;
  options.idle_timeout_ms = config.idle_timeout_secs * 1000;
  return options;
}

std::string build_stream_url(const HttpTransportOptions &options, const Cursor &cursor) {
  std::string url = options.server_address;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  url += STREAM_ENDPOINT_PATH;
  url += "?liveChatId=" + http::url_encode_component(cursor.stream_id);
  for (const auto &part : options.parts) {
    url += "&part=" + http::url_encode_component(part);
  }
  if (cursor.page_token.has_value()) {
    url += "&pageToken=" + http::url_encode_component(*cursor.page_token);
  }
  if (options.max_results > 0) {
    url += "&maxResults=" + std::to_string(options.max_results);
  }
  if (!options.hl.empty()) {
    url += "&hl=" + http::url_encode_component(options.hl);
  }
  if (options.profile_image_size > 0) {
    url += "&profileImageSize=" + std::to_string(options.profile_image_size);
  }
  return url;
}

HttpTransport::HttpTransport(http::HttpClient &http, HttpTransportOptions options,
                             CancellationGate &gate)
    : http_(http), options_(std::move(options)), gate_(gate) {}

OpenResult HttpTransport::open(const Cursor &cursor, const auth::Credential &credential) {
  http::HeaderMap headers = {{"Accept", "application/json"}};
  auth::apply_credential(credential, headers);

  const http::StreamRequestOptions request_options{
      .connect_timeout_ms = options_.connect_timeout_ms,
      .idle_timeout_ms = options_.idle_timeout_ms,
  };

  auto session = std::make_unique<HttpTransportSession>();
  session->start(gate_, http_, build_stream_url(options_, cursor), std::move(headers),
                 request_options);

  const auto established = session->await_established();
  if (!established.ok()) {
    return OpenResult::failure(established.error());
  }
  return OpenResult::success(std::move(session));
}

} // namespace chatfetch::stream
