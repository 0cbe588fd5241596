#pragma once

#include "chatfetch/auth/credentials.hpp"
#include "chatfetch/common/result.hpp"
#include "chatfetch/stream/batch.hpp"
#include "chatfetch/stream/cursor.hpp"
#include "chatfetch/stream/error.hpp"

#include <memory>
#include <optional>
#include <string>

namespace chatfetch::stream {

enum class SessionEventKind {
  Batch,
  EndOfStream,
  Interrupted,
  TransportError,
};

/// What one call to TransportSession::next() produced. EndOfStream is a normal
/// server-side close, not an error.
struct SessionEvent {
  SessionEventKind kind = SessionEventKind::EndOfStream;
  std::optional<Batch> batch;
  std::string error;

  [[nodiscard]] static SessionEvent of_batch(Batch batch) {
    return SessionEvent{SessionEventKind::Batch, std::move(batch), {}};
  }
  [[nodiscard]] static SessionEvent end_of_stream() {
    return SessionEvent{SessionEventKind::EndOfStream, std::nullopt, {}};
  }
  [[nodiscard]] static SessionEvent interrupted() {
    return SessionEvent{SessionEventKind::Interrupted, std::nullopt, {}};
  }
  [[nodiscard]] static SessionEvent transport_error(std::string message) {
    return SessionEvent{SessionEventKind::TransportError, std::nullopt, std::move(message)};
  }
};

/// One live server-streaming connection. Destroying it releases the connection.
class TransportSession {
public:
  virtual ~TransportSession() = default;

  /// Blocks until a batch arrives, the stream closes, the transfer fails, or the
  /// session is interrupted by cancellation.
  [[nodiscard]] virtual SessionEvent next() = 0;
};

using OpenResult = common::Result<std::unique_ptr<TransportSession>, StreamError>;

class Transport {
public:
  virtual ~Transport() = default;

  /// Connect to cursor.stream_id, continuing from cursor.page_token when it is set.
  /// Failures are ConnectError.
  [[nodiscard]] virtual OpenResult open(const Cursor &cursor,
                                        const auth::Credential &credential) = 0;
};

} // namespace chatfetch::stream
