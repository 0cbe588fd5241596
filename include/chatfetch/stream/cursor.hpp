#pragma once

#include <optional>
#include <string>

namespace chatfetch::stream {

/// Resumable position: the chat the stream belongs to plus the server's continuation token.
/// page_token is only ever set from a batch that has already been handled.
struct Cursor {
  std::string stream_id;
  std::optional<std::string> page_token;

  bool operator==(const Cursor &) const = default;

  [[nodiscard]] std::string to_string() const {
    return stream_id + "@" + (page_token.has_value() ? *page_token : std::string("<start>"));
  }
};

} // namespace chatfetch::stream
