#pragma once

#include "chatfetch/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatfetch::stream {

struct ChatMessage {
  std::string id;
  std::string live_chat_id;
  std::string author_channel_id;
  std::string author_display_name;
  std::string display_message;
  std::string published_at;
  /// The message object exactly as received, compacted to one line. Empty for
  /// messages built in code; serialization then rebuilds the object from the fields.
  std::string raw;
};

struct Batch {
  std::string kind;
  std::string etag;
  std::optional<std::string> page_token;
  std::optional<std::uint64_t> polling_interval_millis;
  std::optional<std::string> offline_at;
  std::vector<ChatMessage> items;
  /// The response object as received, compacted. When set it is what gets serialized,
  /// so fields outside this struct reach the log unchanged.
  std::string raw;

  [[nodiscard]] bool empty() const { return items.empty(); }

  /// Stream id carried by the first item; batches without items have none.
  [[nodiscard]] std::optional<std::string> stream_id() const;
};

[[nodiscard]] common::Result<ChatMessage> parse_chat_message(const std::string &json);

/// Accepts camelCase (wire) and snake_case field names.
[[nodiscard]] common::Result<Batch> parse_batch(const std::string &json);

[[nodiscard]] std::string serialize_chat_message(const ChatMessage &message);

/// One line, no trailing newline.
[[nodiscard]] std::string serialize_batch(const Batch &batch);

/// Cuts complete top-level JSON objects out of a byte stream. Handles both
/// newline-delimited objects and a streamed JSON array ("[{...},{...}]").
class BatchFramer {
public:
  /// Feed the next chunk; returns every object completed by it, in order.
  [[nodiscard]] std::vector<std::string> feed(std::string_view chunk);

  /// True while an object has been started but not closed.
  [[nodiscard]] bool has_partial() const { return depth_ > 0; }

  void reset();

private:
  std::string current_;
  std::size_t depth_ = 0;
  bool in_string_ = false;
  bool escaped_ = false;
};

} // namespace chatfetch::stream
