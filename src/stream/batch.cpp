#include "chatfetch/stream/batch.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/common/json_util.hpp"

#include <initializer_list>
#include <sstream>

namespace chatfetch::stream {

namespace {

constexpr const char *DEFAULT_BATCH_KIND = "youtube#liveChatMessageListResponse";
constexpr const char *DEFAULT_MESSAGE_KIND = "youtube#liveChatMessage";

/// First present, non-null, non-empty value among the given spellings. The map comes
/// from json_parse_flat_raw, so the string "null" is still a value.
std::optional<std::string> flat_value(const common::JsonFlatMap &map,
                                      std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    const auto it = map.find(key);
    if (it == map.end()) {
      continue;
    }
    if (auto text = common::json_flat_text(it->second); text.has_value() && !text->empty()) {
      return text;
    }
  }
  return std::nullopt;
}

std::string flat_string(const common::JsonFlatMap &map, std::initializer_list<const char *> keys) {
  return flat_value(map, keys).value_or("");
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(value));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

void append_field(std::ostringstream &out, bool &first, const std::string &key,
                  const std::string &value) {
  if (!first) {
    out << ',';
  }
  first = false;
  out << '"' << key << "\":\"" << common::json_escape(value) << '"';
}

} // namespace

std::optional<std::string> Batch::stream_id() const {
  if (items.empty() || items.front().live_chat_id.empty()) {
    return std::nullopt;
  }
  return items.front().live_chat_id;
}

common::Result<ChatMessage> parse_chat_message(const std::string &json) {
  if (!common::json_is_complete_object(json)) {
    return common::Result<ChatMessage>::failure("chat message is not a JSON object");
  }

  const auto top = common::json_parse_flat_raw(json);
  ChatMessage message;
  message.id = flat_string(top, {"id"});

  if (const auto snippet_raw = flat_value(top, {"snippet"}); snippet_raw.has_value()) {
    const auto snippet = common::json_parse_flat_raw(*snippet_raw);
    message.live_chat_id = flat_string(snippet, {"liveChatId", "live_chat_id"});
    message.author_channel_id = flat_string(snippet, {"authorChannelId", "author_channel_id"});
    message.published_at = flat_string(snippet, {"publishedAt", "published_at"});
    message.display_message = flat_string(snippet, {"displayMessage", "display_message"});
    if (message.display_message.empty()) {
      if (const auto details = flat_value(snippet, {"textMessageDetails", "text_message_details"});
          details.has_value()) {
        message.display_message =
            flat_string(common::json_parse_flat_raw(*details), {"messageText", "message_text"});
      }
    }
  }

  if (const auto author_raw = flat_value(top, {"authorDetails", "author_details"});
      author_raw.has_value()) {
    const auto author = common::json_parse_flat_raw(*author_raw);
    message.author_display_name = flat_string(author, {"displayName", "display_name"});
    if (message.author_channel_id.empty()) {
      message.author_channel_id = flat_string(author, {"channelId", "channel_id"});
    }
  }

  message.raw = common::json_compact(common::trim(json));
  return common::Result<ChatMessage>::success(std::move(message));
}

common::Result<Batch> parse_batch(const std::string &json) {
  if (!common::json_is_complete_object(json)) {
    return common::Result<Batch>::failure("batch is not a JSON object");
  }

  const auto top = common::json_parse_flat_raw(json);
  Batch batch;
  batch.kind = flat_string(top, {"kind"});
  batch.etag = flat_string(top, {"etag"});
  batch.page_token = flat_value(top, {"nextPageToken", "next_page_token"});
  batch.offline_at = flat_value(top, {"offlineAt", "offline_at"});
  if (const auto interval = flat_value(top, {"pollingIntervalMillis", "polling_interval_millis"});
      interval.has_value()) {
    batch.polling_interval_millis = parse_u64(*interval);
  }

  if (const auto items_raw = flat_value(top, {"items"}); items_raw.has_value()) {
    const std::string items = common::trim(*items_raw);
    if (items.empty() || items.front() != '[') {
      return common::Result<Batch>::failure("batch items is not an array");
    }
    for (const auto &item_json : common::json_split_top_level_objects(items)) {
      auto item = parse_chat_message(item_json);
      if (!item.ok()) {
        return common::Result<Batch>::failure(item.error());
      }
      batch.items.push_back(std::move(item.value()));
    }
  }

  batch.raw = common::json_compact(common::trim(json));
  return common::Result<Batch>::success(std::move(batch));
}

std::string serialize_chat_message(const ChatMessage &message) {
  if (!message.raw.empty()) {
    return message.raw;
  }

  std::ostringstream out;
  out << "{\"kind\":\"" << DEFAULT_MESSAGE_KIND << "\",\"id\":\""
      << common::json_escape(message.id) << "\",\"snippet\":{";
  bool first = true;
  append_field(out, first, "liveChatId", message.live_chat_id);
  append_field(out, first, "authorChannelId", message.author_channel_id);
  append_field(out, first, "publishedAt", message.published_at);
  append_field(out, first, "displayMessage", message.display_message);
  out << "},\"authorDetails\":{";
  first = true;
  append_field(out, first, "channelId", message.author_channel_id);
  append_field(out, first, "displayName", message.author_display_name);
  out << "}}";
  return out.str();
}

std::string serialize_batch(const Batch &batch) {
  if (!batch.raw.empty()) {
    return batch.raw;
  }

  std::ostringstream out;
  out << '{';
  bool first = true;
  append_field(out, first, "kind", batch.kind.empty() ? DEFAULT_BATCH_KIND : batch.kind);
  if (!batch.etag.empty()) {
    append_field(out, first, "etag", batch.etag);
  }
  if (batch.page_token.has_value()) {
    append_field(out, first, "nextPageToken", *batch.page_token);
  }
  if (batch.polling_interval_millis.has_value()) {
    out << ",\"pollingIntervalMillis\":" << *batch.polling_interval_millis;
  }
  if (batch.offline_at.has_value()) {
    append_field(out, first, "offlineAt", *batch.offline_at);
  }
  out << ",\"items\":[";
  for (std::size_t i = 0; i < batch.items.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << serialize_chat_message(batch.items[i]);
  }
  out << "]}";
  return out.str();
}

std::vector<std::string> BatchFramer::feed(const std::string_view chunk) {
  std::vector<std::string> complete;
  for (const char ch : chunk) {
    if (depth_ == 0) {
      // Between objects: whitespace, array punctuation and separators are skipped.
      if (ch == '{') {
        current_.assign(1, ch);
        depth_ = 1;
        in_string_ = false;
        escaped_ = false;
      }
      continue;
    }

    current_.push_back(ch);
    if (in_string_) {
      if (escaped_) {
        escaped_ = false;
      } else if (ch == '\\') {
        escaped_ = true;
      } else if (ch == '"') {
        in_string_ = false;
      }
      continue;
    }

    if (ch == '"') {
      in_string_ = true;
    } else if (ch == '{') {
      ++depth_;
    } else if (ch == '}') {
      --depth_;
      if (depth_ == 0) {
        complete.push_back(std::move(current_));
        current_.clear();
      }
    }
  }
  return complete;
}

void BatchFramer::reset() {
  current_.clear();
  depth_ = 0;
  in_string_ = false;
  escaped_ = false;
}

} // namespace chatfetch::stream
