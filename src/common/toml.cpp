#include "chatfetch/common/toml.hpp"

#include "chatfetch/common/fs.hpp"
#include "chatfetch/common/json_util.hpp"

#include <charconv>
#include <optional>
#include <sstream>

namespace chatfetch::common {

namespace {

/// Tracks whether a scan position is inside a basic or literal string.
class QuoteState {
public:
  /// Feed the character at text[i]; returns true while inside a string afterwards.
  bool step(const std::string &text, std::size_t i) {
    const char ch = text[i];
    if (quote_ == '\0') {
      if (ch == '"' || ch == '\'') {
        quote_ = ch;
      }
    } else if (ch == quote_ && (quote_ == '\'' || i == 0 || text[i - 1] != '\\')) {
      quote_ = '\0';
      return true;
    }
    return quote_ != '\0';
  }

  [[nodiscard]] bool inside() const { return quote_ != '\0'; }

private:
  char quote_ = '\0';
};

std::string without_comment(const std::string &line) {
  QuoteState quotes;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (!quotes.step(line, i) && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

/// Net '[' minus ']' outside strings; a positive value means an array is still open.
int bracket_balance(const std::string &text) {
  QuoteState quotes;
  int balance = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (quotes.step(text, i)) {
      continue;
    }
    if (text[i] == '[') {
      ++balance;
    } else if (text[i] == ']') {
      --balance;
    }
  }
  return balance;
}

std::vector<std::string> array_elements(const std::string &body) {
  std::vector<std::string> elements;
  QuoteState quotes;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= body.size(); ++i) {
    const bool at_end = i == body.size();
    if (!at_end && (quotes.step(body, i) || body[i] != ',')) {
      continue;
    }
    std::string element = trim(body.substr(start, i - start));
    if (!element.empty()) {
      elements.push_back(std::move(element));
    }
    start = i + 1;
  }
  return elements;
}

// Basic strings use JSON-compatible escapes; literal strings are taken as-is.
std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2) {
    return value;
  }
  if (value.front() == '"' && value.back() == '"') {
    return json_unescape(value.substr(1, value.size() - 2));
  }
  if (value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::optional<std::string> raw_value(const TomlDocument &document, const std::string &key) {
  const auto it = document.values.find(key);
  if (it == document.values.end()) {
    return std::nullopt;
  }
  return trim(it->second);
}

std::string at_line(const std::string &message, std::size_t line_number) {
  return message + " at line " + std::to_string(line_number);
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto raw = raw_value(*this, key);
  return raw.has_value() ? unquote(*raw) : fallback;
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto raw = raw_value(*this, key);
  if (!raw.has_value()) {
    return fallback;
  }
  const std::string word = to_lower(*raw);
  if (word == "true" || word == "false") {
    return word == "true";
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto raw = raw_value(*this, key);
  if (!raw.has_value()) {
    return fallback;
  }
  std::uint64_t parsed = 0;
  const char *end = raw->data() + raw->size();
  const auto [ptr, ec] = std::from_chars(raw->data(), end, parsed);
  return ec == std::errc() && ptr == end ? parsed : fallback;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto raw = raw_value(*this, key);
  if (!raw.has_value() || raw->size() < 2 || raw->front() != '[' || raw->back() != ']') {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &element : array_elements(raw->substr(1, raw->size() - 2))) {
    out.push_back(unquote(element));
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream input(content);
  std::string section;
  std::string line;
  std::size_t line_number = 0;

  while (std::getline(input, line)) {
    ++line_number;
    const std::string text = trim(without_comment(line));
    if (text.empty()) {
      continue;
    }

    if (text.front() == '[') {
      if (text.back() != ']') {
        return Result<TomlDocument>::failure(at_line("Unterminated section header", line_number));
      }
      section = trim(text.substr(1, text.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure(at_line("Invalid empty section", line_number));
      }
      continue;
    }

    const auto equals = text.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(at_line("Invalid key/value", line_number));
    }
    const std::string key = trim(text.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(at_line("Missing key", line_number));
    }

    // Arrays may continue over the following lines until their brackets balance.
    const std::size_t start_line = line_number;
    std::string value = trim(text.substr(equals + 1));
    while (bracket_balance(value) > 0) {
      if (!std::getline(input, line)) {
        return Result<TomlDocument>::failure(at_line("Unterminated array", start_line));
      }
      ++line_number;
      value += " " + trim(without_comment(line));
    }

    document.values[section.empty() ? key : section + "." + key] = trim(value);
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace chatfetch::common
