#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace chatfetch::stream {

enum class ErrorKind {
  Connect,
  Transport,
  Io,
  Config,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

struct StreamError {
  ErrorKind kind = ErrorKind::Transport;
  std::string message;

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] static StreamError connect(std::string message) {
    return StreamError{ErrorKind::Connect, std::move(message)};
  }
  [[nodiscard]] static StreamError transport(std::string message) {
    return StreamError{ErrorKind::Transport, std::move(message)};
  }
  [[nodiscard]] static StreamError io(std::string message) {
    return StreamError{ErrorKind::Io, std::move(message)};
  }
  [[nodiscard]] static StreamError config(std::string message) {
    return StreamError{ErrorKind::Config, std::move(message)};
  }
};

} // namespace chatfetch::stream
