#include "chatfetch/stream/error.hpp"

namespace chatfetch::stream {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Connect:
    return "ConnectError";
  case ErrorKind::Transport:
    return "TransportError";
  case ErrorKind::Io:
    return "IoError";
  case ErrorKind::Config:
    return "ConfigError";
  }
  return "UnknownError";
}

std::string StreamError::to_string() const {
  std::string out(error_kind_name(kind));
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

} // namespace chatfetch::stream
