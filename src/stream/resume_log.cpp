#include "chatfetch/stream/resume_log.hpp"

#include "chatfetch/common/fs.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace chatfetch::stream {

namespace {

std::string errno_message(const std::string &what, const std::filesystem::path &path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

common::Result<std::vector<std::string>, StreamError>
read_lines(const std::filesystem::path &path) {
  std::vector<std::string> lines;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      return common::Result<std::vector<std::string>, StreamError>::failure(
          StreamError::io("cannot stat " + path.string() + ": " + ec.message()));
    }
    return common::Result<std::vector<std::string>, StreamError>::success(std::move(lines));
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Result<std::vector<std::string>, StreamError>::failure(
        StreamError::io(path.string() + " is not a regular file"));
  }

  std::ifstream in(path);
  if (!in) {
    return common::Result<std::vector<std::string>, StreamError>::failure(
        StreamError::io(errno_message("cannot open", path)));
  }
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(std::move(line));
  }
  if (in.bad()) {
    return common::Result<std::vector<std::string>, StreamError>::failure(
        StreamError::io(errno_message("cannot read", path)));
  }
  return common::Result<std::vector<std::string>, StreamError>::success(std::move(lines));
}

} // namespace

ResumeLog::ResumeLog(std::filesystem::path path, const bool sync)
    : path_(std::move(path)), sync_(sync) {}

ResumeLog::~ResumeLog() { close(); }

common::Status ResumeLog::open() {
  if (fd_ >= 0) {
    return common::Status::success();
  }

  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return common::Status::error("failed to create directory for " + path_.string() + ": " +
                                   ec.message());
    }
  }

  const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    return common::Status::error(errno_message("cannot open", path_));
  }
  fd_ = fd;
  return common::Status::success();
}

void ResumeLog::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

AppendResult ResumeLog::append(const Batch &batch) {
  if (const auto status = open(); !status.ok()) {
    return AppendResult::failure(StreamError::io(status.error()));
  }

  const std::string line = serialize_batch(batch) + "\n";
  std::size_t written = 0;
  while (written < line.size()) {
    const ssize_t rc = ::write(fd_, line.data() + written, line.size() - written);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return AppendResult::failure(StreamError::io(errno_message("write failed for", path_)));
    }
    written += static_cast<std::size_t>(rc);
  }

  if (sync_ && ::fsync(fd_) != 0) {
    return AppendResult::failure(StreamError::io(errno_message("fsync failed for", path_)));
  }
  return AppendResult::success();
}

common::Result<std::optional<Cursor>, StreamError>
ResumeLog::recover_last(const std::filesystem::path &path) {
  using RecoverResult = common::Result<std::optional<Cursor>, StreamError>;

  const auto lines = read_lines(path);
  if (!lines.ok()) {
    return RecoverResult::failure(lines.error());
  }

  const auto &all = lines.value();
  for (auto it = all.rbegin(); it != all.rend(); ++it) {
    const std::string line = common::trim(*it);
    if (line.empty()) {
      continue;
    }
    // Only the final record counts; a torn or foreign last line means no resume point.
    const auto batch = parse_batch(line);
    if (!batch.ok()) {
      std::cerr << "[resume] unreadable last record in " << path.string() << ": "
                << batch.error() << "\n";
      return RecoverResult::success(std::nullopt);
    }
    const auto stream_id = batch.value().stream_id();
    if (!stream_id.has_value()) {
      std::cerr << "[resume] last record in " << path.string() << " carries no stream id\n";
      return RecoverResult::success(std::nullopt);
    }
    return RecoverResult::success(Cursor{*stream_id, batch.value().page_token});
  }
  return RecoverResult::success(std::nullopt);
}

common::Result<std::vector<Batch>, StreamError>
ResumeLog::replay(const std::filesystem::path &path) {
  using ReplayResult = common::Result<std::vector<Batch>, StreamError>;

  const auto lines = read_lines(path);
  if (!lines.ok()) {
    return ReplayResult::failure(lines.error());
  }

  std::vector<Batch> batches;
  for (const auto &raw : lines.value()) {
    const std::string line = common::trim(raw);
    if (line.empty()) {
      continue;
    }
    auto batch = parse_batch(line);
    if (batch.ok()) {
      batches.push_back(std::move(batch.value()));
    }
  }
  return ReplayResult::success(std::move(batches));
}

std::optional<Cursor> ResumeLog::replay_cursor(const std::vector<Batch> &batches) {
  std::optional<Cursor> cursor;
  for (const auto &batch : batches) {
    const auto stream_id = batch.stream_id();
    if (!stream_id.has_value()) {
      cursor = std::nullopt;
      continue;
    }
    cursor = Cursor{*stream_id, batch.page_token};
  }
  return cursor;
}

ConsoleSink::ConsoleSink() : out_(&std::cout) {}

ConsoleSink::ConsoleSink(std::ostream &out) : out_(&out) {}

AppendResult ConsoleSink::append(const Batch &batch) {
  *out_ << serialize_batch(batch) << '\n';
  out_->flush();
  if (!*out_) {
    return AppendResult::failure(StreamError::io("failed to write batch to output stream"));
  }
  return AppendResult::success();
}

} // namespace chatfetch::stream
