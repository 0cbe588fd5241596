#pragma once

#include "chatfetch/common/result.hpp"
#include "chatfetch/stream/batch.hpp"
#include "chatfetch/stream/cursor.hpp"
#include "chatfetch/stream/error.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>

namespace chatfetch::stream {

using AppendResult = common::Result<void, StreamError>;

class BatchSink {
public:
  virtual ~BatchSink() = default;

  /// Durable once this returns success. Failures are IoError.
  [[nodiscard]] virtual AppendResult append(const Batch &batch) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Append-only JSON-lines file, one serialized batch per line. The final line is the
/// resume point. Not safe to share between processes; nothing locks the file.
class ResumeLog final : public BatchSink {
public:
  explicit ResumeLog(std::filesystem::path path, bool sync = true);
  ~ResumeLog() override;

  ResumeLog(const ResumeLog &) = delete;
  ResumeLog &operator=(const ResumeLog &) = delete;

  /// Opens (creating if needed) in append mode. append() calls this on first use.
  [[nodiscard]] common::Status open();
  void close();

  [[nodiscard]] AppendResult append(const Batch &batch) override;
  [[nodiscard]] std::string_view name() const override { return "resume-log"; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  /// Cursor implied by the last non-blank line. A missing file or a malformed last
  /// line yields nullopt; only read failures are errors.
  [[nodiscard]] static common::Result<std::optional<Cursor>, StreamError>
  recover_last(const std::filesystem::path &path);

  /// Every well-formed record in file order.
  [[nodiscard]] static common::Result<std::vector<Batch>, StreamError>
  replay(const std::filesystem::path &path);

  /// Cursor reached by handling the records one after another.
  [[nodiscard]] static std::optional<Cursor> replay_cursor(const std::vector<Batch> &batches);

private:
  std::filesystem::path path_;
  bool sync_ = true;
  int fd_ = -1;
};

/// Writes each batch as one line to a stream (stdout by default), flushing per line.
class ConsoleSink final : public BatchSink {
public:
  ConsoleSink();
  explicit ConsoleSink(std::ostream &out);

  [[nodiscard]] AppendResult append(const Batch &batch) override;
  [[nodiscard]] std::string_view name() const override { return "console"; }

private:
  std::ostream *out_;
};

} // namespace chatfetch::stream
