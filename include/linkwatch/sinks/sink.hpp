#pragma once

#include "linkwatch/common/result.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace linkwatch::sinks {

/// Destination for a rendered report.
class TextSink {
public:
  virtual ~TextSink() = default;
  [[nodiscard]] virtual common::Status write_text(const std::string &text) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class StreamSink final : public TextSink {
public:
  explicit StreamSink(std::ostream &out);

  [[nodiscard]] common::Status write_text(const std::string &text) override;
  [[nodiscard]] std::string_view name() const override { return "stream"; }

private:
  std::ostream &out_;
};

/// Replaces the file atomically (temp file + rename).
class FileSink final : public TextSink {
public:
  explicit FileSink(std::filesystem::path path);

  [[nodiscard]] common::Status write_text(const std::string &text) override;
  [[nodiscard]] std::string_view name() const override { return "file"; }

private:
  std::filesystem::path path_;
};

struct ClipboardCommand {
  std::string binary;
  std::string command;
};

/// wl-copy, xclip, xsel, pbcopy; the first one installed wins.
[[nodiscard]] std::vector<ClipboardCommand> default_clipboard_commands();

class ClipboardSink final : public TextSink {
public:
  explicit ClipboardSink(std::vector<ClipboardCommand> candidates = default_clipboard_commands());

  [[nodiscard]] common::Status write_text(const std::string &text) override;
  [[nodiscard]] std::string_view name() const override { return "clipboard"; }

private:
  std::vector<ClipboardCommand> candidates_;
};

[[nodiscard]] std::string shell_quote(const std::string &value);
[[nodiscard]] bool command_exists(const std::string &command);

} // namespace linkwatch::sinks
