#include "linkwatch/sinks/sink.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace linkwatch::sinks {

std::string shell_quote(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 4);
  out.push_back('\'');
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
      continue;
    }
    out.push_back(ch);
  }
  out.push_back('\'');
  return out;
}

bool command_exists(const std::string &command) {
  const std::string probe = "command -v " + shell_quote(command) + " >/dev/null 2>&1";
  return std::system(probe.c_str()) == 0;
}

StreamSink::StreamSink(std::ostream &out) : out_(out) {}

common::Status StreamSink::write_text(const std::string &text) {
  out_ << text;
  out_.flush();
  if (!out_) {
    return common::Status::error(common::ErrorKind::IoError, "failed writing report to stream");
  }
  return common::Status::success();
}

FileSink::FileSink(std::filesystem::path path) : path_(std::move(path)) {}

common::Status FileSink::write_text(const std::string &text) {
  std::error_code ec;
  if (!path_.parent_path().empty()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return common::Status::error(common::ErrorKind::IoError,
                                   "failed to create output directory: " + ec.message());
    }
  }

  const std::filesystem::path tmp_path = path_.string() + ".tmp";
  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorKind::IoError,
                                 "unable to open " + tmp_path.string());
  }
  file << text;
  file.close();
  if (!file) {
    return common::Status::error(common::ErrorKind::IoError,
                                 "failed writing " + tmp_path.string());
  }

  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::IoError,
                                 "failed to replace " + path_.string() + ": " + ec.message());
  }
  return common::Status::success();
}

std::vector<ClipboardCommand> default_clipboard_commands() {
  return {{.binary = "wl-copy", .command = "wl-copy"},
          {.binary = "xclip", .command = "xclip -selection clipboard"},
          {.binary = "xsel", .command = "xsel --clipboard --input"},
          {.binary = "pbcopy", .command = "pbcopy"}};
}

ClipboardSink::ClipboardSink(std::vector<ClipboardCommand> candidates)
    : candidates_(std::move(candidates)) {}

common::Status ClipboardSink::write_text(const std::string &text) {
  std::string tried;
  for (const auto &candidate : candidates_) {
    if (!command_exists(candidate.binary)) {
      tried += tried.empty() ? candidate.binary : ", " + candidate.binary;
      continue;
    }

    FILE *pipe = popen(candidate.command.c_str(), "w");
    if (pipe == nullptr) {
      return common::Status::error(common::ErrorKind::IoError,
                                   "failed to launch " + candidate.binary);
    }
    const std::size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
    const int rc = pclose(pipe);
    if (written != text.size()) {
      return common::Status::error(common::ErrorKind::IoError,
                                   "short write to " + candidate.binary);
    }
    if (rc != 0) {
      return common::Status::error(common::ErrorKind::IoError,
                                   candidate.binary + " failed with exit code " +
                                       std::to_string(rc));
    }
    return common::Status::success();
  }
  return common::Status::error(common::ErrorKind::IoError,
                               "no clipboard command found (tried " + tried + ")");
}

} // namespace linkwatch::sinks
