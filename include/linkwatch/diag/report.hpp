#pragma once

#include "linkwatch/diag/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace linkwatch::diag {

struct ReportOptions {
  std::string title = "Linkwatch Diagnostics Report";
  bool show_latency = true;
};

[[nodiscard]] std::string_view status_glyph(Status status);

/// The verdict sentence: the most severe non-OK result (earliest on ties), or a
/// fixed sentence when everything is OK or nothing ran.
[[nodiscard]] std::string diagnosis(const DiagnosticPass &pass);

/// Plain-text report. Depends only on its arguments.
[[nodiscard]] std::string render_report(const DiagnosticPass &pass,
                                        const std::vector<ErrorLogEntry> *error_log = nullptr,
                                        const ReportOptions &options = {});

} // namespace linkwatch::diag
