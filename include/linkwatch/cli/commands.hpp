#pragma once

#include "linkwatch/probes/builtin.hpp"

#include <optional>

namespace linkwatch::cli {

/// Exit codes of `check`: the overall status, or ERROR for usage and setup failures.
inline constexpr int EXIT_STATUS_OK = 0;
inline constexpr int EXIT_STATUS_UNKNOWN = 1;
inline constexpr int EXIT_STATUS_WARNING = 2;
inline constexpr int EXIT_STATUS_CRITICAL = 3;
inline constexpr int EXIT_ERROR = 4;

/// Replaces the system collaborators used by check/watch/copy.
void set_collaborators_override(std::optional<probes::Collaborators> collaborators);

int run_cli(int argc, char **argv);

} // namespace linkwatch::cli
