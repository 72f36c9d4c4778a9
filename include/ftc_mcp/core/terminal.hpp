#pragma once

#include <optional>

namespace ftc_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether log output on stderr should be colored.
/// An explicit choice wins; otherwise color only on a TTY without NO_COLOR.
bool ResolveLogColor(std::optional<bool> forced);

} // namespace ftc_mcp
