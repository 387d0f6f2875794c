#pragma once

namespace p4_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether log output on stderr should be colored.
/// An explicit --color/--no-color choice wins, then NO_COLOR, then tty detection.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace p4_mcp
