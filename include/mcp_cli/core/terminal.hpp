#pragma once

namespace mcp_cli {

/// Returns true if stderr is a terminal (colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (colored result/help output).
bool IsStdoutTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve color from --color/--no-color flags, NO_COLOR and the tty check.
bool ResolveColor(bool force_color, bool force_no_color, bool is_tty);

} // namespace mcp_cli
