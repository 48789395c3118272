// Human-readable status lines on stderr: "dockhand: <component>: <message>"
#pragma once

namespace dockhand::util {

// Suppress non-fatal diagnostics (fatal ones are always printed).
void set_quiet(bool quiet);
[[nodiscard]] bool quiet();

// printf-style status line. No-op when quiet.
void diag(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// printf-style error line. Printed even when quiet.
void diag_fatal(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace dockhand::util
