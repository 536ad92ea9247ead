#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

/**
 * \file console_format.h
 * \brief Terminal-safe text formatting and verbosity-gated console output.
 */

namespace pngshot {

/// How much a conversion prints.
enum class Verbosity : uint8_t {
    /// Errors only.
    Quiet,
    /// One line per batch item plus a tally; warnings.
    Summary,
    /// Per-step diagnostics (single-file mode).
    Detail,
};

/// Console destination for one run. Passed explicitly; there is no global.
struct ConsoleLog final {
    Verbosity verbosity = Verbosity::Detail;
    std::FILE* out      = stdout;
    std::FILE* err      = stderr;
};

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes control bytes and non-ASCII as `\xNN`
// - Escapes `\n`, `\r`, `\t`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends a PNG chunk type as four characters, escaping non-letters.
void
append_fourcc_name(uint32_t type, std::string* out) noexcept;

// Trims trailing whitespace (tool output usually ends in a newline).
std::string_view
trim_trailing_space(std::string_view s) noexcept;

// Printed at Verbosity::Detail to `out`.
void
console_detail(const ConsoleLog& log, const char* fmt, ...) noexcept;

// Printed at Verbosity::Summary and above to `out`.
void
console_summary(const ConsoleLog& log, const char* fmt, ...) noexcept;

// Printed at Verbosity::Summary and above to `err`.
void
console_warning(const ConsoleLog& log, const char* fmt, ...) noexcept;

// Always printed to `err`.
void
console_error(const ConsoleLog& log, const char* fmt, ...) noexcept;

}  // namespace pngshot
