#include "pngshot/console_format.h"

#include <cstdarg>

namespace pngshot {
namespace {

    static void vprint_line(std::FILE* f, const char* prefix, const char* fmt,
                            std::va_list args) noexcept
    {
        if (!f || !fmt) {
            return;
        }
        if (prefix) {
            std::fputs(prefix, f);
        }
        std::vfprintf(f, fmt, args);
        std::fputc('\n', f);
        std::fflush(f);
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool dangerous   = false;
    const uint32_t n = (max_bytes == 0U || s.size() < max_bytes)
                           ? static_cast<uint32_t>(s.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '\n') {
            out->append("\\n");
            dangerous = true;
            continue;
        }
        if (c == '\r') {
            out->append("\\r");
            dangerous = true;
            continue;
        }
        if (c == '\t') {
            out->append("\\t");
            dangerous = true;
            continue;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            dangerous = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        dangerous = true;
    }
    return dangerous;
}


void
append_fourcc_name(uint32_t type, std::string* out) noexcept
{
    const char chars[4] = {
        static_cast<char>((type >> 24) & 0xFF),
        static_cast<char>((type >> 16) & 0xFF),
        static_cast<char>((type >> 8) & 0xFF),
        static_cast<char>((type >> 0) & 0xFF),
    };
    (void)append_console_escaped_ascii(std::string_view(chars, 4), 0, out);
}


std::string_view
trim_trailing_space(std::string_view s) noexcept
{
    while (!s.empty()
           && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '
               || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}


void
console_detail(const ConsoleLog& log, const char* fmt, ...) noexcept
{
    if (log.verbosity < Verbosity::Detail) {
        return;
    }
    std::va_list args;
    va_start(args, fmt);
    vprint_line(log.out, nullptr, fmt, args);
    va_end(args);
}


void
console_summary(const ConsoleLog& log, const char* fmt, ...) noexcept
{
    if (log.verbosity < Verbosity::Summary) {
        return;
    }
    std::va_list args;
    va_start(args, fmt);
    vprint_line(log.out, nullptr, fmt, args);
    va_end(args);
}


void
console_warning(const ConsoleLog& log, const char* fmt, ...) noexcept
{
    if (log.verbosity < Verbosity::Summary) {
        return;
    }
    std::va_list args;
    va_start(args, fmt);
    vprint_line(log.err, "warning: ", fmt, args);
    va_end(args);
}


void
console_error(const ConsoleLog& log, const char* fmt, ...) noexcept
{
    std::va_list args;
    va_start(args, fmt);
    vprint_line(log.err, "error: ", fmt, args);
    va_end(args);
}

}  // namespace pngshot
