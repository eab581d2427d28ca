#pragma once

/// @file cli_args.hpp
/// @brief Small helpers for the command-line front end.

#include <charconv>
#include <cstring>
#include <optional>
#include <string_view>
#include <system_error>

namespace gstile {

/// @brief Returns true if arg matches the short or long form.
inline bool arg_matches(const char* arg, const char* short_form, const char* long_form) {
    return (short_form && std::strcmp(arg, short_form) == 0) ||
           (long_form && std::strcmp(arg, long_form) == 0);
}

/// @brief Parse a worker thread count. 0 means "all cores".
///
/// The whole string must be a non-negative decimal integer; anything else
/// (empty, signs, trailing characters, overflow) yields std::nullopt.
inline std::optional<int> parse_thread_count(std::string_view text) {
    if (text.empty()) return std::nullopt;

    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value < 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace gstile
