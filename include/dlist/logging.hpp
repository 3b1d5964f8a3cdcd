#ifndef DLIST_LOGGING_HPP
#define DLIST_LOGGING_HPP

#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>

#include "common.hpp"

namespace dlist {

// Thin wrapper over std::vformat, so {:d}, {{ and }} behave as in std::format.
// Throws std::format_error when the format does not match the arguments.
template<typename... Args>
[[nodiscard]] std::string format_message(std::string_view format, const Args&... args) {
    return std::vformat(format, std::make_format_args(args...));
}

// A format string plus the location it was written at. Converts implicitly, so
// log_message("...", args) records the caller's file and line.
struct LogFormat {
    std::string_view text;
    std::source_location location;

    LogFormat(const char* text, const std::source_location& location = std::source_location::current())
        : text(text), location(location) {}
    LogFormat(std::string_view text, const std::source_location& location = std::source_location::current())
        : text(text), location(location) {}
};

// variadic templates for multiple arguments.
template<typename... Args>
void log_message(LogFormat format, const Args&... args) {
    auto time_t_val = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char time_str[LOG_TIME_BUFFER];
    std::strftime(time_str, sizeof(time_str), LOG_TIME_FORMAT, std::localtime(&time_t_val));

    std::cerr << std::format("[{}] {}:{} - ",
                             time_str,
                             format.location.file_name(),
                             format.location.line());
    std::cerr << format_message(format.text, args...) << '\n';
}

/*

Example Usage:
log_message("invariant violated: {} (length {})", "tail->next == nullptr", 3);

Output:
[2026-10-19 18:05:12] include/dlist/list.hpp:212 - invariant violated: tail->next == nullptr (length 3)

*/

} // namespace dlist

#endif // DLIST_LOGGING_HPP
