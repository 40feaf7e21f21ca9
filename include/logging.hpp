#ifndef TXLOG_LOGGING_HPP
#define TXLOG_LOGGING_HPP

#include <chrono>
#include <concepts>
#include <ctime>
#include <format>
#include <iostream>
#include <source_location>
#include <string_view>

namespace txlog {

// Format string that also captures where it was written. The default argument is
// evaluated at the call site, so the log prefix names the caller and not this header.
struct LogFormat {
    std::string_view text;
    std::source_location location;

    template<typename S>
        requires std::convertible_to<const S&, std::string_view>
    LogFormat(const S& fmt, const std::source_location& loc = std::source_location::current())
        : text(fmt), location(loc) {}
};

template<typename... Args>
void log_message(LogFormat format, const Args&... args) {
    auto time_t_val = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char time_str[20];
    std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", std::localtime(&time_t_val));

    std::cerr << std::format("[{}] {}:{} - ",
                             time_str,
                             format.location.file_name(),
                             format.location.line());
    std::cerr << std::vformat(format.text, std::make_format_args(args...)) << '\n';
}

/*

Example Usage:
log_message("appended {} entries", log.length());
log_message("node {} still has {} owners", node->value(), owners);

Output:
[2026-10-19 18:05:12] main.cpp:31 - appended 3 entries
[2026-10-19 18:05:12] transaction_log.cpp:54 - node Testing1 still has 2 owners

*/

} // namespace txlog

#endif // TXLOG_LOGGING_HPP
