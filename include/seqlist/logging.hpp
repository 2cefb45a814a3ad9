#ifndef SEQLIST_LOGGING_HPP
#define SEQLIST_LOGGING_HPP

#include <chrono>
#include <concepts>
#include <ctime>
#include <format>
#include <iostream>
#include <source_location>
#include <string_view>

#include "common.hpp"

namespace seqlist {

// format string that remembers where it was written. the location has to ride
// along with the format, a defaulted parameter after the pack is never deduced.
struct LogFormat {
    std::string_view format;
    std::source_location location;

    template<typename S>
        requires std::convertible_to<const S&, std::string_view>
    LogFormat(const S& fmt, const std::source_location& loc = std::source_location::current())
        : format(fmt), location(loc) {}
};

// variadic templates for multiple arguments.
template<typename... Args>
void log_message(LogFormat fmt, const Args&... args) {
    if constexpr (!LOGGING_ENABLED) {
        return;
    } else {
        auto time_t_val = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        char time_str[20];
        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);
        std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &tm_buf);

        std::cerr << std::format("[{}] {}:{} - ",
                                 time_str,
                                 fmt.location.file_name(),
                                 fmt.location.line());

        std::cerr << std::vformat(fmt.format, std::make_format_args(args...)) << '\n';
    }
}

/*

Example Usage:
log_message("node at index {} has no successor (size {})", index, size);

Output:
[2025-03-06 18:05:12] singly_linked_list.hpp:88 - node at index 2 has no successor (size 5)

*/

// logs the broken invariant and hands back the error to propagate
template<typename... Args>
[[nodiscard]] std::unexpected<std::error_code> invariant_violation(LogFormat fmt, const Args&... args) {
    log_message(fmt, args...);
    return fail(ListError::UnexpectedError);
}

} // namespace seqlist

#endif // SEQLIST_LOGGING_HPP
