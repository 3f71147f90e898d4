#pragma once

#include <testconsole/common/expected.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <string>
#include <system_error>

namespace testconsole {

/// Format used for report timestamps, e.g. ``2024-03-01T13:37:00``
constexpr const char* ISO8601_FORMAT = "%Y-%m-%dT%H:%M:%S";

__attribute__((format(strftime, 2, 0))) // help the compiler check `format` for validity
inline Expected<std::string>
to_localtime_string(std::chrono::system_clock::time_point time_point, const char* format = ISO8601_FORMAT) {
    std::time_t time = std::chrono::system_clock::to_time_t(time_point);

    std::tm tm_buf{};

    if (localtime_r(&time, &tm_buf) != &tm_buf) {
        auto err = errno;
        LOG_WARN("localtime_r failed to convert to local time: {}", get_err_msg(err));
        return std::error_code{err, std::generic_category()};
    }

    constexpr std::size_t BUF_SZ = 256;
    std::array<char, BUF_SZ> buf{};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    if (std::size_t num_chars = std::strftime(buf.data(), buf.size(), format, &tm_buf)) {
        return std::string{buf.data(), num_chars};
    }
#pragma GCC diagnostic pop

    LOG_WARN("strftime failed to format time point with \"{}\"", format);
    return std::make_error_code(std::errc::value_too_large);
}

/// Seconds with millisecond precision, as used by reports and the console summary
inline std::string format_seconds(std::chrono::milliseconds duration) {
    return fmt::format("{:.3f}", static_cast<double>(duration.count()) / 1000.0);
}

} // namespace testconsole
