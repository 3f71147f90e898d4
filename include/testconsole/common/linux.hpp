#pragma once

#include <testconsole/common/expected.hpp>
#include <testconsole/logging.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace testconsole::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open({:?}) failed: '{}'", pathname, err.message());
        return err;
    }

    return res;
}

/// writes to a file descriptor. See write(2)
/// Retries on EINTR and on short writes until all of ``data`` is written.
/// returns success/failure; logs failure at debug level
inline Expected<std::size_t> write(int fd, std::string_view data) {
    std::size_t written = 0;

    while (written < data.size()) {
        ssize_t res = ::write(fd, data.data() + written, data.size() - written);

        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }

            auto err = make_error_code(errno);
            LOG_DEBUG("write failed: '{}'", err.message());
            return err;
        }

        written += static_cast<std::size_t>(res);
    }

    return written;
}

/// see fsync(2)
/// returns success/failure; logs failure at debug level
inline Expected<> fsync(int fd) {
    int res = ::fsync(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fsync failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    std::string to_string() const { return sigdescr_np(signal_num_); }

    friend std::string format_as(const Signal& from) { return from.to_string(); }

private:
    int signal_num_;
};

using SignalHandlerT = void (*)(int);

/// see signal(2)
/// returns the previously installed handler; logs failure at debug level
inline Expected<SignalHandlerT> signal(Signal sig, SignalHandlerT handler) {
    SignalHandlerT prev_handler = ::signal(sig, handler);

    if (prev_handler == SIG_ERR) {
        auto err = make_error_code();

        LOG_DEBUG("signal({}) failed: '{}'", sig, err.message());

        return err;
    }

    return prev_handler;
}

/// see raise(3)
/// returns success/failure; logs failure at debug level
inline Expected<> raise(Signal sig) {
    int res = ::raise(sig);

    if (res == -1) {
        auto err = make_error_code();

        LOG_DEBUG("raise({}) failed: '{}'", sig, err.message());

        return err;
    }

    return {};
}

} // namespace testconsole::linux
