#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace testconsole {

/// A test spec could not be loaded or linked. Always fatal for the whole run.
class SpecResolutionError : public std::runtime_error
{
public:
    SpecResolutionError(std::string spec, const std::string& cause)
        : std::runtime_error{fmt::format("Classloading error during test discovery for {}: {}", spec, cause)}
        , spec_{std::move(spec)} {}

    const std::string& get_spec() const { return spec_; }

private:
    std::string spec_;
};

/// A test class (or suite) cannot be run at all, e.g. it declares no runnable methods
class InitializationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Output capture files could not be created or opened
class CaptureError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// A capture was used in a state that its lifecycle does not permit (e.g., read before close)
class CaptureStateError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

/// Thrown instead of exiting the process when the runner is used as a library (i.e., within tests)
class ConsoleRunnerExit : public std::runtime_error
{
public:
    explicit ConsoleRunnerExit(int status)
        : std::runtime_error{fmt::format("ConsoleRunner exited with status {}", status)}
        , status_{status} {}

    int get_status() const { return status_; }

private:
    int status_;
};

/// Raised by test bodies to signal a failed check. Any other exception escaping a test is a test error.
class AssertionFailure : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace testconsole
