#pragma once

#include "app/app.hpp"
#include "user/program_options.hpp"

#include <testconsole/framework/test_framework.hpp>

#include <optional>

namespace testconsole {

/// Runs the test specs of the command line: resolves them, applies sharding, runs them on the
/// worker pool with the requested listeners, and reports the number of failures as the exit status.
class ConsoleRunner final : public App
{
public:
    /// With ``call_exit_on_finish`` unset (e.g., within tests) a non-zero exit status is raised
    /// as ConsoleRunnerExit instead
    ConsoleRunner(ProgramOptions opts, TestFramework& framework, bool call_exit_on_finish = true);

    /// Returns the exit status, which is the number of failed tests.
    /// Throws ConsoleRunnerExit for a non-zero status if exiting is disabled.
    int run_tests();

    /// Status of the last run, if any
    std::optional<int> exit_status() const noexcept { return exit_status_; }

private:
    int run_impl() override { return run_tests(); }

    /// Returns the number of failures
    int execute();

    int finish(int status);

    bool should_colorize() const;

    TestFramework* framework_;
    bool call_exit_on_finish_;
    std::optional<int> exit_status_;
};

} // namespace testconsole
