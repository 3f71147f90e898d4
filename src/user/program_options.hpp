#pragma once

#include <testconsole/common/expected.hpp>
#include <testconsole/common/formatters/debug.hpp>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace testconsole {

/// Run a static subset of tests: every ``count``-th test, starting from the ``index``-th (0-based)
struct TestShard
{
    int index{};
    int count{};

    bool operator==(const TestShard& rhs) const = default;
};

inline std::string format_as(const TestShard& from) {
    return fmt::format("{}/{}", from.index, from.count);
}

struct ProgramOptions
{
    // ###### Argument fields

    /// Test specs, ``ClassName`` or ``ClassName#method``, with arg files already expanded
    std::vector<std::string> tests;

    /// Stop dispatching tests after the first failure
    bool fail_fast = false;

    /// Capture test output into files in ``outdir``, instead of printing it
    bool suppress_output = false;

    /// Write Ant compatible JUnit XML reports into ``outdir``
    bool xml_report = false;

    /// Only used if ``suppress_output`` or ``xml_report`` is set
    std::filesystem::path outdir = std::filesystem::temp_directory_path();

    /// Show progress and timing per test class
    bool per_test_timer = false;

    /// Whether test classes without a parallel marker run in parallel
    bool default_parallel = false;

    /// Size of the worker pool. 1 runs all tests serially on the main thread.
    int parallel_threads = 1;

    std::optional<TestShard> test_shard;

    /// Retries for each failing test method
    int num_retries = 0;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // ###### Argument defaults

    static constexpr int DEFAULT_PARALLEL_THREADS = 1;
    static constexpr int DEFAULT_NUM_RETRIES = 0;

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        if (tests.empty()) {
            return std::string{"No tests specified"};
        }

        if (parallel_threads < 1) {
            return fmt::format("-parallel-threads must be positive (got {})", parallel_threads);
        }

        if (num_retries < 0) {
            return fmt::format("-num-retries cannot be negative (got {})", num_retries);
        }

        if (test_shard && (test_shard->index < 0 || test_shard->count <= 0 || test_shard->index >= test_shard->count)) {
            return fmt::format("0 <= M < N is required in -test-shard M/N (got {})", *test_shard);
        }

        return {};
    }
};

} // namespace testconsole

template <>
struct fmt::formatter<::testconsole::ProgramOptions> : ::testconsole::DebugFormatter
{
    auto format(const ::testconsole::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{tests={}, fail_fast={}, suppress_output={}, xml_report={}, outdir={}, "
                              "per_test_timer={}, default_parallel={}, parallel_threads={}, test_shard={}, "
                              "num_retries={}, color_opt={}}}",
                              from.tests, from.fail_fast, from.suppress_output, from.xml_report, from.outdir,
                              from.per_test_timer, from.default_parallel, from.parallel_threads,
                              from.test_shard ? format_as(*from.test_shard) : std::string{"none"},
                              from.num_retries, fmt::underlying(from.colorize_option));
    }
};
