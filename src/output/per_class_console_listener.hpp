#pragma once

#include "output/console_listener.hpp"
#include "output/sink.hpp"

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>

#include <chrono>
#include <map>
#include <string>

namespace testconsole {

/// Prints one line of progress per test class, with how long the class took, once all of its
/// tests have completed:
///
///     SomeTests ..E. (0.102s)
///
/// Lines of classes running in parallel never interleave.
class PerClassConsoleListener final : public ConsoleListener
{
public:
    PerClassConsoleListener(Sink& sink, bool colorize);

    void test_run_started(const Description& description) override;
    void test_run_finished(const Result& result) override;
    void test_started(const Description& description) override;
    void test_finished(const Description& description) override;
    void test_failure(const Failure& failure) override;
    void test_ignored(const Description& description) override;

private:
    struct ClassProgress
    {
        int remaining{};
        bool started{};
        std::chrono::steady_clock::time_point start_time;
        std::string marks;
    };

    void count_tests(const Description& description);

    ClassProgress& get_progress(const std::string& class_name);

    /// Decrement the outstanding tests of the class, printing its line once none remain
    void complete_test(const std::string& class_name);

    void print_class(const std::string& class_name, const ClassProgress& progress);

    std::map<std::string, ClassProgress> classes_;
};

} // namespace testconsole
