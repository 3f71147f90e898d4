#pragma once

#include "output/sink.hpp"

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace testconsole {

/// Prints a character of progress per test, followed by a summary of the run:
///
///     ..E.I.
///     Time: 0.154
///     There was 1 failure:
///     1) test_foo(SomeTests)
///     expected 1 == 2
///
///     FAILURES!!!
///     Tests run: 5,  Failures: 1
class ConsoleListener : public RunListener
{
public:
    ConsoleListener(Sink& sink, bool colorize);

    void test_run_finished(const Result& result) override;
    void test_started(const Description& description) override;
    void test_failure(const Failure& failure) override;
    void test_ignored(const Description& description) override;

protected:
    void print_summary(const Result& result);

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const {
        if (!colorize_) {
            return fmt::format("{}", arg);
        }
        return fmt::format("{}", fmt::styled(arg, style));
    }

    /// Conditionally make a word singular or plural based on `count`
    ///
    /// Examples:
    ///  pluralize("test", 0) => "tests"
    ///  pluralize("failure", 1) => "failure"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    Sink& get_sink() noexcept { return *sink_; }

    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow);
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);

private:
    Sink* sink_;
    bool colorize_;
};

} // namespace testconsole
