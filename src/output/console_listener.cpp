#include "output/console_listener.hpp"

#include "common/time.hpp"
#include "output/sink.hpp"

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace testconsole {

ConsoleListener::ConsoleListener(Sink& sink, bool colorize)
    : sink_{&sink}
    , colorize_{colorize} {}

std::string ConsoleListener::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

void ConsoleListener::test_started(const Description& /*description*/) {
    sink_->write(".");
    sink_->flush();
}

void ConsoleListener::test_failure(const Failure& /*failure*/) {
    sink_->write(style_str('E', ERROR_STYLE));
    sink_->flush();
}

void ConsoleListener::test_ignored(const Description& /*description*/) {
    sink_->write(style_str('I', WARNING_STYLE));
    sink_->flush();
}

void ConsoleListener::test_run_finished(const Result& result) {
    print_summary(result);
}

void ConsoleListener::print_summary(const Result& result) {
    sink_->write(fmt::format("\nTime: {}\n", format_seconds(result.get_run_time())));

    const auto& failures = result.get_failures();

    if (!failures.empty()) {
        const std::size_t num_failures = failures.size();
        sink_->write(fmt::format("There {} {} {}:\n", num_failures == 1 ? "was" : "were", num_failures,
                                 pluralize("failure", num_failures)));

        for (std::size_t i = 0; i < num_failures; ++i) {
            sink_->write(fmt::format("{}) {}\n{}\n", i + 1, failures[i].description, failures[i].message));
        }
    }

    const auto num_run = static_cast<std::size_t>(result.get_run_count());

    if (result.was_successful()) {
        sink_->write(fmt::format("\n{} ({} {})\n", style_str("OK", SUCCESS_STYLE), num_run, pluralize("test", num_run)));
    } else {
        sink_->write(fmt::format("\n{}\nTests run: {},  Failures: {}\n", style_str("FAILURES!!!", ERROR_STYLE), num_run,
                                 result.get_failure_count()));
    }

    sink_->write("\n");
    sink_->flush();
}

} // namespace testconsole
