#include "output/per_class_console_listener.hpp"

#include "common/time.hpp"
#include "output/console_listener.hpp"
#include "output/sink.hpp"

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>

#include <fmt/format.h>

#include <chrono>
#include <string>

namespace testconsole {

PerClassConsoleListener::PerClassConsoleListener(Sink& sink, bool colorize)
    : ConsoleListener{sink, colorize} {}

void PerClassConsoleListener::count_tests(const Description& description) {
    if (description.is_test()) {
        ++classes_[description.get_class_name()].remaining;
        return;
    }

    for (const Description& child : description.get_children()) {
        count_tests(child);
    }
}

PerClassConsoleListener::ClassProgress& PerClassConsoleListener::get_progress(const std::string& class_name) {
    ClassProgress& progress = classes_[class_name];

    if (!progress.started) {
        progress.started = true;
        progress.start_time = std::chrono::steady_clock::now();
    }

    return progress;
}

void PerClassConsoleListener::test_run_started(const Description& description) {
    count_tests(description);
}

void PerClassConsoleListener::test_started(const Description& description) {
    get_progress(description.get_class_name()).marks += '.';
}

void PerClassConsoleListener::test_failure(const Failure& failure) {
    get_progress(failure.description.get_class_name()).marks += style_str('E', ERROR_STYLE);
}

void PerClassConsoleListener::test_ignored(const Description& description) {
    get_progress(description.get_class_name()).marks += style_str('I', WARNING_STYLE);
    complete_test(description.get_class_name());
}

void PerClassConsoleListener::test_finished(const Description& description) {
    complete_test(description.get_class_name());
}

void PerClassConsoleListener::complete_test(const std::string& class_name) {
    ClassProgress& progress = get_progress(class_name);

    if (--progress.remaining <= 0) {
        print_class(class_name, progress);
        classes_.erase(class_name);
    }
}

void PerClassConsoleListener::print_class(const std::string& class_name, const ClassProgress& progress) {
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - progress.start_time);

    get_sink().write(fmt::format("{} {} ({}s)\n", class_name, progress.marks, format_seconds(elapsed)));
    get_sink().flush();
}

void PerClassConsoleListener::test_run_finished(const Result& result) {
    // Classes cut short, e.g. by failing fast
    for (const auto& [class_name, progress] : classes_) {
        if (progress.started) {
            print_class(class_name, progress);
        }
    }
    classes_.clear();

    print_summary(result);
}

} // namespace testconsole
