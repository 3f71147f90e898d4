#include "app/console_runner.hpp"

#include "capture/stream_capturing_listener.hpp"
#include "capture/swappable_stream.hpp"
#include "common/terminal_checks.hpp"
#include "output/console_listener.hpp"
#include "output/ostream_sink.hpp"
#include "output/per_class_console_listener.hpp"
#include "output/xml_report_listener.hpp"
#include "runner/abortable_listener.hpp"
#include "runner/concurrent_scheduler.hpp"
#include "runner/request_builder.hpp"
#include "runner/retrying_invoker.hpp"
#include "runner/shard_filter.hpp"
#include "runner/spec_resolver.hpp"
#include "user/program_options.hpp"

#include <testconsole/exceptions.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_notifier.hpp>
#include <testconsole/framework/runner.hpp>
#include <testconsole/framework/test_framework.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

namespace testconsole {

ConsoleRunner::ConsoleRunner(ProgramOptions opts, TestFramework& framework, bool call_exit_on_finish)
    : App{std::move(opts)}
    , framework_{&framework}
    , call_exit_on_finish_{call_exit_on_finish} {}

bool ConsoleRunner::should_colorize() const {
    using enum ProgramOptions::ColorizeOpt;

    switch (OPTS.colorize_option) {
    case Always:
        return true;
    case Never:
        return false;
    case Auto:
    default:
        return in_terminal(stdout) && is_color_terminal();
    }
}

int ConsoleRunner::run_tests() {
    return finish(execute());
}

int ConsoleRunner::execute() {
    // Everything tests write goes through these, to be redirected while output is captured.
    // The runner itself writes to the original streams.
    SwappableStream swappable_out{std::cout};
    SwappableStream swappable_err{std::cerr};
    std::ostream& console_out = swappable_out.original_stream();
    std::ostream& console_err = swappable_err.original_stream();
    OstreamSink console_sink{console_out};

    const ResolvedSpecs specs = SpecResolver{*framework_, console_out}.resolve(OPTS.tests);

    auto invoker = std::make_shared<const RetryingInvoker>(*framework_, OPTS.num_retries, console_err);

    const bool request_per_class = OPTS.per_test_timer || OPTS.parallel_threads > 1;
    std::vector<Request> requests = build_requests(specs, invoker, request_per_class);

    if (OPTS.test_shard) {
        apply_shard_filter(requests,
                           std::make_shared<ShardFilter>(OPTS.test_shard->index, OPTS.test_shard->count));
    }

    RunNotifier notifier;
    ConcurrentScheduler scheduler{OPTS.parallel_threads, OPTS.default_parallel};

    auto abortable_listener = std::make_shared<AbortableListener>(OPTS.fail_fast, [&](const Result& result) {
        LOG_DEBUG("Stopping run with {} failures", result.get_failure_count());
        scheduler.request_stop();
        notifier.please_stop();
    });
    notifier.add_listener(abortable_listener);

    std::shared_ptr<StreamCapturingListener> capturing_listener;

    if (OPTS.xml_report || OPTS.suppress_output) {
        std::filesystem::create_directories(OPTS.outdir);

        capturing_listener = std::make_shared<StreamCapturingListener>(OPTS.outdir, swappable_out, swappable_err);
        abortable_listener->add_listener(capturing_listener);

        if (OPTS.xml_report) {
            abortable_listener->add_listener(std::make_shared<XmlReportListener>(OPTS.outdir, capturing_listener.get()));
        }
    }

    if (OPTS.per_test_timer) {
        abortable_listener->add_listener(std::make_shared<PerClassConsoleListener>(console_sink, should_colorize()));
    } else {
        abortable_listener->add_listener(std::make_shared<ConsoleListener>(console_sink, should_colorize()));
    }

    const Description root =
        Description::create_suite("", requests | ranges::views::transform([](Request& request) {
                                          return request.runner->get_description();
                                      }) | ranges::to<std::vector>());

    AbnormalExitGuard abnormal_exit_guard{*abortable_listener};

    notifier.fire_test_run_started(root);
    scheduler.run(requests, notifier);
    notifier.fire_test_run_finished();

    abnormal_exit_guard.complete();

    if (scheduler.initialization_failed()) {
        return 1;
    }

    return notifier.get_result().get_failure_count();
}

int ConsoleRunner::finish(int status) {
    exit_status_ = status;

    if (!call_exit_on_finish_ && status != 0) {
        throw ConsoleRunnerExit(status);
    }

    return status;
}

} // namespace testconsole
