#include "runner/abortable_listener.hpp"

#include <testconsole/common/linux.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <array>
#include <atomic>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace testconsole {

AbortableListener::AbortableListener(bool fail_fast, AbortCallback on_abort)
    : fail_fast_{fail_fast}
    , on_abort_{std::move(on_abort)} {}

void AbortableListener::test_run_started(const Description& description) {
    std::lock_guard lock{mutex_};
    if (is_closed()) {
        return;
    }
    run_description_ = description;
    ForwardingListener::test_run_started(description);
}

void AbortableListener::test_run_finished(const Result& result) {
    std::lock_guard lock{mutex_};
    if (aborted_.load() || run_finished_.exchange(true)) {
        return;
    }
    result_.set_run_time(result.get_run_time());
    ForwardingListener::test_run_finished(result);
}

void AbortableListener::test_started(const Description& description) {
    std::lock_guard lock{mutex_};
    if (is_closed()) {
        return;
    }
    ForwardingListener::test_started(description);
}

void AbortableListener::test_finished(const Description& description) {
    std::lock_guard lock{mutex_};
    if (is_closed()) {
        return;
    }
    result_.add_run();
    ForwardingListener::test_finished(description);
}

void AbortableListener::test_failure(const Failure& failure) {
    std::lock_guard lock{mutex_};
    if (is_closed()) {
        return;
    }
    result_.add_failure(failure);
    ForwardingListener::test_failure(failure);

    if (fail_fast_ && !fail_fast_triggered_.exchange(true)) {
        LOG_DEBUG("Failing fast after {}", failure.description);
        if (on_abort_) {
            on_abort_(result_);
        }
    }
}

void AbortableListener::test_ignored(const Description& description) {
    std::lock_guard lock{mutex_};
    if (is_closed()) {
        return;
    }
    result_.add_ignored();
    ForwardingListener::test_ignored(description);
}

void AbortableListener::abort(std::string_view error) {
    std::lock_guard lock{mutex_};

    if (run_finished_.load() || aborted_.exchange(true)) {
        return;
    }

    LOG_ERROR("Aborting run: {}", error);

    const Description description = run_description_.value_or(Description::create_suite("", {}));
    Failure failure{.description = description, .message = std::string{error}};
    result_.add_failure(failure);
    ForwardingListener::test_failure(failure);

    run_finished_.store(true);
    ForwardingListener::test_run_finished(result_);

    if (on_abort_) {
        on_abort_(result_);
    }
}

Result AbortableListener::get_result() const {
    std::lock_guard lock{mutex_};
    return result_;
}

std::atomic<AbortableListener*> AbnormalExitGuard::active_listener_{nullptr};

AbnormalExitGuard::AbnormalExitGuard(AbortableListener& listener)
    : listener_{&listener}
    , abort_on_exit_{gsl::finally(std::function<void()>{[this] {
        if (!completed_) {
            listener_->abort(AbortableListener::ABNORMAL_EXIT_MESSAGE);
        }
    }})} {
    AbortableListener* expected = nullptr;
    bool installed = active_listener_.compare_exchange_strong(expected, listener_);
    ASSERT(installed, "Only one AbnormalExitGuard may be active at a time");

    prev_terminate_handler_ = std::set_terminate(&AbnormalExitGuard::on_terminate);

    for (std::size_t i = 0; i < FATAL_SIGNALS.size(); ++i) {
        const int sig = FATAL_SIGNALS[i];

        if (auto res = linux::signal(sig, &AbnormalExitGuard::on_fatal_signal); res) {
            prev_signal_handlers_[i] = res.value();
        } else {
            LOG_WARN("Could not install handler for {}: {}", linux::Signal{sig}, res.error().message());
            prev_signal_handlers_[i] = SIG_DFL;
        }
    }

    handlers_installed_ = true;
}

AbnormalExitGuard::~AbnormalExitGuard() {
    uninstall_handlers();
}

void AbnormalExitGuard::complete() {
    completed_ = true;
    uninstall_handlers();
}

void AbnormalExitGuard::uninstall_handlers() {
    if (!handlers_installed_) {
        return;
    }

    std::set_terminate(prev_terminate_handler_);

    for (std::size_t i = 0; i < FATAL_SIGNALS.size(); ++i) {
        const int sig = FATAL_SIGNALS[i];

        if (auto res = linux::signal(sig, prev_signal_handlers_[i]); !res) {
            LOG_WARN("Could not restore handler for {}: {}", linux::Signal{sig}, res.error().message());
        }
    }

    active_listener_.store(nullptr);
    handlers_installed_ = false;
}

void AbnormalExitGuard::on_terminate() {
    if (AbortableListener* listener = active_listener_.exchange(nullptr)) {
        std::string message{AbortableListener::ABNORMAL_EXIT_MESSAGE};

        if (std::exception_ptr current = std::current_exception()) {
            try {
                std::rethrow_exception(current);
            } catch (const std::exception& ex) {
                message = fmt::format("{} (uncaught exception: {})", AbortableListener::ABNORMAL_EXIT_MESSAGE, ex.what());
            } catch (...) {
                message = fmt::format("{} (uncaught exception of unknown type)", AbortableListener::ABNORMAL_EXIT_MESSAGE);
            }
        }

        listener->abort(message);
    }

    std::abort();
}

void AbnormalExitGuard::on_fatal_signal(int signal_num) {
    if (AbortableListener* listener = active_listener_.exchange(nullptr)) {
        listener->abort(fmt::format("{} ({})", AbortableListener::ABNORMAL_EXIT_MESSAGE, linux::Signal{signal_num}));
    }

    // Die by the same signal, so that the parent sees the real cause
    if (!linux::signal(signal_num, SIG_DFL) || !linux::raise(signal_num)) {
        std::_Exit(128 + signal_num);
    }
}

} // namespace testconsole
