#pragma once

#include <testconsole/common/class_traits.hpp>
#include <testconsole/common/linux.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>

#include <gsl/util>

#include <array>
#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace testconsole {

/// Forwards events to its listeners, while keeping its own tally of the run so that the run can
/// be cut short at any time, either on the first failure (fail fast), or on abnormal termination.
///
/// Every event is forwarded under one lock, so an abort from another thread (or from a signal
/// handler) never interleaves with events of tests still in flight.
class AbortableListener final : public ForwardingListener
{
public:
    /// Called with the tally so far when the run should stop dispatching tests
    using AbortCallback = std::function<void(const Result&)>;

    static constexpr std::string_view ABNORMAL_EXIT_MESSAGE = "Abnormal exit - test crashed.";

    AbortableListener(bool fail_fast, AbortCallback on_abort);

    void test_run_started(const Description& description) override;
    void test_run_finished(const Result& result) override;
    void test_started(const Description& description) override;
    void test_finished(const Description& description) override;
    void test_failure(const Failure& failure) override;
    void test_ignored(const Description& description) override;

    /// Terminate the run due to ``error``. Records a synthetic failure, and finishes the run for
    /// every listener so that they can flush their reports.
    /// Only the first call has any effect, and none does once the run has finished normally.
    void abort(std::string_view error);

    /// Tally of the events seen so far
    Result get_result() const;

    bool is_fail_fast() const noexcept { return fail_fast_; }

    bool was_aborted() const noexcept { return aborted_.load(); }

private:
    /// Once aborted or finished, no further event reaches the listeners
    bool is_closed() const noexcept { return aborted_.load() || run_finished_.load(); }

    bool fail_fast_;
    AbortCallback on_abort_;

    // Recursive, since abort may be reached from a fatal signal raised while handling an event,
    // and the fail fast callback may fire further events
    mutable std::recursive_mutex mutex_;
    Result result_;
    std::optional<Description> run_description_;

    std::atomic<bool> fail_fast_triggered_{false};
    std::atomic<bool> aborted_{false};
    std::atomic<bool> run_finished_{false};
};

/// Guarantees that a run which is left abnormally is reported through AbortableListener::abort.
///
/// That is, an exception unwinding through the guarded scope, std::terminate, or a fatal signal
/// (SIGSEGV, SIGABRT, SIGBUS, SIGFPE, SIGILL). Signals and terminate still end the process
/// afterwards. Call complete() at the end of a normal run to remove the hook.
///
/// Only one guard may be active at a time.
class AbnormalExitGuard : NonMovable
{
public:
    explicit AbnormalExitGuard(AbortableListener& listener);

    ~AbnormalExitGuard();

    /// The run finished normally; uninstalls every handler
    void complete();

private:
    void uninstall_handlers();

    static void on_terminate();
    static void on_fatal_signal(int signal_num);

    static constexpr std::array FATAL_SIGNALS{SIGSEGV, SIGABRT, SIGBUS, SIGFPE, SIGILL};

    static std::atomic<AbortableListener*> active_listener_; // NOLINT(*-avoid-non-const-global-variables)

    AbortableListener* listener_;
    bool completed_ = false;
    bool handlers_installed_ = false;

    std::terminate_handler prev_terminate_handler_ = nullptr;
    std::array<linux::SignalHandlerT, FATAL_SIGNALS.size()> prev_signal_handlers_{};

    gsl::final_action<std::function<void()>> abort_on_exit_;
};

} // namespace testconsole
