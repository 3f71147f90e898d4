#include <testconsole/framework/run_notifier.hpp>

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>
#include <testconsole/logging.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <utility>

namespace testconsole {

void RunNotifier::add_listener(std::shared_ptr<RunListener> listener) {
    std::lock_guard lock{mutex_};
    listeners_.push_back(std::move(listener));
}

void RunNotifier::fire_test_run_started(const Description& description) {
    std::lock_guard lock{mutex_};
    start_time_ = std::chrono::steady_clock::now();

    for (const auto& listener : listeners_) {
        listener->test_run_started(description);
    }
}

void RunNotifier::fire_test_run_finished() {
    std::lock_guard lock{mutex_};
    result_.set_run_time(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time_));

    for (const auto& listener : listeners_) {
        listener->test_run_finished(result_);
    }
}

void RunNotifier::fire_test_started(const Description& description) {
    std::lock_guard lock{mutex_};
    LOG_TRACE("Test started: {}", description);

    for (const auto& listener : listeners_) {
        listener->test_started(description);
    }
}

void RunNotifier::fire_test_finished(const Description& description) {
    std::lock_guard lock{mutex_};
    LOG_TRACE("Test finished: {}", description);
    result_.add_run();

    for (const auto& listener : listeners_) {
        listener->test_finished(description);
    }
}

void RunNotifier::fire_test_failure(const Failure& failure) {
    std::lock_guard lock{mutex_};
    LOG_DEBUG("Test failure: {}", failure);
    result_.add_failure(failure);

    for (const auto& listener : listeners_) {
        listener->test_failure(failure);
    }
}

void RunNotifier::fire_test_ignored(const Description& description) {
    std::lock_guard lock{mutex_};
    result_.add_ignored();

    for (const auto& listener : listeners_) {
        listener->test_ignored(description);
    }
}

Result RunNotifier::get_result() const {
    std::lock_guard lock{mutex_};
    return result_;
}

} // namespace testconsole
