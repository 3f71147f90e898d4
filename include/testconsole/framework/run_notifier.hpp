#pragma once

#include <testconsole/common/class_traits.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace testconsole {

/// Fans lifecycle events out to listeners and tallies them into a Result.
///
/// Every fire_* call is serialized under one lock, so listeners never observe two events at once
/// even when tests run on several workers.
class RunNotifier : NonMovable
{
public:
    void add_listener(std::shared_ptr<RunListener> listener);

    void fire_test_run_started(const Description& description);
    void fire_test_run_finished();

    void fire_test_started(const Description& description);
    void fire_test_finished(const Description& description);
    void fire_test_failure(const Failure& failure);
    void fire_test_ignored(const Description& description);

    /// Request that no further units be dispatched. Units already running are left to complete.
    void please_stop() noexcept { stop_requested_.store(true); }

    bool is_stop_requested() const noexcept { return stop_requested_.load(); }

    /// Snapshot of the result so far
    Result get_result() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<RunListener>> listeners_;
    Result result_;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
    std::atomic<bool> stop_requested_{false};
};

} // namespace testconsole
