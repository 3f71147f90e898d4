#pragma once

#include <testconsole/common/class_traits.hpp>
#include <testconsole/framework/runner.hpp>

#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace testconsole {

class RunNotifier;

/// Runs requests on a fixed pool of worker threads.
///
/// Requests of serial classes never overlap with one another, nor with any other request of
/// their own class. Requests of parallel classes only share their class with other parallel requests.
class ConcurrentScheduler : NonMovable
{
public:
    /// ``num_threads == 1`` runs every request on the calling thread, in order
    ConcurrentScheduler(int num_threads, bool default_parallel);

    void run(std::vector<Request>& requests, RunNotifier& notifier);

    /// Prevent any request that has not yet been claimed from starting.
    /// Requests that are already running are left to complete.
    void request_stop() noexcept { stop_requested_.store(true); }

    bool is_stop_requested() const noexcept { return stop_requested_.load(); }

    /// Whether some request could not be run at all, due to an InitializationError
    bool initialization_failed() const noexcept { return initialization_failed_.load(); }

    int get_num_threads() const noexcept { return num_threads_; }

private:
    bool is_parallel(const Request& request) const noexcept;

    void run_one(Request& request, RunNotifier& notifier);

    /// Calls the request's runner, turning escaping exceptions into failures
    void run_guarded(Request& request, RunNotifier& notifier);

    int num_threads_;
    bool default_parallel_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> initialization_failed_{false};

    std::mutex serial_mutex_;

    /// Populated before any worker starts; never modified while running
    std::map<std::string, std::shared_mutex> class_locks_;
};

} // namespace testconsole
