#include "runner/concurrent_scheduler.hpp"

#include <testconsole/exceptions.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_notifier.hpp>
#include <testconsole/framework/runner.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/logging.hpp>

#include <boost/core/demangle.hpp>
#include <fmt/format.h>
#include <gsl/util>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <thread>
#include <typeinfo>
#include <vector>

namespace testconsole {

ConcurrentScheduler::ConcurrentScheduler(int num_threads, bool default_parallel)
    : num_threads_{num_threads}
    , default_parallel_{default_parallel} {
    if (num_threads < 1) {
        throw std::invalid_argument(fmt::format("Scheduler requires at least 1 thread (got {})", num_threads));
    }
}

bool ConcurrentScheduler::is_parallel(const Request& request) const noexcept {
    switch (request.parallel_mode) {
    case ParallelMode::Parallel:
        return true;
    case ParallelMode::Serial:
        return false;
    case ParallelMode::Default:
    default:
        return default_parallel_;
    }
}

void ConcurrentScheduler::run(std::vector<Request>& requests, RunNotifier& notifier) {
    for (const Request& request : requests) {
        class_locks_.try_emplace(request.class_name);
    }

    if (num_threads_ == 1) {
        LOG_DEBUG("Running {} requests sequentially", requests.size());

        for (Request& request : requests) {
            if (is_stop_requested()) {
                LOG_DEBUG("Stop requested; not starting remaining requests");
                break;
            }
            run_one(request, notifier);
        }
        return;
    }

    const std::size_t num_workers = std::min(static_cast<std::size_t>(num_threads_), requests.size());
    LOG_DEBUG("Running {} requests on {} worker threads", requests.size(), num_workers);

    std::atomic<std::size_t> next_request{0};

    auto worker = [&] {
        while (!is_stop_requested()) {
            const std::size_t idx = next_request.fetch_add(1);
            if (idx >= requests.size()) {
                break;
            }
            run_one(requests[idx], notifier);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(num_workers);

    {
        // Join every worker, even if spawning a later one throws
        auto join_all = gsl::finally([&workers] {
            for (std::thread& thread : workers) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        });

        for (std::size_t i = 0; i < num_workers; ++i) {
            workers.emplace_back(worker);
        }
    }
}

void ConcurrentScheduler::run_one(Request& request, RunNotifier& notifier) {
    std::shared_mutex& class_lock = class_locks_.at(request.class_name);

    if (is_parallel(request)) {
        std::shared_lock lock{class_lock};
        run_guarded(request, notifier);
    } else {
        std::scoped_lock lock{serial_mutex_, class_lock};
        run_guarded(request, notifier);
    }
}

void ConcurrentScheduler::run_guarded(Request& request, RunNotifier& notifier) {
    try {
        request.runner->run(notifier);
    } catch (const InitializationError& ex) {
        LOG_ERROR("Could not run {}: {}", request.class_name, ex.what());
        initialization_failed_.store(true);
    } catch (const std::exception& ex) {
        const Description description = request.runner->get_description();
        LOG_DEBUG("Unexpected exception escaped the runner of {}: {}", description, ex.what());

        notifier.fire_test_failure(Failure{
            .description = description,
            .message = fmt::format("{}: {}", boost::core::demangle(typeid(ex).name()), ex.what())});
    }
}

} // namespace testconsole
