#include "catch2_custom.hpp"

#include "runner/concurrent_scheduler.hpp"
#include "runner/request_builder.hpp"
#include "runner/retrying_invoker.hpp"
#include "runner/spec_resolver.hpp"
#include "runner/test_unit.hpp"
#include "test_helpers.hpp"

#include <testconsole/exceptions.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_notifier.hpp>
#include <testconsole/framework/runner.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/registry/test_registry.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace testconsole;
using namespace std::chrono_literals;

namespace {

/// Tracks how many test bodies are running at once
class ConcurrencyProbe
{
public:
    TestBody body() {
        return [this] {
            const int now_active = ++active_;

            int prev_max = max_active_.load();
            while (prev_max < now_active && !max_active_.compare_exchange_weak(prev_max, now_active)) {
            }

            std::this_thread::sleep_for(5ms);
            --active_;
        };
    }

    int get_max_active() const { return max_active_.load(); }

private:
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
};

/// Runner that throws whatever it is given
class ThrowingRunner final : public Runner
{
public:
    explicit ThrowingRunner(bool initialization_error)
        : initialization_error_{initialization_error} {}

    Description get_description() override { return Description::create_class("Throwing"); }

    void run(RunNotifier& /*notifier*/) override {
        if (initialization_error_) {
            throw InitializationError("no runnable methods");
        }
        throw std::out_of_range("bad index");
    }

    void filter(std::shared_ptr<Filter> /*filter*/) override {}

    void sort(DescriptionOrder /*order*/) override {}

private:
    bool initialization_error_;
};

struct SchedulerFixture
{
    TestRegistry registry;
    std::ostringstream err;
    std::shared_ptr<const RetryingInvoker> invoker = std::make_shared<const RetryingInvoker>(registry, 0, err);

    std::shared_ptr<testing::RecordingListener> recorder = std::make_shared<testing::RecordingListener>();
    RunNotifier notifier;

    SchedulerFixture() { notifier.add_listener(recorder); }

    void add_probed_class(const std::string& name, ConcurrencyProbe& probe, ParallelMode mode, int num_methods = 3) {
        TestClassInfo info{.name = name, .parallel_mode = mode};
        for (int i = 0; i < num_methods; ++i) {
            info.methods.push_back(TestMethodInfo{.name = "m" + std::to_string(i), .body = probe.body()});
        }
        registry.add_class(std::move(info));
    }

    std::vector<Request> requests_for(const std::vector<std::string>& specs) {
        std::ostringstream console;
        return build_requests(SpecResolver{registry, console}.resolve(specs), invoker, true);
    }
};

} // namespace

TEST_CASE("Schedulers need at least one thread") {
    REQUIRE_THROWS_AS(ConcurrentScheduler(0, false), std::invalid_argument);
    REQUIRE(ConcurrentScheduler(3, false).get_num_threads() == 3);
}

TEST_CASE_METHOD(SchedulerFixture, "A single thread runs requests in order") {
    testing::add_class(registry, "B", {"b1"});
    testing::add_class(registry, "A", {"a1"});
    testing::add_class(registry, "C", {"c1"});

    auto requests = requests_for({"B", "A", "C"});

    ConcurrentScheduler scheduler{1, true};
    scheduler.run(requests, notifier);

    REQUIRE(recorder->get_events() == std::vector<std::string>{"started: b1(B)", "finished: b1(B)", "started: a1(A)",
                                                               "finished: a1(A)", "started: c1(C)", "finished: c1(C)"});
}

TEST_CASE_METHOD(SchedulerFixture, "Every request runs exactly once on a pool") {
    for (int i = 0; i < 10; ++i) {
        testing::add_class(registry, fmt::format("C{}", i), {"one", "two"}, {"two"});
    }

    std::vector<std::string> specs;
    for (int i = 0; i < 10; ++i) {
        specs.push_back(fmt::format("C{}", i));
    }
    auto requests = requests_for(specs);

    ConcurrentScheduler scheduler{4, true};
    scheduler.run(requests, notifier);

    REQUIRE(recorder->count_prefixed("started: ") == 20);
    REQUIRE(recorder->count_prefixed("finished: ") == 20);
    REQUIRE(recorder->count_prefixed("failure: ") == 10);

    const auto result = notifier.get_result();
    REQUIRE(result.get_run_count() == 20);
    REQUIRE(result.get_failure_count() == 10);
}

TEST_CASE_METHOD(SchedulerFixture, "Serial requests never overlap") {
    ConcurrencyProbe probe;
    for (int i = 0; i < 6; ++i) {
        add_probed_class(fmt::format("S{}", i), probe, ParallelMode::Serial);
    }

    auto requests = requests_for({"S0", "S1", "S2", "S3", "S4", "S5", "S0#m0", "S3#m1"});

    ConcurrentScheduler scheduler{4, true};
    scheduler.run(requests, notifier);

    REQUIRE(probe.get_max_active() == 1);
    REQUIRE(notifier.get_result().get_run_count() == 20);
}

TEST_CASE_METHOD(SchedulerFixture, "Default-mode requests follow the default-parallel policy") {
    ConcurrencyProbe probe;
    for (int i = 0; i < 4; ++i) {
        add_probed_class(fmt::format("D{}", i), probe, ParallelMode::Default);
    }

    auto requests = requests_for({"D0", "D1", "D2", "D3"});

    ConcurrentScheduler scheduler{4, false};
    scheduler.run(requests, notifier);

    REQUIRE(probe.get_max_active() == 1);
}

TEST_CASE_METHOD(SchedulerFixture, "Parallel requests of a class wait for its serial requests") {
    ConcurrencyProbe probe;
    add_probed_class("P", probe, ParallelMode::Parallel, 2);

    // Same class, but scheduled serially by hand
    std::vector<Request> requests = requests_for({"P", "P#m0", "P#m1"});
    requests[0].parallel_mode = ParallelMode::Serial;

    ConcurrentScheduler scheduler{3, true};
    scheduler.run(requests, notifier);

    REQUIRE(notifier.get_result().get_run_count() == 4);
    // The serial request holds the class exclusively, so at most the two parallel ones overlap
    REQUIRE(probe.get_max_active() <= 2);
}

TEST_CASE_METHOD(SchedulerFixture, "No further requests start once a stop is requested") {
    testing::add_class(registry, "A", {"a1"});
    testing::add_class(registry, "B", {"b1"});
    testing::add_class(registry, "C", {"c1"});

    auto requests = requests_for({"A", "B", "C"});

    ConcurrentScheduler scheduler{1, false};

    // Stop as soon as the first test finishes
    class StopAfterFirst final : public RunListener
    {
    public:
        explicit StopAfterFirst(ConcurrentScheduler& scheduler)
            : scheduler_{&scheduler} {}

        void test_finished(const Description& /*description*/) override { scheduler_->request_stop(); }

    private:
        ConcurrentScheduler* scheduler_;
    };
    notifier.add_listener(std::make_shared<StopAfterFirst>(scheduler));

    scheduler.run(requests, notifier);

    REQUIRE(scheduler.is_stop_requested());
    REQUIRE(recorder->get_events() == std::vector<std::string>{"started: a1(A)", "finished: a1(A)"});
}

TEST_CASE_METHOD(SchedulerFixture, "Exceptions escaping a runner are contained") {
    testing::add_class(registry, "A", {"a1"});

    std::vector<Request> requests;
    requests.push_back(Request{.runner = std::make_unique<ThrowingRunner>(false), .class_name = "Throwing"});
    requests.push_back(Request{.runner = std::make_unique<ThrowingRunner>(true), .class_name = "Throwing"});
    for (auto& request : requests_for({"A"})) {
        requests.push_back(std::move(request));
    }

    ConcurrentScheduler scheduler{GENERATE(1, 2), false};
    scheduler.run(requests, notifier);

    REQUIRE(scheduler.initialization_failed());
    REQUIRE(recorder->count_prefixed("failure: Throwing: std::out_of_range: bad index") == 1);
    REQUIRE(recorder->count_prefixed("finished: a1(A)") == 1);
}
