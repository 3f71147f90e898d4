#pragma once

#include <testconsole/framework/description.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace testconsole {

struct Failure
{
    Description description;
    std::string message;
};

inline std::string format_as(const Failure& from) {
    return from.description.get_display_name() + ": " + from.message;
}

/// Aggregate outcome of a run. Counts only ever grow while a run is in progress.
class Result
{
public:
    int get_run_count() const noexcept { return run_count_; }
    int get_failure_count() const noexcept { return static_cast<int>(failures_.size()); }
    int get_ignore_count() const noexcept { return ignore_count_; }
    const std::vector<Failure>& get_failures() const noexcept { return failures_; }
    std::chrono::milliseconds get_run_time() const noexcept { return run_time_; }

    bool was_successful() const noexcept { return failures_.empty(); }

    void add_run() noexcept { ++run_count_; }
    void add_ignored() noexcept { ++ignore_count_; }
    void add_failure(Failure failure) { failures_.push_back(std::move(failure)); }
    void set_run_time(std::chrono::milliseconds run_time) noexcept { run_time_ = run_time; }

private:
    int run_count_{};
    int ignore_count_{};
    std::vector<Failure> failures_;
    std::chrono::milliseconds run_time_{};
};

/// Observer of the lifecycle events of a run.
///
/// Events for a single test are ordered: started -> (failure)? -> finished, or just ignored.
/// Calls are serialized by RunNotifier, but may arrive from any worker thread.
class RunListener
{
public:
    virtual ~RunListener() = default;

    virtual void test_run_started(const Description& /*description*/) {}
    virtual void test_run_finished(const Result& /*result*/) {}
    virtual void test_started(const Description& /*description*/) {}
    virtual void test_finished(const Description& /*description*/) {}
    virtual void test_failure(const Failure& /*failure*/) {}
    virtual void test_ignored(const Description& /*description*/) {}
};

/// Forwards every event, in registration order, to a list of listeners
class ForwardingListener : public RunListener
{
public:
    void add_listener(std::shared_ptr<RunListener> listener) { listeners_.push_back(std::move(listener)); }

    void test_run_started(const Description& description) override;
    void test_run_finished(const Result& result) override;
    void test_started(const Description& description) override;
    void test_finished(const Description& description) override;
    void test_failure(const Failure& failure) override;
    void test_ignored(const Description& description) override;

protected:
    const std::vector<std::shared_ptr<RunListener>>& get_listeners() const noexcept { return listeners_; }

private:
    std::vector<std::shared_ptr<RunListener>> listeners_;
};

} // namespace testconsole
