#include <testconsole/framework/run_listener.hpp>

#include <testconsole/framework/description.hpp>

namespace testconsole {

void ForwardingListener::test_run_started(const Description& description) {
    for (const auto& listener : listeners_) {
        listener->test_run_started(description);
    }
}

void ForwardingListener::test_run_finished(const Result& result) {
    for (const auto& listener : listeners_) {
        listener->test_run_finished(result);
    }
}

void ForwardingListener::test_started(const Description& description) {
    for (const auto& listener : listeners_) {
        listener->test_started(description);
    }
}

void ForwardingListener::test_finished(const Description& description) {
    for (const auto& listener : listeners_) {
        listener->test_finished(description);
    }
}

void ForwardingListener::test_failure(const Failure& failure) {
    for (const auto& listener : listeners_) {
        listener->test_failure(failure);
    }
}

void ForwardingListener::test_ignored(const Description& description) {
    for (const auto& listener : listeners_) {
        listener->test_ignored(description);
    }
}

} // namespace testconsole
