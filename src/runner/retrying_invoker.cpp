#include "runner/retrying_invoker.hpp"

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/framework/test_framework.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <mutex>
#include <ostream>
#include <stdexcept>

namespace testconsole {

RetryingInvoker::RetryingInvoker(TestFramework& framework, int num_retries, std::ostream& err)
    : framework_{&framework}
    , num_retries_{num_retries}
    , err_{&err} {
    if (num_retries < 0) {
        throw std::invalid_argument(fmt::format("Number of retries cannot be negative (got {})", num_retries));
    }
}

MethodOutcome RetryingInvoker::invoke(const TestClassInfo& test_class, const TestMethodInfo& method,
                                      const Description& description) const {
    const int max_attempts = num_retries_ + 1;

    MethodOutcome outcome;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        outcome = framework_->invoke(test_class, method);

        if (outcome.status != MethodOutcome::Failed) {
            if (attempt > 1) {
                LOG_DEBUG("{} passed on attempt {} of {}", description, attempt, max_attempts);
            }
            return outcome;
        }

        if (attempt < max_attempts) {
            std::lock_guard lock{err_mutex_};
            fmt::print(*err_, "Test {} failed (attempt {} of {}), retrying: {}\n", description, attempt, max_attempts,
                       outcome.message);
            err_->flush();
        }
    }

    return outcome;
}

} // namespace testconsole
