#pragma once

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/framework/test_framework.hpp>

#include <mutex>
#include <ostream>

namespace testconsole {

/// Invokes test methods through the framework, re-attempting each failing method up to
/// ``num_retries`` more times. Only the outcome of the last attempt is returned, so a method that
/// eventually passes is reported as passed, and one that never does is reported failed once.
///
/// Shared by every runner of a run; safe to use from several workers at once.
class RetryingInvoker
{
public:
    /// Retried attempts are reported on ``err``
    RetryingInvoker(TestFramework& framework, int num_retries, std::ostream& err);

    MethodOutcome invoke(const TestClassInfo& test_class, const TestMethodInfo& method,
                         const Description& description) const;

    int get_num_retries() const noexcept { return num_retries_; }

    TestFramework& get_framework() const noexcept { return *framework_; }

private:
    TestFramework* framework_;
    int num_retries_;

    std::ostream* err_;
    mutable std::mutex err_mutex_;
};

} // namespace testconsole
