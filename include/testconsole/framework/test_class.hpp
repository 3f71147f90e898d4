#pragma once

#include <testconsole/common/formatters/macros.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace testconsole {

/// Whether a test class may share the worker pool with other units of the same class.
/// ``Default`` defers to the run-wide default-parallel policy.
enum class ParallelMode { Default, Parallel, Serial };

/// A test body. Fails by throwing (see AssertionFailure); returning normally is a pass.
using TestBody = std::function<void()>;

struct TestMethodInfo
{
    std::string name;
    bool is_public = true;
    bool is_test = true;
    bool ignored = false;

    TestBody body;
};

/// Type metadata of a test class, obtainable without running any of its code
struct TestClassInfo
{
    std::string name;

    bool is_interface = false;
    bool is_abstract = false;
    bool is_public = true;
    bool has_public_constructor = true;

    /// Implements the legacy (pre-annotation) test case interface
    bool is_legacy_test_case = false;
    /// Declares a custom runner, which is trusted to find its own tests
    bool has_custom_runner = false;

    ParallelMode parallel_mode = ParallelMode::Default;

    std::vector<TestMethodInfo> methods;

    const TestMethodInfo* find_method(const std::string& method_name) const;
};

/// The outcome of a single invocation of a test method
struct MethodOutcome
{
    enum Status { Passed, Failed, Ignored } status = Passed;

    /// Failure message; empty unless status == Failed
    std::string message;

    bool passed() const noexcept { return status == Passed; }
};

} // namespace testconsole

FMT_SERIALIZE_ENUM(::testconsole::ParallelMode, Default, Parallel, Serial);
FMT_SERIALIZE_ENUM(::testconsole::MethodOutcome::Status, Passed, Failed, Ignored);
