#pragma once

#include <testconsole/common/error_types.hpp>
#include <testconsole/common/expected.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/framework/test_framework.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace testconsole {

/// In-process test framework: test classes are registered up front (usually by the macros in
/// test_macros.hpp, through the global instance) and looked up by name.
///
/// Registration must be complete before a run starts; lookups and invocations afterwards are
/// read-only and safe from any thread.
class TestRegistry final : public TestFramework
{
public:
    TestRegistry() = default;

    /// The registry that TEST_CLASS / TEST_METHOD register into.
    /// Safe global singleton pattern (first intro. by Scott Meyers for C++, I think)
    static TestRegistry& get() noexcept;

    /// Registers a new class. Throws std::invalid_argument if the name is already taken.
    TestClassInfo& add_class(TestClassInfo test_class);

    /// Find the class by name, or register an empty default-constructed class under that name
    TestClassInfo& find_or_create_class(std::string_view class_name);

    /// Registers a name that fails whenever it is loaded, e.g. to model a class whose
    /// dependencies are missing (``LinkageError``) or whose static initialization throws.
    void add_unloadable_class(std::string class_name, ErrorKind kind, std::string message);

    std::vector<std::string_view> get_class_names() const;

    std::size_t get_num_registered() const noexcept { return registered_classes_.size(); }

    Expected<const TestClassInfo*, ClassLoadError> load_for_inspection(std::string_view class_name) override;

    MethodOutcome invoke(const TestClassInfo& test_class, const TestMethodInfo& method) override;

private:
    TestClassInfo* find_class(std::string_view class_name) const;

    std::vector<std::unique_ptr<TestClassInfo>> registered_classes_;
    std::unordered_map<std::string, ClassLoadError> unloadable_classes_;
};

} // namespace testconsole
