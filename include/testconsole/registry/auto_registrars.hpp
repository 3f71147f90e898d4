#pragma once

#include <testconsole/framework/test_class.hpp>
#include <testconsole/registry/test_registry.hpp>

#include <string_view>

namespace testconsole {

/// Helper class that, when constructed, registers (or updates) a test class in the global registry
class ClassAutoRegistrar
{
public:
    explicit ClassAutoRegistrar(std::string_view class_name, ParallelMode parallel_mode = ParallelMode::Default) {
        TestRegistry::get().find_or_create_class(class_name).parallel_mode = parallel_mode;
    }
};

/// Helper class that, when constructed, adds a test method to a class in the global registry.
/// The class is created if it was not declared (yet) with TEST_CLASS.
class MethodAutoRegistrar
{
public:
    MethodAutoRegistrar(std::string_view class_name, std::string_view method_name, bool ignored,
                        void (*body)()) {
        TestRegistry::get().find_or_create_class(class_name).methods.push_back(
            TestMethodInfo{.name = std::string{method_name}, .ignored = ignored, .body = body});
    }
};

} // namespace testconsole
