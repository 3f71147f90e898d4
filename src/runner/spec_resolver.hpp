#pragma once

#include "runner/test_unit.hpp"

#include <testconsole/framework/test_framework.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace testconsole {

/// A parsed ``ClassName`` or ``ClassName#methodName`` spec
struct TestSpec
{
    std::string class_name;
    std::optional<std::string> method_name;

    static TestSpec parse(std::string_view spec);
};

struct ResolvedSpecs
{
    /// In first-seen order, without duplicates
    std::vector<TestUnit> classes;
    /// In first-seen order, without duplicates
    std::vector<TestUnit> methods;
};

/// Turns string specs into test units, using the framework to load and classify classes.
class SpecResolver
{
public:
    /// Fatal discovery errors are reported on ``console`` before being thrown
    SpecResolver(TestFramework& framework, std::ostream& console)
        : framework_{&framework}
        , console_{&console} {}

    /// Classes that are not runnable tests are silently skipped.
    /// Throws SpecResolutionError on the first spec that fails to load.
    ResolvedSpecs resolve(const std::vector<std::string>& specs) const;

private:
    TestFramework* framework_;
    std::ostream* console_;
};

} // namespace testconsole
