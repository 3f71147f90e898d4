#include "runner/spec_resolver.hpp"

#include "runner/test_unit.hpp"

#include <testconsole/exceptions.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/framework/test_framework.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <range/v3/algorithm/find.hpp>

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace testconsole {

namespace {

void add_unique(std::vector<TestUnit>& units, TestUnit unit) {
    if (ranges::find(units, unit) == units.end()) {
        units.push_back(std::move(unit));
    }
}

} // namespace

TestSpec TestSpec::parse(std::string_view spec) {
    static const std::regex method_parser{"^([^#]+)#([^#]+)$"};

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_match(spec.begin(), spec.end(), match, method_parser)) {
        return TestSpec{.class_name = match[1].str(), .method_name = match[2].str()};
    }

    return TestSpec{.class_name = std::string{spec}, .method_name = std::nullopt};
}

ResolvedSpecs SpecResolver::resolve(const std::vector<std::string>& specs) const {
    ResolvedSpecs resolved;

    for (const std::string& spec : specs) {
        TestSpec parsed = TestSpec::parse(spec);

        auto loaded = framework_->load_for_inspection(parsed.class_name);

        if (!loaded) {
            fmt::print(*console_, "FATAL: Error during test discovery for {}: {}\n", spec, loaded.error());
            console_->flush();
            throw SpecResolutionError(spec, format_as(loaded.error()));
        }

        const TestClassInfo* test_class = loaded.value();

        if (!framework_->is_runnable_test(*test_class)) {
            LOG_DEBUG("Skipping {:?}: {} is not a runnable test class", spec, test_class->name);
            continue;
        }

        if (parsed.method_name) {
            add_unique(resolved.methods, TestUnit{test_class, std::move(parsed.method_name)});
        } else {
            add_unique(resolved.classes, TestUnit{test_class, std::nullopt});
        }
    }

    LOG_DEBUG("Resolved {} specs into {} class units and {} method units", specs.size(), resolved.classes.size(),
              resolved.methods.size());

    return resolved;
}

} // namespace testconsole
