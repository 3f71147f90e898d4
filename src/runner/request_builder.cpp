#include "runner/request_builder.hpp"

#include "runner/retrying_invoker.hpp"
#include "runner/spec_resolver.hpp"
#include "runner/test_unit.hpp"
#include "runner/unit_runner.hpp"

#include <testconsole/framework/runner.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/logging.hpp>

#include <memory>
#include <utility>
#include <vector>

namespace testconsole {

namespace {

Request make_unit_request(const TestUnit& unit, const std::shared_ptr<const RetryingInvoker>& invoker) {
    return Request{.runner = std::make_unique<UnitRunner>(unit, invoker),
                   .class_name = unit.get_class_name(),
                   .parallel_mode = unit.test_class->parallel_mode};
}

} // namespace

std::vector<Request> build_requests(const ResolvedSpecs& specs, const std::shared_ptr<const RetryingInvoker>& invoker,
                                    bool request_per_class) {
    std::vector<Request> requests;

    if (!specs.classes.empty()) {
        if (request_per_class) {
            for (const TestUnit& unit : specs.classes) {
                requests.push_back(make_unit_request(unit, invoker));
            }
        } else {
            std::vector<std::unique_ptr<Runner>> children;
            children.reserve(specs.classes.size());

            for (const TestUnit& unit : specs.classes) {
                children.push_back(std::make_unique<UnitRunner>(unit, invoker));
            }

            requests.push_back(Request{.runner = std::make_unique<SuiteRunner>("", std::move(children)),
                                       .class_name = "",
                                       .parallel_mode = ParallelMode::Default});
        }
    }

    for (const TestUnit& unit : specs.methods) {
        requests.push_back(make_unit_request(unit, invoker));
    }

    LOG_DEBUG("Built {} requests from {} class units and {} method units", requests.size(), specs.classes.size(),
              specs.methods.size());

    return requests;
}

} // namespace testconsole
