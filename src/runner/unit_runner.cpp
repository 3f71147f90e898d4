#include "runner/unit_runner.hpp"

#include "runner/retrying_invoker.hpp"
#include "runner/test_unit.hpp"

#include <testconsole/exceptions.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_notifier.hpp>
#include <testconsole/framework/runner.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/stable_sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace testconsole {

UnitRunner::UnitRunner(TestUnit unit, std::shared_ptr<const RetryingInvoker> invoker)
    : unit_{std::move(unit)}
    , invoker_{std::move(invoker)} {
    try {
        invoker_->get_framework().validate(*unit_.test_class);
    } catch (const InitializationError& ex) {
        LOG_DEBUG("{} failed validation: {}", unit_, ex.what());
        initialization_error_ = ex.what();
    }
}

Description UnitRunner::base_description() const {
    Description description = invoker_->get_framework().build_description(*unit_.test_class);

    if (unit_.method) {
        std::erase_if(description.get_children(), [this](const Description& child) {
            return child.get_method_name() != unit_.method;
        });
    }

    return description;
}

Description UnitRunner::get_description() {
    Description description = base_description();
    auto& children = description.get_children();

    // Sort before filtering, so that filters see tests in their final order
    if (order_) {
        ranges::stable_sort(children, *order_);
    }

    std::erase_if(children, [this](const Description& child) {
        return !ranges::all_of(filters_, [&](const std::shared_ptr<Filter>& filter) { return filter->should_run(child); });
    });

    return description;
}

void UnitRunner::run(RunNotifier& notifier) {
    if (initialization_error_) {
        throw InitializationError(*initialization_error_);
    }

    if (unit_.method && base_description().get_children().empty()) {
        const Description error_description = Description::create_test(unit_.get_class_name(), "initializationError");

        notifier.fire_test_started(error_description);
        notifier.fire_test_failure(Failure{
            .description = error_description,
            .message = fmt::format("No tests found matching method {} in {}", *unit_.method, unit_.get_class_name())});
        notifier.fire_test_finished(error_description);
        return;
    }

    const Description description = get_description();

    for (const Description& child : description.get_children()) {
        const TestMethodInfo* method = unit_.test_class->find_method(child.get_method_name().value());
        ASSERT(method != nullptr, "Description refers to a method the class does not have", child);

        if (method->ignored) {
            notifier.fire_test_ignored(child);
            continue;
        }

        notifier.fire_test_started(child);

        const MethodOutcome outcome = invoker_->invoke(*unit_.test_class, *method, child);
        if (outcome.status == MethodOutcome::Failed) {
            notifier.fire_test_failure(Failure{.description = child, .message = outcome.message});
        }

        notifier.fire_test_finished(child);
    }
}

void UnitRunner::filter(std::shared_ptr<Filter> filter) {
    filters_.push_back(std::move(filter));
}

void UnitRunner::sort(DescriptionOrder order) {
    order_ = std::move(order);
}

SuiteRunner::SuiteRunner(std::string name, std::vector<std::unique_ptr<Runner>> children)
    : name_{std::move(name)}
    , children_{std::move(children)} {}

Description SuiteRunner::get_description() {
    return Description::create_suite(name_, children_ |
                                                ranges::views::transform([](const std::unique_ptr<Runner>& child) {
                                                    return child->get_description();
                                                }) |
                                                ranges::to<std::vector>());
}

void SuiteRunner::run(RunNotifier& notifier) {
    std::vector<std::string> initialization_errors;

    for (const auto& child : children_) {
        if (notifier.is_stop_requested()) {
            LOG_DEBUG("Stop requested; not starting remaining children of suite {}", name_);
            break;
        }

        // A child that cannot be initialized must not keep its siblings from running
        try {
            child->run(notifier);
        } catch (const InitializationError& ex) {
            LOG_ERROR("Could not run {}: {}", child->get_description(), ex.what());
            initialization_errors.emplace_back(ex.what());
        }
    }

    if (!initialization_errors.empty()) {
        throw InitializationError(fmt::format("{}", fmt::join(initialization_errors, "; ")));
    }
}

void SuiteRunner::filter(std::shared_ptr<Filter> filter) {
    for (const auto& child : children_) {
        child->filter(filter);
    }
}

void SuiteRunner::sort(DescriptionOrder order) {
    for (const auto& child : children_) {
        child->sort(order);
    }

    // Decorate-sort, computing each child's description once
    auto decorated = children_ | ranges::views::transform([](std::unique_ptr<Runner>& child) {
                         return std::pair{child->get_description(), std::move(child)};
                     }) |
                     ranges::to<std::vector>();

    ranges::stable_sort(decorated, [&order](const auto& lhs, const auto& rhs) { return order(lhs.first, rhs.first); });

    children_.clear();
    for (auto& [description, child] : decorated) {
        children_.push_back(std::move(child));
    }
}

} // namespace testconsole
