#pragma once

#include "runner/retrying_invoker.hpp"
#include "runner/test_unit.hpp"

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/runner.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace testconsole {

class RunNotifier;

/// Runs one test unit: all public test methods of a class, or a single one of them.
///
/// Descriptions are recomputed on every call, consulting the attached filters each time;
/// filters are expected to give stable answers (see ShardFilter).
class UnitRunner final : public Runner
{
public:
    UnitRunner(TestUnit unit, std::shared_ptr<const RetryingInvoker> invoker);

    Description get_description() override;

    void run(RunNotifier& notifier) override;

    void filter(std::shared_ptr<Filter> filter) override;

    void sort(DescriptionOrder order) override;

    const TestUnit& get_unit() const noexcept { return unit_; }

private:
    /// Class description narrowed to the unit's method, before filtering and sorting
    Description base_description() const;

    TestUnit unit_;
    std::shared_ptr<const RetryingInvoker> invoker_;

    std::vector<std::shared_ptr<Filter>> filters_;
    std::optional<DescriptionOrder> order_;

    /// Set when the framework rejected the class; reported when run
    std::optional<std::string> initialization_error_;
};

/// Runs several runners one after another, as a single suite
class SuiteRunner final : public Runner
{
public:
    SuiteRunner(std::string name, std::vector<std::unique_ptr<Runner>> children);

    Description get_description() override;

    void run(RunNotifier& notifier) override;

    void filter(std::shared_ptr<Filter> filter) override;

    /// Orders the children immediately; attach filters afterwards
    void sort(DescriptionOrder order) override;

private:
    std::string name_;
    std::vector<std::unique_ptr<Runner>> children_;
};

} // namespace testconsole
