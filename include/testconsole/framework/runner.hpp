#pragma once

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/test_class.hpp>

#include <functional>
#include <memory>
#include <string>

namespace testconsole {

class RunNotifier;

/// Decides which leaves of a description tree are run
class Filter
{
public:
    virtual ~Filter() = default;

    virtual bool should_run(const Description& description) = 0;

    virtual std::string describe() const = 0;
};

/// Strict weak ordering over sibling descriptions
using DescriptionOrder = std::function<bool(const Description&, const Description&)>;

/// Something that can describe and execute a tree of tests
class Runner
{
public:
    virtual ~Runner() = default;

    /// The tree of tests this runner will run, after filtering and sorting.
    /// Every call consults the attached filters.
    virtual Description get_description() = 0;

    /// Run all tests, reporting through ``notifier``.
    /// Throws InitializationError if the unit cannot be run at all.
    virtual void run(RunNotifier& notifier) = 0;

    virtual void filter(std::shared_ptr<Filter> filter) = 0;

    virtual void sort(DescriptionOrder order) = 0;
};

/// A runner, together with the scheduling capabilities of the unit it runs
struct Request
{
    std::unique_ptr<Runner> runner;

    /// Owning test class; empty for composite requests spanning several classes
    std::string class_name;

    ParallelMode parallel_mode = ParallelMode::Default;
};

} // namespace testconsole
