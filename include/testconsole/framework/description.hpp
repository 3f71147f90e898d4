#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace testconsole {

/// A node of the tree describing a runnable unit: root suite -> test class -> test method.
///
/// A node naming a method is a *test* (a leaf that gets executed); anything else is a suite.
class Description
{
public:
    /// A grouping node (e.g., the root of a composite request). ``name`` may be empty.
    static Description create_suite(std::string name, std::vector<Description> children = {});

    static Description create_class(std::string class_name, std::vector<Description> children = {});

    /// Display name is ``method(ClassName)``
    static Description create_test(std::string class_name, std::string method_name);

    const std::string& get_display_name() const noexcept { return display_name_; }

    /// Empty for suites that are not bound to a class
    const std::string& get_class_name() const noexcept { return class_name_; }

    const std::optional<std::string>& get_method_name() const noexcept { return method_name_; }

    const std::vector<Description>& get_children() const noexcept { return children_; }

    std::vector<Description>& get_children() noexcept { return children_; }

    bool is_test() const noexcept { return method_name_.has_value(); }

    bool is_suite() const noexcept { return !is_test(); }

    /// Number of leaves (tests) in this tree
    std::size_t test_count() const noexcept;

    bool operator==(const Description& rhs) const;

private:
    Description(std::string display_name, std::string class_name, std::optional<std::string> method_name,
                std::vector<Description> children)
        : display_name_{std::move(display_name)}
        , class_name_{std::move(class_name)}
        , method_name_{std::move(method_name)}
        , children_{std::move(children)} {}

    std::string display_name_;
    std::string class_name_;
    std::optional<std::string> method_name_;
    std::vector<Description> children_;
};

inline std::string format_as(const Description& from) {
    return from.get_display_name();
}

} // namespace testconsole
