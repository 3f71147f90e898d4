#include "catch2_custom.hpp"

#include <testconsole/framework/description.hpp>

#include <fmt/format.h>

using testconsole::Description;

TEST_CASE("Descriptions of tests are named after their method and class") {
    const auto test = Description::create_test("SomeTests", "does_things");

    REQUIRE(test.get_display_name() == "does_things(SomeTests)");
    REQUIRE(test.get_class_name() == "SomeTests");
    REQUIRE(test.get_method_name().value() == "does_things");
    REQUIRE(test.is_test());
    REQUIRE_FALSE(test.is_suite());
    REQUIRE(test.test_count() == 1);
    REQUIRE(fmt::format("{}", test) == "does_things(SomeTests)");
}

TEST_CASE("Suites count the tests of the whole tree") {
    const auto class_a = Description::create_class(
        "A", {Description::create_test("A", "one"), Description::create_test("A", "two")});
    const auto class_b = Description::create_class("B", {Description::create_test("B", "three")});
    const auto empty_class = Description::create_class("C");

    const auto root = Description::create_suite("", {class_a, class_b, empty_class});

    REQUIRE(root.is_suite());
    REQUIRE(root.get_class_name().empty());
    REQUIRE(class_a.is_suite());
    REQUIRE(class_a.get_display_name() == "A");

    REQUIRE(root.test_count() == 3);
    REQUIRE(empty_class.test_count() == 0);
}

TEST_CASE("Descriptions compare by their whole tree") {
    const auto lhs = Description::create_class("A", {Description::create_test("A", "one")});
    const auto rhs = Description::create_class("A", {Description::create_test("A", "one")});
    const auto other = Description::create_class("A", {Description::create_test("A", "two")});

    REQUIRE(lhs == rhs);
    REQUIRE_FALSE(lhs == other);
    REQUIRE_FALSE(lhs == Description::create_class("A"));
}
