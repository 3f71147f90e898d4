#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include <testconsole/common/error_types.hpp>
#include <testconsole/exceptions.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/framework/test_framework.hpp>
#include <testconsole/registry/test_macros.hpp>
#include <testconsole/registry/test_registry.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace testconsole;

TEST_CLASS(MacroRegisteredTests, Serial);

TEST_METHOD(MacroRegisteredTests, passes) {
    EXPECT_EQ(1 + 1, 2);
}

TEST_METHOD(MacroRegisteredTests, fails) {
    EXPECT_EQ(1 + 1, 3);
}

IGNORED_TEST_METHOD(MacroRegisteredTests, skipped) {
    FAIL_TEST("never runs");
}

namespace {

TestClassInfo runnable_class() {
    return TestClassInfo{.name = "Runnable", .methods = {TestMethodInfo{.name = "m", .body = &testing::pass}}};
}

} // namespace

TEST_CASE("Runnable test classes are concrete, public and publicly constructible") {
    REQUIRE(is_runnable_test_class(runnable_class()));

    auto interface_class = runnable_class();
    interface_class.is_interface = true;
    REQUIRE_FALSE(is_runnable_test_class(interface_class));

    auto abstract_class = runnable_class();
    abstract_class.is_abstract = true;
    REQUIRE_FALSE(is_runnable_test_class(abstract_class));

    auto private_class = runnable_class();
    private_class.is_public = false;
    REQUIRE_FALSE(is_runnable_test_class(private_class));

    auto unconstructible_class = runnable_class();
    unconstructible_class.has_public_constructor = false;
    REQUIRE_FALSE(is_runnable_test_class(unconstructible_class));
}

TEST_CASE("Runnable test classes have a way to find tests") {
    TestClassInfo no_tests{.name = "NoTests"};
    REQUIRE_FALSE(is_runnable_test_class(no_tests));

    SECTION("Legacy test cases") {
        no_tests.is_legacy_test_case = true;
        REQUIRE(is_runnable_test_class(no_tests));
    }

    SECTION("Custom runners") {
        no_tests.has_custom_runner = true;
        REQUIRE(is_runnable_test_class(no_tests));
    }

    SECTION("Non-public or non-test methods do not count") {
        no_tests.methods.push_back(TestMethodInfo{.name = "helper", .is_test = false});
        no_tests.methods.push_back(TestMethodInfo{.name = "hidden", .is_public = false});
        REQUIRE_FALSE(is_runnable_test_class(no_tests));
    }
}

TEST_CASE("Registry loads registered classes by name") {
    TestRegistry registry;
    testing::add_class(registry, "A", {"one", "two"});
    registry.add_unloadable_class("Broken", ErrorKind::LinkageError, "missing dependency Foo");

    REQUIRE(registry.get_num_registered() == 1);

    auto loaded = registry.load_for_inspection("A");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value()->name == "A");
    REQUIRE(loaded.value()->methods.size() == 2);

    auto missing = registry.load_for_inspection("Missing");
    REQUIRE(missing.has_error());
    REQUIRE(missing.error().kind == ErrorKind::ClassNotFound);

    auto broken = registry.load_for_inspection("Broken");
    REQUIRE(broken.has_error());
    REQUIRE(broken.error() == ClassLoadError{ErrorKind::LinkageError, "missing dependency Foo"});

    REQUIRE_THROWS_AS(testing::add_class(registry, "A", {}), std::invalid_argument);
}

TEST_CASE("Registry turns test outcomes into MethodOutcomes") {
    TestRegistry registry;
    auto& test_class = registry.add_class(TestClassInfo{
        .name = "Outcomes",
        .methods = {
            TestMethodInfo{.name = "passes", .body = &testing::pass},
            TestMethodInfo{.name = "fails", .body = &testing::fail},
            TestMethodInfo{.name = "errors", .body = [] { throw std::out_of_range("index 3"); }},
            TestMethodInfo{.name = "throws_int", .body = [] { throw 42; }},
            TestMethodInfo{.name = "skipped", .ignored = true, .body = &testing::fail},
        }});

    auto invoke = [&](const std::string& name) { return registry.invoke(test_class, *test_class.find_method(name)); };

    REQUIRE(invoke("passes").passed());

    const auto failed = invoke("fails");
    REQUIRE(failed.status == MethodOutcome::Failed);
    REQUIRE(failed.message == "boom");

    const auto errored = invoke("errors");
    REQUIRE(errored.status == MethodOutcome::Failed);
    REQUIRE_THAT(errored.message, Catch::Matchers::ContainsSubstring("out_of_range") &&
                                      Catch::Matchers::ContainsSubstring("index 3"));

    REQUIRE(invoke("throws_int").status == MethodOutcome::Failed);
    REQUIRE(invoke("skipped").status == MethodOutcome::Ignored);
}

TEST_CASE("Classes without runnable methods fail validation") {
    TestRegistry registry;
    const auto& test_class = registry.add_class(TestClassInfo{.name = "Empty", .has_custom_runner = true});

    REQUIRE_THROWS_AS(registry.validate(test_class), InitializationError);
    REQUIRE_NOTHROW(registry.validate(testing::add_class(registry, "Full", {"m"})));
}

TEST_CASE("Class descriptions list public test methods in declaration order") {
    TestRegistry registry;
    auto& test_class = testing::add_class(registry, "Ordered", {"zeta", "alpha", "mid"});
    test_class.methods.push_back(TestMethodInfo{.name = "helper", .is_test = false});

    const auto description = registry.build_description(test_class);

    REQUIRE(description.get_display_name() == "Ordered");
    REQUIRE(description.get_children().size() == 3);
    REQUIRE(description.get_children()[0].get_display_name() == "zeta(Ordered)");
    REQUIRE(description.get_children()[1].get_display_name() == "alpha(Ordered)");
    REQUIRE(description.get_children()[2].get_display_name() == "mid(Ordered)");
}

TEST_CASE("Test macros register into the global registry") {
    auto& registry = TestRegistry::get();

    auto loaded = registry.load_for_inspection("MacroRegisteredTests");
    REQUIRE(loaded.has_value());

    const TestClassInfo& test_class = *loaded.value();
    REQUIRE(test_class.parallel_mode == ParallelMode::Serial);
    REQUIRE(is_runnable_test_class(test_class));
    REQUIRE(test_class.methods.size() == 3);

    REQUIRE(registry.invoke(test_class, *test_class.find_method("passes")).passed());

    const auto failed = registry.invoke(test_class, *test_class.find_method("fails"));
    REQUIRE(failed.status == MethodOutcome::Failed);
    REQUIRE_THAT(failed.message, Catch::Matchers::StartsWith("expected 1 + 1 == 3, but 2 != 3 ("));

    REQUIRE(registry.invoke(test_class, *test_class.find_method("skipped")).status == MethodOutcome::Ignored);
}
