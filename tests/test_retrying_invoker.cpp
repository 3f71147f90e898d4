#include "catch2_custom.hpp"

#include "runner/retrying_invoker.hpp"
#include "test_helpers.hpp"

#include <testconsole/exceptions.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/test_class.hpp>
#include <testconsole/registry/test_registry.hpp>

#include <fmt/format.h>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace testconsole;

namespace {

/// A test body that fails its first ``num_failures`` attempts
TestBody fails_times(int num_failures, int& num_calls) {
    return [num_failures, &num_calls] {
        ++num_calls;
        if (num_calls <= num_failures) {
            throw AssertionFailure(fmt::format("failure #{}", num_calls));
        }
    };
}

} // namespace

TEST_CASE("Negative retry counts are rejected") {
    TestRegistry registry;
    std::ostringstream err;

    REQUIRE_THROWS_AS(RetryingInvoker(registry, -1, err), std::invalid_argument);
    REQUIRE(RetryingInvoker(registry, 0, err).get_num_retries() == 0);
}

TEST_CASE("Failing tests are retried until they pass") {
    TestRegistry registry;
    std::ostringstream err;
    int num_calls = 0;

    const auto& test_class =
        registry.add_class(TestClassInfo{.name = "Flaky", .methods = {TestMethodInfo{.name = "m", .body = fails_times(2, num_calls)}}});
    const auto& method = test_class.methods.front();
    const auto description = Description::create_test("Flaky", "m");

    SECTION("Enough retries") {
        RetryingInvoker invoker{registry, 3, err};

        REQUIRE(invoker.invoke(test_class, method, description).passed());
        REQUIRE(num_calls == 3);
        REQUIRE(err.str() == "Test m(Flaky) failed (attempt 1 of 4), retrying: failure #1\n"
                             "Test m(Flaky) failed (attempt 2 of 4), retrying: failure #2\n");
    }

    SECTION("Too few retries reports the last failure only") {
        RetryingInvoker invoker{registry, 1, err};

        const auto outcome = invoker.invoke(test_class, method, description);
        REQUIRE(outcome.status == MethodOutcome::Failed);
        REQUIRE(outcome.message == "failure #2");
        REQUIRE(num_calls == 2);
        REQUIRE(err.str() == "Test m(Flaky) failed (attempt 1 of 2), retrying: failure #1\n");
    }

    SECTION("No retries") {
        RetryingInvoker invoker{registry, 0, err};

        REQUIRE(invoker.invoke(test_class, method, description).status == MethodOutcome::Failed);
        REQUIRE(num_calls == 1);
        REQUIRE(err.str().empty());
    }
}

TEST_CASE("Passing and ignored tests are invoked once") {
    TestRegistry registry;
    std::ostringstream err;
    int num_calls = 0;

    const auto& test_class = registry.add_class(TestClassInfo{
        .name = "Stable",
        .methods = {TestMethodInfo{.name = "passes", .body = fails_times(0, num_calls)},
                    TestMethodInfo{.name = "ignored", .ignored = true, .body = fails_times(10, num_calls)}}});

    RetryingInvoker invoker{registry, 5, err};

    REQUIRE(invoker.invoke(test_class, test_class.methods[0], Description::create_test("Stable", "passes")).passed());
    REQUIRE(num_calls == 1);

    REQUIRE(invoker.invoke(test_class, test_class.methods[1], Description::create_test("Stable", "ignored")).status ==
            MethodOutcome::Ignored);
    REQUIRE(num_calls == 1);
    REQUIRE(err.str().empty());
}
