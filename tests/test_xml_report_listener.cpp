#include "catch2_custom.hpp"

#include "capture/stream_source.hpp"
#include "output/xml_report_listener.hpp"
#include "test_helpers.hpp"

#include <testconsole/exceptions.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>

using namespace testconsole;
using Catch::Matchers::ContainsSubstring;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file{path};
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

/// Canned output per class; classes without any throw, like an unclosed capture would
class FakeStreams final : public StreamSource
{
public:
    std::map<std::string, std::string> out;
    std::map<std::string, std::string> err;

    std::string read_out(const std::string& class_name) const override { return lookup(out, class_name); }

    std::string read_err(const std::string& class_name) const override { return lookup(err, class_name); }

private:
    static std::string lookup(const std::map<std::string, std::string>& streams, const std::string& class_name) {
        if (auto iter = streams.find(class_name); iter != streams.end()) {
            return iter->second;
        }
        throw CaptureStateError("not captured");
    }
};

void run_test(RunListener& listener, const Description& test, const char* failure = nullptr) {
    listener.test_started(test);
    if (failure != nullptr) {
        listener.test_failure(Failure{.description = test, .message = failure});
    }
    listener.test_finished(test);
}

} // namespace

TEST_CASE("XML special characters are escaped") {
    REQUIRE(XmlReportListener::escape_xml("a < b && c > \"d\" 'e'") ==
            "a &lt; b &amp;&amp; c &gt; &quot;d&quot; &apos;e&apos;");
    REQUIRE(XmlReportListener::escape_xml("plain") == "plain");
}

TEST_CASE("CDATA sections survive embedded terminators") {
    REQUIRE(XmlReportListener::to_cdata("") == "<![CDATA[]]>");
    REQUIRE(XmlReportListener::to_cdata("x < y") == "<![CDATA[x < y]]>");
    REQUIRE(XmlReportListener::to_cdata("a]]>b") == "<![CDATA[a]]]]><![CDATA[>b]]>");
}

TEST_CASE("One report is written per class") {
    testing::TempDir dir;
    FakeStreams streams;
    streams.out["A"] = "hello from A\n";
    streams.err["A"] = "warning ]]> from A\n";

    XmlReportListener listener{dir.path() / "reports", &streams};

    const auto a1 = Description::create_test("A", "one");
    const auto a2 = Description::create_test("A", "two");
    const auto a3 = Description::create_test("A", "three");
    const auto b1 = Description::create_test("B", "one");

    listener.test_run_started(Description::create_suite(
        "", {Description::create_class("A", {a1, a2, a3}), Description::create_class("B", {b1})}));
    run_test(listener, a1);
    run_test(listener, a2, "expected <1>\nbut was <2>");
    listener.test_ignored(a3);
    run_test(listener, b1);
    listener.test_run_finished(Result{});

    REQUIRE(XmlReportListener::report_path(dir.path(), "A") == dir.path() / "TEST-A.xml");

    const std::string report_a = read_file(dir.path() / "reports" / "TEST-A.xml");
    REQUIRE_THAT(report_a, Catch::Matchers::StartsWith("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"));
    REQUIRE_THAT(report_a, ContainsSubstring(R"(<testsuite name="A" tests="3" failures="1" errors="0" skipped="1")"));
    REQUIRE_THAT(report_a, ContainsSubstring("<properties/>"));
    REQUIRE_THAT(report_a, ContainsSubstring(R"(<testcase classname="A" name="one" time=")"));
    REQUIRE_THAT(report_a, ContainsSubstring(R"(<failure message="expected &lt;1&gt;">)"
                                             "expected &lt;1&gt;\nbut was &lt;2&gt;</failure>"));
    REQUIRE_THAT(report_a, ContainsSubstring("<skipped/>"));
    REQUIRE_THAT(report_a, ContainsSubstring("<system-out><![CDATA[hello from A\n]]></system-out>"));
    REQUIRE_THAT(report_a, ContainsSubstring("<system-err><![CDATA[warning ]]]]><![CDATA[> from A\n]]></system-err>"));
    REQUIRE_THAT(report_a, Catch::Matchers::EndsWith("</testsuite>\n"));

    const std::string report_b = read_file(dir.path() / "reports" / "TEST-B.xml");
    REQUIRE_THAT(report_b, ContainsSubstring(R"(tests="1" failures="0" errors="0" skipped="0")"));
    REQUIRE_THAT(report_b, ContainsSubstring("<system-out><![CDATA[]]></system-out>"));
}

TEST_CASE("Class-level failures are reported as initialization errors") {
    testing::TempDir dir;
    XmlReportListener listener{dir.path(), nullptr};

    listener.test_run_started(Description::create_suite(""));
    listener.test_failure(Failure{.description = Description::create_class("Broken"), .message = "no runnable methods"});
    listener.test_failure(Failure{.description = Description::create_suite(""), .message = "Abnormal exit"});
    listener.test_run_finished(Result{});

    const std::string report = read_file(dir.path() / "TEST-Broken.xml");
    REQUIRE_THAT(report, ContainsSubstring(R"(name="initializationError")"));
    REQUIRE_THAT(report, ContainsSubstring(R"(<failure message="no runnable methods">)"));

    REQUIRE(std::filesystem::exists(dir.path() / "TEST-testconsole.xml"));
    REQUIRE_THAT(read_file(dir.path() / "TEST-testconsole.xml"), ContainsSubstring("Abnormal exit"));
}
