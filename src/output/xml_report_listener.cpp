#include "output/xml_report_listener.hpp"

#include "capture/stream_source.hpp"
#include "common/time.hpp"

#include <testconsole/exceptions.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>
#include <fmt/os.h>
#include <fmt/std.h>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace testconsole {

namespace {

/// Name of the synthetic test case that records failures of a whole class
constexpr std::string_view CLASS_FAILURE_NAME = "initializationError";

/// Report name for failures that do not belong to any class (e.g., an aborted run)
constexpr std::string_view UNKNOWN_CLASS_NAME = "testconsole";

} // namespace

XmlReportListener::XmlReportListener(std::filesystem::path outdir, const StreamSource* streams)
    : outdir_{std::move(outdir)}
    , streams_{streams} {}

std::filesystem::path XmlReportListener::report_path(const std::filesystem::path& outdir,
                                                     const std::string& class_name) {
    return outdir / fmt::format("TEST-{}.xml", class_name);
}

std::string XmlReportListener::escape_xml(std::string_view str) {
    std::string out;
    out.reserve(str.size());

    for (char chr : str) {
        switch (chr) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&apos;";
            break;
        default:
            out.push_back(chr);
            break;
        }
    }

    return out;
}

std::string XmlReportListener::to_cdata(std::string_view str) {
    static constexpr std::string_view TERMINATOR = "]]>";

    std::string out = "<![CDATA[";

    std::size_t pos = 0;
    for (std::size_t found = str.find(TERMINATOR); found != std::string_view::npos;
         found = str.find(TERMINATOR, pos)) {
        out += str.substr(pos, found - pos);
        out += "]]]]><![CDATA[>";
        pos = found + TERMINATOR.size();
    }
    out += str.substr(pos);

    out += "]]>";
    return out;
}

std::size_t XmlReportListener::TestSuite::failure_count() const {
    return static_cast<std::size_t>(
        ranges::count_if(test_cases, [](const TestCase& test_case) { return test_case.failure_message.has_value(); }));
}

std::size_t XmlReportListener::TestSuite::ignored_count() const {
    return static_cast<std::size_t>(
        ranges::count_if(test_cases, [](const TestCase& test_case) { return test_case.ignored; }));
}

std::chrono::milliseconds XmlReportListener::TestSuite::total_time() const {
    return ranges::accumulate(test_cases | ranges::views::transform(&TestCase::duration), std::chrono::milliseconds{});
}

XmlReportListener::TestSuite& XmlReportListener::get_suite(const std::string& class_name) {
    const std::string& name = class_name.empty() ? std::string{UNKNOWN_CLASS_NAME} : class_name;

    auto [iter, inserted] = suite_indices_.try_emplace(name, suites_.size());
    if (inserted) {
        suites_.push_back(TestSuite{.class_name = name, .timestamp = std::chrono::system_clock::now(), .test_cases = {}});
    }

    return suites_.at(iter->second);
}

XmlReportListener::TestCase& XmlReportListener::get_test_case(const Description& description) {
    TestSuite& suite = get_suite(description.get_class_name());

    // Failures of whole classes (or of a whole run) are recorded against a synthetic test case
    const bool named_suite = description.get_class_name().empty() && !description.get_display_name().empty();
    const std::string name = description.get_method_name().value_or(
        named_suite ? description.get_display_name() : std::string{CLASS_FAILURE_NAME});

    for (TestCase& test_case : suite.test_cases) {
        if (test_case.name == name) {
            return test_case;
        }
    }

    return suite.test_cases.emplace_back(TestCase{.name = name, .start_time = std::chrono::steady_clock::now()});
}

void XmlReportListener::test_run_started(const Description& /*description*/) {
    suites_.clear();
    suite_indices_.clear();
}

void XmlReportListener::test_started(const Description& description) {
    get_test_case(description).start_time = std::chrono::steady_clock::now();
}

void XmlReportListener::test_finished(const Description& description) {
    TestCase& test_case = get_test_case(description);
    test_case.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - test_case.start_time);
}

void XmlReportListener::test_failure(const Failure& failure) {
    get_test_case(failure.description).failure_message = failure.message;
}

void XmlReportListener::test_ignored(const Description& description) {
    get_test_case(description).ignored = true;
}

void XmlReportListener::test_run_finished(const Result& /*result*/) {
    for (const TestSuite& suite : suites_) {
        write_report(suite);
    }

    LOG_DEBUG("Wrote {} XML reports to {}", suites_.size(), outdir_);
}

std::string XmlReportListener::render(const TestSuite& suite) const {
    std::string system_out;
    std::string system_err;

    if (streams_ != nullptr) {
        try {
            system_out = streams_->read_out(suite.class_name);
            system_err = streams_->read_err(suite.class_name);
        } catch (const CaptureStateError& ex) {
            LOG_DEBUG("No captured output for {}: {}", suite.class_name, ex.what());
        }
    }

    const std::string timestamp = to_localtime_string(suite.timestamp).value_or("");

    std::string out = R"(<?xml version="1.0" encoding="UTF-8"?>)"
                      "\n";

    out += fmt::format(R"(<testsuite name="{}" tests="{}" failures="{}" errors="0" skipped="{}" time="{}")"
                       R"( timestamp="{}">)"
                       "\n",
                       escape_xml(suite.class_name), suite.test_cases.size(), suite.failure_count(),
                       suite.ignored_count(), format_seconds(suite.total_time()), timestamp);

    out += "  <properties/>\n";

    for (const TestCase& test_case : suite.test_cases) {
        out += fmt::format(R"(  <testcase classname="{}" name="{}" time="{}")", escape_xml(suite.class_name),
                           escape_xml(test_case.name), format_seconds(test_case.duration));

        if (!test_case.failure_message && !test_case.ignored) {
            out += "/>\n";
            continue;
        }

        out += ">\n";

        if (test_case.ignored) {
            out += "    <skipped/>\n";
        }

        if (test_case.failure_message) {
            const std::string& message = *test_case.failure_message;
            const std::string_view first_line = std::string_view{message}.substr(0, message.find('\n'));

            out += fmt::format(R"(    <failure message="{}">{}</failure>)"
                               "\n",
                               escape_xml(first_line), escape_xml(message));
        }

        out += "  </testcase>\n";
    }

    out += fmt::format("  <system-out>{}</system-out>\n", to_cdata(system_out));
    out += fmt::format("  <system-err>{}</system-err>\n", to_cdata(system_err));
    out += "</testsuite>\n";

    return out;
}

void XmlReportListener::write_report(const TestSuite& suite) const {
    const auto path = report_path(outdir_, suite.class_name);
    std::filesystem::create_directories(path.parent_path());

    // Throws std::system_error if the report cannot be written
    auto file = fmt::output_file(path.string());
    file.print("{}", render(suite));
    file.close();
}

} // namespace testconsole
