#pragma once

#include "capture/stream_source.hpp"

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace testconsole {

/// Writes an Ant compatible JUnit XML report, ``<outdir>/TEST-<class name>.xml``, for each test class
/// once the run finishes. The captured output of each class is embedded when a StreamSource is given.
class XmlReportListener final : public RunListener
{
public:
    /// ``streams`` may be null, in which case no output is embedded
    XmlReportListener(std::filesystem::path outdir, const StreamSource* streams);

    void test_run_started(const Description& description) override;
    void test_run_finished(const Result& result) override;
    void test_started(const Description& description) override;
    void test_finished(const Description& description) override;
    void test_failure(const Failure& failure) override;
    void test_ignored(const Description& description) override;

    static std::filesystem::path report_path(const std::filesystem::path& outdir, const std::string& class_name);

    static std::string escape_xml(std::string_view str);

    /// Wrap ``str`` as CDATA, splitting any embedded terminators
    static std::string to_cdata(std::string_view str);

private:
    struct TestCase
    {
        std::string name;
        std::chrono::steady_clock::time_point start_time;
        std::chrono::milliseconds duration{};
        std::optional<std::string> failure_message;
        bool ignored{};
    };

    struct TestSuite
    {
        std::string class_name;
        std::chrono::system_clock::time_point timestamp;
        std::vector<TestCase> test_cases;

        std::size_t failure_count() const;
        std::size_t ignored_count() const;
        std::chrono::milliseconds total_time() const;
    };

    TestSuite& get_suite(const std::string& class_name);

    TestCase& get_test_case(const Description& description);

    std::string render(const TestSuite& suite) const;

    void write_report(const TestSuite& suite) const;

    std::filesystem::path outdir_;
    const StreamSource* streams_;

    /// Suites in the order their classes were first seen
    std::vector<TestSuite> suites_;
    std::map<std::string, std::size_t> suite_indices_;
};

} // namespace testconsole
