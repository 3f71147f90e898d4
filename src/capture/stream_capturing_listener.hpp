#pragma once

#include "capture/stream_capture.hpp"
#include "capture/stream_source.hpp"
#include "capture/swappable_stream.hpp"

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace testconsole {

/// Captures the output of each test class into ``<outdir>/<class name>.{out,err}.txt``
/// for as long as any of its tests are running
class StreamCapturingListener final : public RunListener, public StreamSource
{
public:
    StreamCapturingListener(std::filesystem::path outdir, SwappableStream& out, SwappableStream& err);

    void test_run_started(const Description& description) override;
    void test_run_finished(const Result& result) override;
    void test_started(const Description& description) override;
    void test_finished(const Description& description) override;

    std::string read_out(const std::string& class_name) const override;
    std::string read_err(const std::string& class_name) const override;

    static std::filesystem::path out_path(const std::filesystem::path& outdir, const std::string& class_name);
    static std::filesystem::path err_path(const std::filesystem::path& outdir, const std::string& class_name);

private:
    void register_tests(const Description& description);

    StreamCapture& get_or_create_capture(const std::string& class_name);

    const StreamCapture& get_capture(const std::string& class_name) const;

    std::filesystem::path outdir_;
    SwappableStream* out_;
    SwappableStream* err_;

    std::map<std::string, std::unique_ptr<StreamCapture>> captures_;
};

} // namespace testconsole
