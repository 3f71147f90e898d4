#include "capture/stream_capturing_listener.hpp"

#include "capture/stream_capture.hpp"
#include "capture/swappable_stream.hpp"

#include <testconsole/exceptions.hpp>
#include <testconsole/framework/description.hpp>
#include <testconsole/framework/run_listener.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace testconsole {

StreamCapturingListener::StreamCapturingListener(std::filesystem::path outdir, SwappableStream& out,
                                                 SwappableStream& err)
    : outdir_{std::move(outdir)}
    , out_{&out}
    , err_{&err} {}

std::filesystem::path StreamCapturingListener::out_path(const std::filesystem::path& outdir,
                                                        const std::string& class_name) {
    return outdir / (class_name + ".out.txt");
}

std::filesystem::path StreamCapturingListener::err_path(const std::filesystem::path& outdir,
                                                        const std::string& class_name) {
    return outdir / (class_name + ".err.txt");
}

void StreamCapturingListener::test_run_started(const Description& description) {
    register_tests(description);
    LOG_DEBUG("Capturing output of {} test classes into {}", captures_.size(), outdir_);
}

void StreamCapturingListener::register_tests(const Description& description) {
    if (description.is_test()) {
        get_or_create_capture(description.get_class_name()).increment_use_count();
        return;
    }

    for (const Description& child : description.get_children()) {
        register_tests(child);
    }
}

StreamCapture& StreamCapturingListener::get_or_create_capture(const std::string& class_name) {
    auto iter = captures_.find(class_name);

    if (iter == captures_.end()) {
        auto out_file = out_path(outdir_, class_name);
        auto err_file = err_path(outdir_, class_name);

        // Throws filesystem_error if the directory cannot be created
        std::filesystem::create_directories(out_file.parent_path());

        iter = captures_
                   .emplace(class_name, std::make_unique<StreamCapture>(std::move(out_file), std::move(err_file),
                                                                        *out_, *err_))
                   .first;
    }

    return *iter->second;
}

const StreamCapture& StreamCapturingListener::get_capture(const std::string& class_name) const {
    auto iter = captures_.find(class_name);

    if (iter == captures_.end()) {
        throw CaptureStateError(fmt::format("No output was captured for {}", class_name));
    }

    return *iter->second;
}

void StreamCapturingListener::test_run_finished(const Result& /*result*/) {
    for (auto& [class_name, capture] : captures_) {
        capture->dispose();
    }
}

void StreamCapturingListener::test_started(const Description& description) {
    const bool known = captures_.contains(description.get_class_name());
    StreamCapture& capture = get_or_create_capture(description.get_class_name());

    // Tests outside of the announced tree (e.g., synthetic errors) are accounted for here
    if (!known) {
        capture.increment_use_count();
    }

    if (capture.is_closed()) {
        LOG_DEBUG("Not capturing output of {}; capture already closed", description);
        return;
    }

    capture.open();
}

void StreamCapturingListener::test_finished(const Description& description) {
    auto iter = captures_.find(description.get_class_name());
    if (iter == captures_.end() || iter->second->is_closed()) {
        return;
    }

    iter->second->close();
}

std::string StreamCapturingListener::read_out(const std::string& class_name) const {
    return get_capture(class_name).read_out();
}

std::string StreamCapturingListener::read_err(const std::string& class_name) const {
    return get_capture(class_name).read_err();
}

} // namespace testconsole
