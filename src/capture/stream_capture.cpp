#include "capture/stream_capture.hpp"

#include "capture/fd_streambuf.hpp"
#include "capture/swappable_stream.hpp"

#include <testconsole/common/linux.hpp>
#include <testconsole/exceptions.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>

#include <fcntl.h>

namespace testconsole {

void StreamCapture::CaptureFile::open() {
    // NOLINTNEXTLINE(hicpp-signed-bitwise)
    auto res = linux::open(path.string(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (!res) {
        throw CaptureError(fmt::format("Failed to open capture file {}: {}", path, res.error().message()));
    }

    fd = *res;
    buf = std::make_unique<FdStreamBuf>(fd);
}

void StreamCapture::CaptureFile::close() {
    if (!is_open()) {
        return;
    }

    if (buf->pubsync() != 0) {
        LOG_DEBUG("Failed to flush capture file {}", path);
    }
    buf.reset();

    if (auto res = linux::fsync(fd); !res) {
        LOG_DEBUG("Failed to sync capture file {}: {}", path, res.error().message());
    }
    if (auto res = linux::close(fd); !res) {
        LOG_DEBUG("Failed to close capture file {}: {}", path, res.error().message());
    }

    fd = -1;
}

std::string StreamCapture::CaptureFile::read() const {
    std::ifstream file{path, std::ios::binary};
    if (!file) {
        // Nothing was ever captured
        return {};
    }

    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

StreamCapture::StreamCapture(std::filesystem::path out_path, std::filesystem::path err_path, SwappableStream& out,
                             SwappableStream& err)
    : out_file_{.path = std::move(out_path)}
    , err_file_{.path = std::move(err_path)}
    , out_{&out}
    , err_{&err} {}

StreamCapture::~StreamCapture() {
    if (is_open()) {
        dispose();
    }
}

void StreamCapture::open() {
    if (closed_) {
        throw CaptureStateError(fmt::format("Capture for {} was already closed", out_file_.path));
    }

    if (!out_file_.is_open()) {
        out_file_.open();
    }
    if (!err_file_.is_open()) {
        err_file_.open();
    }

    out_->swap(out_file_.buf.get());
    err_->swap(err_file_.buf.get());
}

void StreamCapture::close() {
    // Leave the streams alone if another capture has since taken them over
    if (out_file_.is_open() && out_->current() == out_file_.buf.get()) {
        out_->restore();
    }
    if (err_file_.is_open() && err_->current() == err_file_.buf.get()) {
        err_->restore();
    }

    if (--use_count_ <= 0 && !closed_) {
        out_file_.close();
        err_file_.close();
        closed_ = true;
    }
}

void StreamCapture::dispose() {
    use_count_ = 0;
    close();
}

std::string StreamCapture::read_out() const {
    if (!closed_) {
        throw CaptureStateError(fmt::format("Cannot read {} before the capture is closed", out_file_.path));
    }
    return out_file_.read();
}

std::string StreamCapture::read_err() const {
    if (!closed_) {
        throw CaptureStateError(fmt::format("Cannot read {} before the capture is closed", err_file_.path));
    }
    return err_file_.read();
}

} // namespace testconsole
