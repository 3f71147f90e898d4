#pragma once

#include "capture/fd_streambuf.hpp"
#include "capture/swappable_stream.hpp"

#include <testconsole/common/class_traits.hpp>

#include <filesystem>
#include <memory>
#include <streambuf>
#include <string>

namespace testconsole {

/// Captures the output and error streams of one test class into a pair of files.
///
/// The capture is reference counted: every test of the class increments the use count up front,
/// and closes the capture once it finished. The files are closed for good once the last test is
/// done, after which (and only after which) their contents may be read.
class StreamCapture : NonMovable
{
public:
    StreamCapture(std::filesystem::path out_path, std::filesystem::path err_path, SwappableStream& out,
                  SwappableStream& err);

    ~StreamCapture();

    void increment_use_count() noexcept { ++use_count_; }

    /// Opens the capture files (on first use, truncating them) and redirects both streams to them.
    /// Throws CaptureError if a file cannot be opened, and CaptureStateError if already closed.
    void open();

    /// Redirects both streams back to their originals. Once the use count drops to zero,
    /// the files are flushed and closed.
    void close();

    /// Close the files regardless of the use count
    void dispose();

    /// Throws CaptureStateError unless closed
    std::string read_out() const;

    /// Throws CaptureStateError unless closed
    std::string read_err() const;

    int get_use_count() const noexcept { return use_count_; }

    bool is_open() const noexcept { return out_file_.is_open() && err_file_.is_open(); }

    bool is_closed() const noexcept { return closed_; }

    const std::filesystem::path& get_out_path() const noexcept { return out_file_.path; }

    const std::filesystem::path& get_err_path() const noexcept { return err_file_.path; }

private:
    struct CaptureFile
    {
        std::filesystem::path path;
        int fd = -1;
        std::unique_ptr<FdStreamBuf> buf;

        bool is_open() const noexcept { return fd != -1; }

        void open();
        void close();
        std::string read() const;
    };

    CaptureFile out_file_;
    CaptureFile err_file_;

    SwappableStream* out_;
    SwappableStream* err_;

    int use_count_{};
    bool closed_{};
};

} // namespace testconsole
