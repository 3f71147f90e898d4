#pragma once

#include <testconsole/common/class_traits.hpp>

#include <mutex>
#include <ostream>
#include <streambuf>

namespace testconsole {

/// Stream buffer forwarding everything written to it to a target buffer, which may be
/// swapped out at any time
class ForwardingStreamBuf final : public std::streambuf
{
public:
    explicit ForwardingStreamBuf(std::streambuf* target);

    /// Retarget, returning the previous target
    std::streambuf* swap(std::streambuf* target);

    std::streambuf* get_target() const;

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* str, std::streamsize count) override;
    int sync() override;

private:
    mutable std::mutex mutex_;
    std::streambuf* target_;
};

/// Installs a ForwardingStreamBuf into a stream (normally std::cout or std::cerr) for as long
/// as it lives, so that everything written to the stream can be redirected.
/// The stream's original buffer is restored on destruction.
class SwappableStream : NonMovable
{
public:
    explicit SwappableStream(std::ostream& stream);

    ~SwappableStream();

    /// Redirect the stream to ``target``, returning the previous target
    std::streambuf* swap(std::streambuf* target);

    /// Redirect the stream back to its original buffer
    void restore() { swap(original_); }

    /// The buffer currently written to
    std::streambuf* current() const { return forwarding_buf_.get_target(); }

    /// The buffer the stream had when this was installed
    std::streambuf* original() const noexcept { return original_; }

    /// A stream writing to the original buffer, unaffected by swapping
    std::ostream& original_stream() noexcept { return original_stream_; }

private:
    std::ostream* stream_;
    std::streambuf* original_;
    ForwardingStreamBuf forwarding_buf_;
    std::ostream original_stream_;
};

} // namespace testconsole
