#pragma once

#include <array>
#include <cstddef>
#include <streambuf>

namespace testconsole {

/// Output stream buffer over a file descriptor it does not own
class FdStreamBuf final : public std::streambuf
{
public:
    explicit FdStreamBuf(int fd);

    FdStreamBuf(const FdStreamBuf&) = delete;
    FdStreamBuf& operator=(const FdStreamBuf&) = delete;

    ~FdStreamBuf() override;

protected:
    int_type overflow(int_type ch) override;
    int sync() override;

private:
    /// Write out everything buffered so far. Returns false on failure.
    bool flush_buffer();

    static constexpr std::size_t BUFFER_SIZE = 4096;

    int fd_;
    std::array<char, BUFFER_SIZE> buffer_{};
};

} // namespace testconsole
