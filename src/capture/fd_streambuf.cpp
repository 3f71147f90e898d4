#include "capture/fd_streambuf.hpp"

#include <testconsole/common/linux.hpp>

#include <cstddef>
#include <string_view>

namespace testconsole {

FdStreamBuf::FdStreamBuf(int fd)
    : fd_{fd} {
    setp(buffer_.data(), buffer_.data() + buffer_.size());
}

FdStreamBuf::~FdStreamBuf() {
    // Nothing to be done about a failure here; it was logged by linux::write
    flush_buffer();
}

FdStreamBuf::int_type FdStreamBuf::overflow(int_type ch) {
    if (!flush_buffer()) {
        return traits_type::eof();
    }

    if (!traits_type::eq_int_type(ch, traits_type::eof())) {
        *pptr() = traits_type::to_char_type(ch);
        pbump(1);
    }

    return traits_type::not_eof(ch);
}

int FdStreamBuf::sync() {
    return flush_buffer() ? 0 : -1;
}

bool FdStreamBuf::flush_buffer() {
    const auto pending = static_cast<std::size_t>(pptr() - pbase());
    if (pending == 0) {
        return true;
    }

    auto res = linux::write(fd_, std::string_view{pbase(), pending});
    setp(buffer_.data(), buffer_.data() + buffer_.size());

    return res.has_value();
}

} // namespace testconsole
