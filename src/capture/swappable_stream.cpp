#include "capture/swappable_stream.hpp"

#include <libassert/assert.hpp>

#include <mutex>
#include <ostream>
#include <streambuf>
#include <string>

namespace testconsole {

ForwardingStreamBuf::ForwardingStreamBuf(std::streambuf* target)
    : target_{target} {
    ASSERT(target != nullptr);
}

std::streambuf* ForwardingStreamBuf::swap(std::streambuf* target) {
    ASSERT(target != nullptr);

    std::lock_guard lock{mutex_};
    target_->pubsync();

    std::streambuf* prev = target_;
    target_ = target;
    return prev;
}

std::streambuf* ForwardingStreamBuf::get_target() const {
    std::lock_guard lock{mutex_};
    return target_;
}

ForwardingStreamBuf::int_type ForwardingStreamBuf::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }

    std::lock_guard lock{mutex_};
    return target_->sputc(traits_type::to_char_type(ch));
}

std::streamsize ForwardingStreamBuf::xsputn(const char* str, std::streamsize count) {
    std::lock_guard lock{mutex_};
    return target_->sputn(str, count);
}

int ForwardingStreamBuf::sync() {
    std::lock_guard lock{mutex_};
    return target_->pubsync();
}

SwappableStream::SwappableStream(std::ostream& stream)
    : stream_{&stream}
    , original_{stream.rdbuf()}
    , forwarding_buf_{original_}
    , original_stream_{original_} {
    stream_->flush();
    stream_->rdbuf(&forwarding_buf_);
}

SwappableStream::~SwappableStream() {
    stream_->flush();
    stream_->rdbuf(original_);
}

std::streambuf* SwappableStream::swap(std::streambuf* target) {
    stream_->flush();
    return forwarding_buf_.swap(target);
}

} // namespace testconsole
