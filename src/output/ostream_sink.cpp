#include "output/ostream_sink.hpp"

#include <ostream>
#include <string_view>

namespace testconsole {

void OstreamSink::write(std::string_view str) {
    *stream_ << str;
}

void OstreamSink::flush() {
    stream_->flush();
}

} // namespace testconsole
