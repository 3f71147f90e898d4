#pragma once

#include "output/sink.hpp"

#include <ostream>
#include <string_view>

namespace testconsole {

/// Writes to a stream that it does not own
class OstreamSink : public Sink
{
public:
    explicit OstreamSink(std::ostream& stream)
        : stream_{&stream} {}

    void write(std::string_view str) override;
    void flush() override;

    ~OstreamSink() override = default;

private:
    std::ostream* stream_;
};

} // namespace testconsole
