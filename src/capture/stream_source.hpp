#pragma once

#include <string>

namespace testconsole {

/// Provides the captured output of a test class
class StreamSource
{
public:
    virtual ~StreamSource() = default;

    virtual std::string read_out(const std::string& class_name) const = 0;

    virtual std::string read_err(const std::string& class_name) const = 0;
};

} // namespace testconsole
