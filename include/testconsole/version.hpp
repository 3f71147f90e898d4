#pragma once

#include <string_view>

#ifndef TESTCONSOLE_VERSION_STRING
#define TESTCONSOLE_VERSION_STRING "0.0.0"
#endif

namespace testconsole {

constexpr std::string_view VERSION_STRING = TESTCONSOLE_VERSION_STRING;

} // namespace testconsole
