#pragma once

#include <cstdio>

namespace testconsole {

bool is_color_terminal() noexcept;
bool in_terminal(FILE* file) noexcept;

} // namespace testconsole
