#pragma once

#include <testconsole/common/formatters/debug.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

#include <string_view>

namespace testconsole::detail {

/// Enumerator name lookup. Specialized by FMT_SERIALIZE_ENUM; do not specialize manually.
template <typename Enum>
struct EnumNames;

template <typename Enum>
struct EnumFormatter
{
    DebugFormatter debug_parser;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        // parse a potential '?' spec
        return debug_parser.parse(ctx);
    }

    auto format(const Enum& from, fmt::format_context& ctx) const {
        const std::string_view name = EnumNames<Enum>::get(from);

        if (name.empty()) {
            return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
        }

        if (debug_parser.is_debug_format) {
            return fmt::format_to(ctx.out(), "{}{{{}}}", EnumNames<Enum>::ENUM_NAME, name);
        }

        return fmt::format_to(ctx.out(), "{}", name);
    }
};

} // namespace testconsole::detail
