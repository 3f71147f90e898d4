#pragma once

#include <testconsole/common/formatters/enum.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <fmt/core.h>
#include <fmt/format.h>

#include <string_view>

#define FMT_SERIALIZE_ENUMERATOR_IMPL(r, enum_name, ident)                                                             \
    case enum_name::ident:                                                                                             \
        return BOOST_PP_STRINGIZE(ident);

/// Generates an fmt::formatter for an enum, printing enumerator names.
/// "{}" -> "Serial", "{:?}" -> "::testconsole::ParallelMode{Serial}"
/// Must be used at global scope with a fully qualified enum name.
#define FMT_SERIALIZE_ENUM(enum_name, ... /*enumerators*/)                                                             \
    template <>                                                                                                        \
    struct testconsole::detail::EnumNames<enum_name>                                                                   \
    {                                                                                                                  \
        static constexpr std::string_view ENUM_NAME = #enum_name;                                                      \
        static constexpr std::string_view get(enum_name from) {                                                        \
            switch (from) {                                                                                            \
                BOOST_PP_SEQ_FOR_EACH(FMT_SERIALIZE_ENUMERATOR_IMPL, enum_name, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)) \
            }                                                                                                          \
            return {};                                                                                                 \
        }                                                                                                              \
    };                                                                                                                 \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name> : ::testconsole::detail::EnumFormatter<enum_name>                                 \
    {                                                                                                                  \
    }
