#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace testconsole {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename... Args>
    explicit constexpr Expected(std::in_place_t /*unused*/, Args&&... args)
        requires(!std::is_void_v<T> && std::constructible_from<ExpectedT, Args...>)
        : data_{std::in_place_type<ExpectedT>, std::forward<Args>(args)...} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
        : data_{std::in_place_type<T>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::is_convertible_v<T, E>)
        : data_{std::in_place_type<E>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const {
        if constexpr (std::is_void_v<T>) {
            return std::holds_alternative<std::monostate>(data_);
        } else {
            return std::holds_alternative<T>(data_);
        }
    }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    U& value()
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<U>(data_);
    }

    template <typename U = T>
    const U& value() const
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<U>(data_);
    }

    template <typename U = T>
    void value() const
        requires(std::is_void_v<U>)
    {
        ASSERT(has_value(), "value() called on an Expected holding an error");
    }

    template <typename U = T>
    U& operator*()
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    const U& operator*() const
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<T>(data_);
    }

    const E& error() const {
        ASSERT(!has_value(), "error() called on an Expected holding a value");
        return std::get<E>(data_);
    }

    template <typename Func>
    Expected<std::invoke_result_t<Func, T>, E> transform(const Func& func) const
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return error();
        }

        return func(value());
    }

    bool operator==(const Expected& rhs) const = default;

private:
    using StorageT = std::conditional_t<std::is_void_v<T>, std::variant<std::monostate, E>, std::variant<T, E>>;

    StorageT data_;
};

} // namespace testconsole

template <typename T, typename E>
struct fmt::formatter<::testconsole::Expected<T, E>> : fmt::formatter<std::string>
{
    auto format(const ::testconsole::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(format_impl(from), ctx);
    }

private:
    static std::string format_impl(const ::testconsole::Expected<T, E>& from) {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::same_as<T, void>) {
            return "Expected(void)";
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
