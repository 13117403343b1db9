#pragma once

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace junitgrader {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type (may be void)
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

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T> && !std::convertible_to<Tu, E>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && (std::is_void_v<T> || !std::convertible_to<Eu, T>))
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    constexpr std::add_lvalue_reference_t<T> value()
        requires(!std::is_void_v<T>)
    {
        DEBUG_ASSERT(has_value(), "Bad expected access");
        return std::get<0>(data_);
    }

    constexpr std::add_lvalue_reference_t<const T> value() const
        requires(!std::is_void_v<T>)
    {
        DEBUG_ASSERT(has_value(), "Bad expected access");
        return std::get<0>(data_);
    }

    constexpr void value() const
        requires(std::is_void_v<T>)
    {
        DEBUG_ASSERT(has_value(), "Bad expected access");
    }

    constexpr std::add_lvalue_reference_t<T> operator*()
        requires(!std::is_void_v<T>)
    {
        return value();
    }

    constexpr std::add_lvalue_reference_t<const T> operator*() const
        requires(!std::is_void_v<T>)
    {
        return value();
    }

    constexpr std::add_pointer_t<T> operator->()
        requires(!std::is_void_v<T>)
    {
        return &value();
    }

    constexpr std::add_pointer_t<const T> operator->() const
        requires(!std::is_void_v<T>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(!has_value(), "Bad expected error access");
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    template <typename Func>
    constexpr auto transform(const Func& func) const
        -> Expected<std::invoke_result_t<Func, std::add_lvalue_reference_t<const T>>, E>
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return error();
        }

        return func(value());
    }

    constexpr bool operator==(const Expected& rhs) const = default;

    template <typename Tu>
    constexpr bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    {
        return has_value() && value() == rhs;
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E> &&
                 (std::is_void_v<T> || !std::equality_comparable_with<Eu, T>))
    {
        return has_error() && error() == rhs;
    }

private:
    using ValueStorage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::variant<ValueStorage, E> data_;
};

} // namespace junitgrader

template <typename T, typename E>
struct fmt::formatter<::junitgrader::Expected<T, E>> : fmt::formatter<std::string>
{
    auto format(const ::junitgrader::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(format_impl(from), ctx);
    }

private:
    static std::string format_impl(const ::junitgrader::Expected<T, E>& from) {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::is_void_v<T>) {
            return "Expected(void)";
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
