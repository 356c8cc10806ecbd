#ifndef REFNUM_OPERATORS_HPP
#define REFNUM_OPERATORS_HPP

#include <cmath>
#include <concepts>
#include <type_traits>
#include <utility>

#include <refnum/refined.hpp>

namespace refnum {

// --- Operator surface ---
//
// Every binary operator unwraps its refinement operands and applies the
// operator to the promoted primitives, so the result type is exactly that
// of the same expression on raw primitives. Floating results are the
// built-in ones; integer results wrap modulo the promoted width instead of
// overflowing. At least one side must be a refinement; primitive-only
// expressions keep the built-in operators.

template <typename L, typename R>
concept MixedOperands =
    Operand<L> && Operand<R> && (RefinedType<L> || RefinedType<R>);

template <typename L, typename R>
concept IntegralOperands =
    MixedOperands<L, R> && IntegralOperand<L> && IntegralOperand<R>;

template <typename L, typename R>
using promoted_t = decltype(std::declval<underlying_t<L>>() + std::declval<underlying_t<R>>());

// --- Arithmetic ---

template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr auto operator+(const L& l, const R& r) noexcept {
    using T = promoted_t<L, R>;
    const auto a = static_cast<T>(underlying(l));
    const auto b = static_cast<T>(underlying(r));
    if constexpr (std::integral<T>)
        return detail::wrap_add(a, b);
    else
        return a + b;
}

template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr auto operator-(const L& l, const R& r) noexcept {
    using T = promoted_t<L, R>;
    const auto a = static_cast<T>(underlying(l));
    const auto b = static_cast<T>(underlying(r));
    if constexpr (std::integral<T>)
        return detail::wrap_sub(a, b);
    else
        return a - b;
}

template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr auto operator*(const L& l, const R& r) noexcept {
    using T = promoted_t<L, R>;
    const auto a = static_cast<T>(underlying(l));
    const auto b = static_cast<T>(underlying(r));
    if constexpr (std::integral<T>)
        return detail::wrap_mul(a, b);
    else
        return a * b;
}

// Integer division by zero is undefined, as on raw primitives.
template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr auto operator/(const L& l, const R& r) noexcept {
    using T = promoted_t<L, R>;
    const auto a = static_cast<T>(underlying(l));
    const auto b = static_cast<T>(underlying(r));
    if constexpr (std::integral<T>)
        return detail::wrap_div(a, b);
    else
        return a / b;
}

// Floating remainder truncates like fmod: the result takes the sign of
// the dividend.
template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr auto operator%(const L& l, const R& r) noexcept {
    using T = promoted_t<L, R>;
    const auto a = static_cast<T>(underlying(l));
    const auto b = static_cast<T>(underlying(r));
    if constexpr (std::integral<T>)
        return detail::wrap_rem(a, b);
    else
        return static_cast<T>(std::fmod(a, b));
}

// --- Comparison ---

template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr bool operator<(const L& l, const R& r) noexcept {
    return underlying(l) < underlying(r);
}

template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr bool operator<=(const L& l, const R& r) noexcept {
    return underlying(l) <= underlying(r);
}

template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr bool operator>(const L& l, const R& r) noexcept {
    return underlying(l) > underlying(r);
}

template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr bool operator>=(const L& l, const R& r) noexcept {
    return underlying(l) >= underlying(r);
}

// Two instances of the same floating refinement holding NaN are equal.
// Everything else is the primitive ==.
template <typename L, typename R>
    requires MixedOperands<L, R>
constexpr bool operator==(const L& l, const R& r) noexcept {
    if constexpr (std::same_as<L, R> && std::floating_point<underlying_t<L>>) {
        if (detail::is_nan(l.value()) && detail::is_nan(r.value()))
            return true;
    }
    return underlying(l) == underlying(r);
}

// --- Bitwise (integral operands only) ---

template <typename L, typename R>
    requires IntegralOperands<L, R>
constexpr auto operator|(const L& l, const R& r) noexcept {
    return underlying(l) | underlying(r);
}

template <typename L, typename R>
    requires IntegralOperands<L, R>
constexpr auto operator&(const L& l, const R& r) noexcept {
    return underlying(l) & underlying(r);
}

template <typename L, typename R>
    requires IntegralOperands<L, R>
constexpr auto operator^(const L& l, const R& r) noexcept {
    return underlying(l) ^ underlying(r);
}

// Shifts keep the promoted left operand's type; the count is taken modulo
// its width.
template <typename L, typename R>
    requires IntegralOperands<L, R>
constexpr auto operator<<(const L& l, const R& r) noexcept {
    return detail::wrap_shl(+underlying(l), underlying(r));
}

template <typename L, typename R>
    requires IntegralOperands<L, R>
constexpr auto operator>>(const L& l, const R& r) noexcept {
    return detail::wrap_shr(+underlying(l), underlying(r));
}

// Unsigned (zero-filling) right shift of the promoted left operand.
template <typename L, typename R>
    requires(IntegralOperand<L> && IntegralOperand<R>)
constexpr auto ushr(const L& l, const R& n) noexcept {
    return detail::wrap_ushr(+underlying(l), underlying(n));
}

} // namespace refnum

#endif // REFNUM_OPERATORS_HPP
