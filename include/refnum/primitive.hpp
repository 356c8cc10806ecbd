#ifndef REFNUM_PRIMITIVE_HPP
#define REFNUM_PRIMITIVE_HPP

#include <concepts>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace refnum {

// --- Primitive kinds ---
//
// The seven numeric primitives a refinement can wrap. Byte/Short/Int/Long
// are the fixed-width signed integers, Char is the character code unit.

enum class PrimitiveKind { Byte, Short, Char, Int, Long, Float, Double };

namespace detail {
template <PrimitiveKind K> struct primitive_of;
template <> struct primitive_of<PrimitiveKind::Byte> { using type = std::int8_t; };
template <> struct primitive_of<PrimitiveKind::Short> { using type = std::int16_t; };
template <> struct primitive_of<PrimitiveKind::Char> { using type = char; };
template <> struct primitive_of<PrimitiveKind::Int> { using type = std::int32_t; };
template <> struct primitive_of<PrimitiveKind::Long> { using type = std::int64_t; };
template <> struct primitive_of<PrimitiveKind::Float> { using type = float; };
template <> struct primitive_of<PrimitiveKind::Double> { using type = double; };
} // namespace detail

template <PrimitiveKind K> using primitive_t = typename detail::primitive_of<K>::type;

// bool is deliberately absent: it never takes part in numeric operations.
// long long is a second spelling of Long where std::int64_t is long.
template <typename T>
concept Primitive =
    std::same_as<T, std::int8_t> || std::same_as<T, std::int16_t> ||
    std::same_as<T, char> || std::same_as<T, std::int32_t> ||
    std::same_as<T, std::int64_t> || std::same_as<T, long long> ||
    std::same_as<T, float> || std::same_as<T, double>;

namespace detail {
template <Primitive P> consteval PrimitiveKind kind_of_impl() {
    if constexpr (std::same_as<P, std::int8_t>)
        return PrimitiveKind::Byte;
    else if constexpr (std::same_as<P, std::int16_t>)
        return PrimitiveKind::Short;
    else if constexpr (std::same_as<P, char>)
        return PrimitiveKind::Char;
    else if constexpr (std::same_as<P, std::int32_t>)
        return PrimitiveKind::Int;
    else if constexpr (std::same_as<P, std::int64_t> || std::same_as<P, long long>)
        return PrimitiveKind::Long;
    else if constexpr (std::same_as<P, float>)
        return PrimitiveKind::Float;
    else
        return PrimitiveKind::Double;
}
} // namespace detail

template <Primitive P> inline constexpr PrimitiveKind kind_of = detail::kind_of_impl<P>();

constexpr bool is_floating_kind(PrimitiveKind k) noexcept {
    return k == PrimitiveKind::Float || k == PrimitiveKind::Double;
}

constexpr bool is_integral_kind(PrimitiveKind k) noexcept {
    return !is_floating_kind(k);
}

constexpr const char* kind_name(PrimitiveKind k) noexcept {
    switch (k) {
    case PrimitiveKind::Byte:
        return "Byte";
    case PrimitiveKind::Short:
        return "Short";
    case PrimitiveKind::Char:
        return "Char";
    case PrimitiveKind::Int:
        return "Int";
    case PrimitiveKind::Long:
        return "Long";
    case PrimitiveKind::Float:
        return "Float";
    case PrimitiveKind::Double:
        return "Double";
    }
    return "<unknown>";
}

// --- Widening table ---
//
// from -> to is a widening when every value of `from` has a counterpart in
// `to` without a change of sign or magnitude class. Int/Long -> Float and
// Long -> Double may round but never overflows.

constexpr bool widens_to(PrimitiveKind from, PrimitiveKind to) noexcept {
    using K = PrimitiveKind;
    if (from == to)
        return true;
    switch (from) {
    case K::Byte:
        return to == K::Short || to == K::Int || to == K::Long ||
               to == K::Float || to == K::Double;
    case K::Short:
    case K::Char:
        return to == K::Int || to == K::Long || to == K::Float ||
               to == K::Double;
    case K::Int:
        return to == K::Long || to == K::Float || to == K::Double;
    case K::Long:
        return to == K::Float || to == K::Double;
    case K::Float:
        return to == K::Double;
    case K::Double:
        return false;
    }
    return false;
}

template <typename U, typename P>
concept WidensTo = Primitive<U> && Primitive<P> &&
                   (widens_to(kind_of<U>, kind_of<P>));

// --- Conversions ---

namespace detail {

template <std::signed_integral I, std::floating_point F>
constexpr I saturate(F x) noexcept {
    if (x != x)
        return 0;
    // static_cast<F>(max) rounds up to a power of two for float
    constexpr F upper = static_cast<F>(std::numeric_limits<I>::max());
    constexpr F lower = static_cast<F>(std::numeric_limits<I>::min());
    if (x >= upper)
        return std::numeric_limits<I>::max();
    if (x <= lower)
        return std::numeric_limits<I>::min();
    return static_cast<I>(x);
}

template <std::floating_point F> constexpr bool is_finite(F x) noexcept {
    return x - x == 0;
}

template <std::floating_point F> constexpr bool is_nan(F x) noexcept {
    return x != x;
}

} // namespace detail

// Total primitive conversion. Floating -> Int/Long truncates toward zero
// and saturates (NaN -> 0); floating -> Byte/Short/Char goes through Int and
// then narrows modularly. Every other pair is a plain static_cast.
template <Primitive To, Primitive From> constexpr To convert(From x) noexcept {
    if constexpr (std::floating_point<From> && std::integral<To>) {
        if constexpr (kind_of<To> == PrimitiveKind::Long)
            return static_cast<To>(detail::saturate<std::int64_t>(x));
        else
            return static_cast<To>(detail::saturate<std::int32_t>(x));
    } else {
        return static_cast<To>(x);
    }
}

// --- Wrapping integer arithmetic ---
//
// Integer results wrap modulo 2^N of the (already promoted) operand type.
// The work is done in the unsigned counterpart and converted back, which is
// modular. Shift counts use only their low log2(N) bits. Division by zero
// stays the caller's precondition.

namespace detail {

template <std::integral T> constexpr T wrap_add(T a, T b) noexcept {
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(a) + static_cast<U>(b));
}

template <std::integral T> constexpr T wrap_sub(T a, T b) noexcept {
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(a) - static_cast<U>(b));
}

template <std::integral T> constexpr T wrap_mul(T a, T b) noexcept {
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(a) * static_cast<U>(b));
}

template <std::integral T> constexpr T wrap_neg(T a) noexcept {
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(U{0} - static_cast<U>(a));
}

// min / -1 is the only quotient that overflows; it wraps back to min.
template <std::integral T> constexpr T wrap_div(T a, T b) noexcept {
    if (b == -1)
        return wrap_neg(a);
    return a / b;
}

template <std::integral T> constexpr T wrap_rem(T a, T b) noexcept {
    if (b == -1)
        return 0;
    return a % b;
}

template <std::integral T, std::integral C> constexpr int shift_count(C n) noexcept {
    constexpr auto mask = static_cast<long long>(sizeof(T) * 8 - 1);
    return static_cast<int>(static_cast<long long>(n) & mask);
}

template <std::integral T, std::integral C> constexpr T wrap_shl(T a, C n) noexcept {
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(a) << shift_count<T>(n));
}

template <std::integral T, std::integral C> constexpr T wrap_shr(T a, C n) noexcept {
    return static_cast<T>(a >> shift_count<T>(n));
}

template <std::integral T, std::integral C> constexpr T wrap_ushr(T a, C n) noexcept {
    using U = std::make_unsigned_t<T>;
    return static_cast<T>(static_cast<U>(a) >> shift_count<T>(n));
}

} // namespace detail

} // namespace refnum

#endif // REFNUM_PRIMITIVE_HPP
