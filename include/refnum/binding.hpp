#ifndef REFNUM_BINDING_HPP
#define REFNUM_BINDING_HPP

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>

#include <refnum/fixed_string.hpp>
#include <refnum/predicate.hpp>
#include <refnum/primitive.hpp>

namespace refnum {

// --- TypeName: structural wrapper for a type's display name (NTTP-compatible) ---

struct TypeName {
    static constexpr std::size_t Capacity = 32;
    char data[Capacity]{};

    consteval TypeName() = default;
    consteval TypeName(std::string_view s) {
        if (s.size() >= Capacity)
            throw "TypeName too long";
        s.copy(data, s.size());
    }
    consteval TypeName(const char* s) : TypeName(std::string_view(s)) {}

    constexpr std::string_view view() const noexcept { return data; }

    constexpr bool operator==(const TypeName&) const = default;
};

// --- Binding: everything that distinguishes one refinement type from another ---
//
// A Binding is the whole parameter set of a refinement type: its name, the
// primitive it wraps and its validity predicate. Refined<B> is the single
// generic component every binding instantiates.

struct Binding {
    TypeName name{};
    PrimitiveKind kind{PrimitiveKind::Int};
    Predicate pred{};

    constexpr bool operator==(const Binding&) const = default;
};

// --- Structured error reporting ---

template <std::size_t N = 256>
consteval void report_error(const char* category, const TypeName& type,
                            const char* detail) {
    FixedString<N> msg{};
    msg.append("refinement error: ");
    msg.append(category);
    msg.append("\n  type:      ");
    msg.append(type.data);
    msg.append("\n  predicate: ");
    msg.append(detail);
    throw msg.data;
}

// --- Neighbouring representable values ---

namespace detail {

template <std::floating_point F> constexpr F next_up(F x) noexcept {
    using Bits = std::conditional_t<sizeof(F) == 4, std::uint32_t, std::uint64_t>;
    if (x != x || x == std::numeric_limits<F>::infinity())
        return x;
    if (x == 0)
        return std::numeric_limits<F>::denorm_min();
    auto bits = std::bit_cast<Bits>(x);
    bits = x > 0 ? bits + 1 : bits - 1;
    return std::bit_cast<F>(bits);
}

template <std::floating_point F> constexpr F next_down(F x) noexcept {
    return -next_up(-x);
}

template <Primitive P> constexpr P step_up(P x) noexcept {
    if constexpr (std::floating_point<P>)
        return next_up(x);
    else
        return x < std::numeric_limits<P>::max() ? static_cast<P>(x + 1) : x;
}

template <Primitive P> constexpr P step_down(P x) noexcept {
    if constexpr (std::floating_point<P>)
        return next_down(x);
    else
        return x > std::numeric_limits<P>::lowest() ? static_cast<P>(x - 1) : x;
}

// Bound constants are clamped into the primitive's finite range first, so
// a bound outside the range makes the binding unsatisfiable rather than
// wrapping around.
template <Primitive P> constexpr P clamp_bound(double d) noexcept {
    constexpr auto lo = static_cast<double>(std::numeric_limits<P>::lowest());
    constexpr auto hi = static_cast<double>(std::numeric_limits<P>::max());
    if (d <= lo)
        return std::numeric_limits<P>::lowest();
    if (d >= hi)
        return std::numeric_limits<P>::max();
    return static_cast<P>(d);
}

} // namespace detail

// --- MinValue / MaxValue ---
//
// Extremes over the primitive's finite range: a positive floating type's
// maximum is the largest finite value, not infinity.

template <Binding B> consteval primitive_t<B.kind> min_of() {
    using P = primitive_t<B.kind>;
    P lo = std::numeric_limits<P>::lowest();
    if (B.pred.lower.present) {
        lo = detail::clamp_bound<P>(B.pred.lower.value);
        if (!B.pred.holds(lo))
            lo = detail::step_up(lo);
    }
    if (B.pred.nonzero && lo == 0)
        lo = detail::step_up(lo);
    return lo;
}

template <Binding B> consteval primitive_t<B.kind> max_of() {
    using P = primitive_t<B.kind>;
    P hi = std::numeric_limits<P>::max();
    if (B.pred.upper.present) {
        hi = detail::clamp_bound<P>(B.pred.upper.value);
        if (!B.pred.holds(hi))
            hi = detail::step_down(hi);
    }
    if (B.pred.nonzero && hi == 0)
        hi = detail::step_down(hi);
    return hi;
}

// --- Binding validation ---
//
// Run once per instantiated refinement type. A malformed binding stops the
// build with a diagnostic that names it.

template <Binding B> consteval bool validate() {
    if (B.name.data[0] == '\0')
        report_error("binding has no name", B.name, B.pred.describe().data);
    const auto lo = min_of<B>();
    const auto hi = max_of<B>();
    if (!B.pred.holds(lo))
        report_error("no value of the primitive satisfies the lower side",
                     B.name, B.pred.describe().data);
    if (!B.pred.holds(hi))
        report_error("no value of the primitive satisfies the upper side",
                     B.name, B.pred.describe().data);
    if (hi < lo)
        report_error("predicate admits no value", B.name,
                     B.pred.describe().data);
    return true;
}

} // namespace refnum

#endif // REFNUM_BINDING_HPP
