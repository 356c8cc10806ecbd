#ifndef REFNUM_PREDICATE_HPP
#define REFNUM_PREDICATE_HPP

#include <concepts>

#include <refnum/fixed_string.hpp>
#include <refnum/primitive.hpp>

namespace refnum {

// --- Bound: one side of an interval ---

struct Bound {
    bool present{false};
    double value{0.0};
    bool strict{false}; // true for < and >, false for <= and >=

    constexpr bool operator==(const Bound&) const = default;
};

// --- Predicate: {#v : P | lower && upper && nonzero && finite} ---
//
// Structural type, so a predicate can be carried as a template argument.
// Every construction path of a refinement type goes through holds().

struct Predicate {
    Bound lower{};
    Bound upper{};
    bool nonzero{false};
    bool finite{false};

    constexpr bool operator==(const Predicate&) const = default;

    template <Primitive P> constexpr bool holds(P x) const noexcept {
        if (lower.present &&
            !(lower.strict ? x > lower.value : x >= lower.value))
            return false;
        if (upper.present &&
            !(upper.strict ? x < upper.value : x <= upper.value))
            return false;
        if (nonzero && x == 0)
            return false;
        if constexpr (std::floating_point<P>) {
            if (finite && !detail::is_finite(x))
                return false;
        }
        return true;
    }

    constexpr bool is_trivial() const noexcept {
        return !lower.present && !upper.present && !nonzero && !finite;
    }

    // Integral values are always finite.
    constexpr Predicate normalized(PrimitiveKind k) const noexcept {
        Predicate p = *this;
        if (is_integral_kind(k))
            p.finite = false;
        return p;
    }

    constexpr bool excludes_zero() const noexcept {
        if (nonzero)
            return true;
        if (lower.present &&
            (lower.value > 0 || (lower.value == 0 && lower.strict)))
            return true;
        if (upper.present &&
            (upper.value < 0 || (upper.value == 0 && upper.strict)))
            return true;
        return false;
    }

    // --- Derived predicates for rounding and scaling ---
    //
    // floor(x) <= x: the upper bound survives as is. The lower bound only
    // survives when it is a whole number, and then loses its strictness.
    constexpr Predicate floor_of() const noexcept {
        Predicate p = *this;
        p.lower = relaxed_whole(lower);
        p.nonzero = false;
        return p;
    }

    constexpr Predicate ceil_of() const noexcept {
        Predicate p = *this;
        p.upper = relaxed_whole(upper);
        p.nonzero = false;
        return p;
    }

    // Target of round() is always integral, so `finite` goes as well.
    constexpr Predicate round_of() const noexcept {
        Predicate p{};
        p.lower = relaxed_whole(lower);
        p.upper = relaxed_whole(upper);
        return p;
    }

    // x * (pi / 180) keeps the sign but may underflow to zero.
    constexpr Predicate radians_of() const noexcept {
        Predicate p = *this;
        p.lower = relaxed_zero(lower);
        p.upper = relaxed_zero(upper);
        p.nonzero = false;
        return p;
    }

    // x * (180 / pi) keeps the sign and never reaches zero, but may
    // overflow to infinity.
    constexpr Predicate degrees_of() const noexcept {
        Predicate p = *this;
        if (p.lower.present && p.lower.value != 0)
            p.lower = Bound{};
        if (p.upper.present && p.upper.value != 0)
            p.upper = Bound{};
        p.finite = false;
        return p;
    }

    consteval FixedString<96> describe() const {
        FixedString<96> s;
        auto sep = [&s]() consteval {
            if (s.len > 0)
                s.append(" && ");
        };
        if (lower.present) {
            sep();
            s.append(lower.strict ? "#v > " : "#v >= ");
            s.append_double(lower.value);
        }
        if (upper.present) {
            sep();
            s.append(upper.strict ? "#v < " : "#v <= ");
            s.append_double(upper.value);
        }
        if (nonzero) {
            sep();
            s.append("#v != 0");
        }
        if (finite) {
            sep();
            s.append("finite(#v)");
        }
        if (s.len == 0)
            s.append("true");
        return s;
    }

  private:
    static constexpr bool is_whole(double d) noexcept {
        constexpr double limit = 9007199254740992.0; // 2^53
        if (d >= limit || d <= -limit)
            return true;
        return static_cast<double>(static_cast<long long>(d)) == d;
    }

    static constexpr Bound relaxed_whole(Bound b) noexcept {
        if (!b.present || !is_whole(b.value))
            return Bound{};
        b.strict = false;
        return b;
    }

    static constexpr Bound relaxed_zero(Bound b) noexcept {
        if (!b.present || b.value != 0)
            return Bound{};
        b.strict = false;
        return b;
    }
};

// --- Implication ---
//
// True when every value of src_kind satisfying src, converted to dst_kind,
// satisfies dst. Conversions along the widening table never flip a sign,
// never turn a non-zero value into zero and never produce a non-finite
// value, so the check reduces to comparing bounds and flags.

constexpr bool lower_implies(const Bound& src, const Bound& dst) noexcept {
    if (!dst.present)
        return true;
    if (!src.present)
        return false;
    if (src.value != dst.value)
        return src.value > dst.value;
    return src.strict || !dst.strict;
}

constexpr bool upper_implies(const Bound& src, const Bound& dst) noexcept {
    if (!dst.present)
        return true;
    if (!src.present)
        return false;
    if (src.value != dst.value)
        return src.value < dst.value;
    return src.strict || !dst.strict;
}

constexpr bool implies(PrimitiveKind src_kind, const Predicate& src,
                       PrimitiveKind dst_kind, const Predicate& dst) noexcept {
    if (!widens_to(src_kind, dst_kind))
        return false;
    if (!lower_implies(src.lower, dst.lower) ||
        !upper_implies(src.upper, dst.upper))
        return false;
    if (dst.nonzero && !src.excludes_zero())
        return false;
    if (dst.finite && is_floating_kind(dst_kind) && is_floating_kind(src_kind) &&
        !src.finite)
        return false;
    return true;
}

// Intersection: the tighter bound wins on each side.
consteval Predicate operator&&(Predicate a, Predicate b) {
    Predicate r = a;
    if (b.lower.present &&
        (!r.lower.present || lower_implies(b.lower, r.lower)))
        r.lower = b.lower;
    if (b.upper.present &&
        (!r.upper.present || upper_implies(b.upper, r.upper)))
        r.upper = b.upper;
    r.nonzero = a.nonzero || b.nonzero;
    r.finite = a.finite || b.finite;
    return r;
}

// --- Predicate DSL ---
//
// Lets a binding spell its predicate the way it is documented:
//   v > 0, v >= '0' && v <= '9', v != 0 && finite(v)

namespace dsl {

struct ValueVar {};

inline constexpr ValueVar v{};

consteval Predicate operator>(ValueVar, double b) {
    return Predicate{.lower = {true, b, true}};
}
consteval Predicate operator>=(ValueVar, double b) {
    return Predicate{.lower = {true, b, false}};
}
consteval Predicate operator<(ValueVar, double b) {
    return Predicate{.upper = {true, b, true}};
}
consteval Predicate operator<=(ValueVar, double b) {
    return Predicate{.upper = {true, b, false}};
}
consteval Predicate operator!=(ValueVar, double b) {
    if (b != 0)
        throw "only `v != 0` is supported";
    return Predicate{.nonzero = true};
}
consteval Predicate finite(ValueVar) { return Predicate{.finite = true}; }

} // namespace dsl

} // namespace refnum

#endif // REFNUM_PREDICATE_HPP
