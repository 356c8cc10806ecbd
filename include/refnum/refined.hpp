#ifndef REFNUM_REFINED_HPP
#define REFNUM_REFINED_HPP

#include <bit>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include <refnum/binding.hpp>
#include <refnum/catalog.hpp>
#include <refnum/format.hpp>
#include <refnum/predicate.hpp>
#include <refnum/primitive.hpp>
#include <refnum/range.hpp>
#include <refnum/result.hpp>

namespace refnum {

template <Binding B> class Refined;

// --- Classification ---

template <typename T> struct is_refined : std::false_type {};
template <Binding B> struct is_refined<Refined<B>> : std::true_type {};

template <typename T>
concept RefinedType = is_refined<std::remove_cvref_t<T>>::value;

// Anything that can stand on either side of an operator.
template <typename T>
concept Operand = Primitive<std::remove_cvref_t<T>> || RefinedType<T>;

template <Operand T> constexpr auto underlying(const T& x) noexcept {
    if constexpr (RefinedType<T>)
        return x.value();
    else
        return x;
}

template <Operand T>
using underlying_t = decltype(underlying(std::declval<const T&>()));

template <typename T>
concept IntegralOperand = Operand<T> && std::integral<underlying_t<T>>;

template <Binding From, Binding To>
inline constexpr bool widens_v = !(From == To) && widens(From, To);

// --- Derived result types ---
//
// round/floor/to_radians/... produce a value whose predicate follows from
// the source predicate. It resolves to the catalog type carrying that
// predicate, or to the bare primitive when nothing is left to guarantee.

namespace detail {

template <PrimitiveKind K, Predicate Pr> struct derived_key {
    static constexpr Predicate pred = Pr.normalized(K);
    static constexpr bool trivial = pred.is_trivial();
};

template <PrimitiveKind K, Predicate Pr, bool Trivial> struct derived {
    using type = Refined<find_binding(K, Pr)>;
};

template <PrimitiveKind K, Predicate Pr> struct derived<K, Pr, true> {
    using type = primitive_t<K>;
};

template <typename R, Primitive P> constexpr R make_derived(P x) {
    if constexpr (RefinedType<R>)
        return R::ensuring_valid(x);
    else
        return x;
}

// floor(x + 0.5) without the rounding error of the addition: x - floor(x)
// is exact, and infinities and NaN pass through floor unchanged.
template <std::floating_point F> F round_half_up(F x) noexcept {
    const F down = std::floor(x);
    if (x - down >= F(0.5))
        return down + F(1);
    return down;
}

inline constexpr double DegreesToRadians = 0.017453292519943295;
inline constexpr double RadiansToDegrees = 57.29577951308232;

} // namespace detail

template <PrimitiveKind K, Predicate Pr>
using derived_t = typename detail::derived<K, detail::derived_key<K, Pr>::pred,
                                           detail::derived_key<K, Pr>::trivial>::type;

// --- Refined: a primitive value that satisfies B.pred ---
//
// The only state is the primitive itself. Every way to obtain an instance
// checks B.pred exactly once, at construction:
//   - literals (consteval constructor, rejected at compile time),
//   - from / ensuring_valid / from_or_else / good_or_else / trying_valid,
//   - widening from another refinement whose predicate implies B.pred.

template <Binding B> class Refined {
    static_assert(validate<B>());

    // Bindings confined to '0'..'9' get the digit extras.
    static constexpr bool digit_binding =
        B.kind == PrimitiveKind::Char && B.pred.lower.present &&
        B.pred.lower.value >= '0' && B.pred.upper.present &&
        B.pred.upper.value <= '9';

  public:
    using primitive_type = primitive_t<B.kind>;
    using P = primitive_type;

    static constexpr Binding binding = B;
    static constexpr PrimitiveKind kind = B.kind;

    static const Refined MinValue;
    static const Refined MaxValue;

    // --- Construction ---

    // Literal-checked: the argument must be a constant expression and must
    // satisfy the predicate, otherwise the program does not compile.
    template <WidensTo<P> U>
    consteval Refined(U literal) : value_(checked_literal(static_cast<P>(literal))) {}

    // Widening from a refinement whose predicate implies ours.
    template <Binding Other>
        requires widens_v<Other, B>
    constexpr Refined(const Refined<Other>& other) noexcept
        : value_(static_cast<P>(other.value())) {}

    template <WidensTo<P> U> static constexpr bool is_valid(U x) noexcept {
        return B.pred.holds(static_cast<P>(x));
    }

    template <WidensTo<P> U>
    static constexpr std::optional<Refined> from(U x) noexcept {
        const auto p = static_cast<P>(x);
        if (B.pred.holds(p))
            return Refined(unchecked_t{}, p);
        return std::nullopt;
    }

    template <WidensTo<P> U> static constexpr Refined ensuring_valid(U x) {
        const auto p = static_cast<P>(x);
        if (!B.pred.holds(p))
            throw AssertionError(invalid_message(p));
        return Refined(unchecked_t{}, p);
    }

    template <WidensTo<P> U>
    static constexpr Refined from_or_else(U x, const Refined& fallback) noexcept {
        const auto p = static_cast<P>(x);
        if (B.pred.holds(p))
            return Refined(unchecked_t{}, p);
        return fallback;
    }

    template <WidensTo<P> U, std::invocable<P> F>
    static auto good_or_else(U x, F&& on_invalid)
        -> Or<Refined, std::invoke_result_t<F&, P>> {
        const auto p = static_cast<P>(x);
        if (B.pred.holds(p))
            return Good{Refined(unchecked_t{}, p)};
        return Bad{std::invoke(on_invalid, p)};
    }

    template <WidensTo<P> U, std::invocable<P> F>
    static auto pass_or_else(U x, F&& on_invalid)
        -> Validation<std::invoke_result_t<F&, P>> {
        const auto p = static_cast<P>(x);
        if (B.pred.holds(p))
            return Pass{};
        return Fail{std::invoke(on_invalid, p)};
    }

    template <WidensTo<P> U>
    static Or<Refined, AssertionError> trying_valid(U x) {
        const auto p = static_cast<P>(x);
        if (B.pred.holds(p))
            return Good{Refined(unchecked_t{}, p)};
        return Bad{AssertionError(invalid_message(p))};
    }

    // Applies f to the value and asserts that the result is still valid.
    template <typename F>
        requires std::is_invocable_r_v<P, F&, P>
    constexpr Refined ensuring_valid_with(F&& f) const {
        return ensuring_valid(static_cast<P>(std::invoke(f, value_)));
    }

    // --- Value surface ---

    constexpr P value() const noexcept { return value_; }

    constexpr std::int8_t to_byte() const noexcept { return convert<std::int8_t>(value_); }
    constexpr std::int16_t to_short() const noexcept { return convert<std::int16_t>(value_); }
    constexpr char to_char() const noexcept { return convert<char>(value_); }
    constexpr std::int32_t to_int() const noexcept { return convert<std::int32_t>(value_); }
    constexpr std::int64_t to_long() const noexcept { return convert<std::int64_t>(value_); }
    constexpr float to_float() const noexcept { return convert<float>(value_); }
    constexpr double to_double() const noexcept { return convert<double>(value_); }

    // Implicit widening to primitives the underlying primitive widens to.
    template <Primitive To>
        requires(widens_to(B.kind, kind_of<To>))
    constexpr operator To() const noexcept {
        return static_cast<To>(value_);
    }

    std::string to_string() const {
        std::string s(B.name.view());
        s += '(';
        s += format_primitive(value_);
        s += ')';
        return s;
    }

    friend std::ostream& operator<<(std::ostream& os, const Refined& r) {
        return os << r.to_string();
    }

    // --- Unary operators ---

    constexpr Refined operator+() const noexcept { return *this; }
    // Integers wrap: -MinValue of Int or Long is MinValue again.
    constexpr auto operator-() const noexcept {
        if constexpr (std::integral<P>)
            return detail::wrap_neg(+value_);
        else
            return -value_;
    }
    constexpr auto operator~() const noexcept
        requires std::integral<P>
    {
        return ~value_;
    }

    // --- min / max ---
    //
    // The result is *this when the primitive max/min equals value(), and
    // `that` otherwise. Ties keep *this (so -0.0 and 0.0 are never swapped);
    // the primitive result of a NaN operand is NaN, which equals nothing, so
    // any NaN yields `that`.

    constexpr Refined max(const Refined& that) const noexcept {
        if constexpr (std::floating_point<P>) {
            if (detail::is_nan(value_) || detail::is_nan(that.value_))
                return that;
        }
        return that.value_ > value_ ? that : *this;
    }

    constexpr Refined min(const Refined& that) const noexcept {
        if constexpr (std::floating_point<P>) {
            if (detail::is_nan(value_) || detail::is_nan(that.value_))
                return that;
        }
        return that.value_ < value_ ? that : *this;
    }

    // --- Ranges over the underlying primitive ---

    NumericRange<P> to(P end) const { return {value_, end, P{1}, true}; }
    NumericRange<P> to(P end, P step) const { return {value_, end, step, true}; }
    NumericRange<P> until(P end) const { return {value_, end, P{1}, false}; }
    NumericRange<P> until(P end, P step) const { return {value_, end, step, false}; }

    // --- Floating extras ---

    bool is_whole() const noexcept
        requires std::floating_point<P>
    {
        return detail::is_finite(value_) && std::trunc(value_) == value_;
    }

    constexpr bool is_pos_infinity() const noexcept
        requires std::floating_point<P>
    {
        return value_ == std::numeric_limits<P>::infinity();
    }

    constexpr bool is_neg_infinity() const noexcept
        requires std::floating_point<P>
    {
        return value_ == -std::numeric_limits<P>::infinity();
    }

    static constexpr Refined positive_infinity() noexcept
        requires(std::floating_point<P> &&
                 B.pred.holds(std::numeric_limits<P>::infinity()))
    {
        return Refined(unchecked_t{}, std::numeric_limits<P>::infinity());
    }

    static constexpr Refined negative_infinity() noexcept
        requires(std::floating_point<P> &&
                 B.pred.holds(-std::numeric_limits<P>::infinity()))
    {
        return Refined(unchecked_t{}, -std::numeric_limits<P>::infinity());
    }

    // Float rounds to an Int refinement, Double to a Long refinement.
    // Halfway cases round up (towards positive infinity), NaN becomes 0 and
    // out-of-range results saturate.
    auto round() const
        requires std::floating_point<P>
    {
        constexpr auto K = kind == PrimitiveKind::Float ? PrimitiveKind::Int
                                                        : PrimitiveKind::Long;
        using R = derived_t<K, B.pred.round_of()>;
        return detail::make_derived<R>(convert<primitive_t<K>>(detail::round_half_up(value_)));
    }

    auto ceil() const
        requires std::floating_point<P>
    {
        using R = derived_t<B.kind, B.pred.ceil_of()>;
        return detail::make_derived<R>(static_cast<P>(std::ceil(value_)));
    }

    auto floor() const
        requires std::floating_point<P>
    {
        using R = derived_t<B.kind, B.pred.floor_of()>;
        return detail::make_derived<R>(static_cast<P>(std::floor(value_)));
    }

    constexpr auto to_radians() const
        requires std::floating_point<P>
    {
        using R = derived_t<B.kind, B.pred.radians_of()>;
        return detail::make_derived<R>(
            static_cast<P>(static_cast<double>(value_) * detail::DegreesToRadians));
    }

    constexpr auto to_degrees() const
        requires std::floating_point<P>
    {
        using R = derived_t<B.kind, B.pred.degrees_of()>;
        return detail::make_derived<R>(
            static_cast<P>(static_cast<double>(value_) * detail::RadiansToDegrees));
    }

    // --- Digit extras ---

    constexpr int as_digit() const noexcept
        requires digit_binding
    {
        return value_ - '0';
    }

    constexpr auto as_digit_pos_z_int() const
        requires digit_binding
    {
        using R = derived_t<PrimitiveKind::Int, Predicate{.lower = {true, 0.0, false}}>;
        return detail::make_derived<R>(static_cast<std::int32_t>(value_ - '0'));
    }

  private:
    template <Binding> friend class Refined;

    struct unchecked_t {};

    constexpr Refined(unchecked_t, P x) noexcept : value_(x) {}

    static consteval P checked_literal(P x) {
        if (!B.pred.holds(x))
            report_error("literal does not satisfy the predicate", B.name,
                         B.pred.describe().data);
        return x;
    }

    static std::string invalid_message(P x) {
        std::string msg = format_primitive(x);
        msg += " was not a valid ";
        msg += B.name.view();
        return msg;
    }

    P value_;
};

template <Binding B>
constexpr Refined<B> Refined<B>::MinValue{Refined::unchecked_t{}, min_of<B>()};

template <Binding B>
constexpr Refined<B> Refined<B>::MaxValue{Refined::unchecked_t{}, max_of<B>()};

// --- Ordering ---
//
// operator< and friends follow the primitive (false whenever NaN is
// involved). compare() is a total order for sorting: -0.0 before 0.0,
// NaN after everything else, NaN equal to NaN.

namespace detail {

template <Primitive P> constexpr int total_compare(P a, P b) noexcept {
    if (a < b)
        return -1;
    if (a > b)
        return 1;
    if constexpr (std::floating_point<P>) {
        const bool a_nan = is_nan(a);
        const bool b_nan = is_nan(b);
        if (a_nan || b_nan)
            return a_nan == b_nan ? 0 : (a_nan ? 1 : -1);
        using Bits = std::conditional_t<sizeof(P) == 4, std::uint32_t, std::uint64_t>;
        constexpr int shift = sizeof(P) * 8 - 1;
        const bool a_neg = (std::bit_cast<Bits>(a) >> shift) != 0;
        const bool b_neg = (std::bit_cast<Bits>(b) >> shift) != 0;
        if (a_neg != b_neg)
            return a_neg ? -1 : 1;
    }
    return 0;
}

} // namespace detail

template <RefinedType T> constexpr int compare(const T& a, const T& b) noexcept {
    return detail::total_compare(a.value(), b.value());
}

struct Ordering {
    template <RefinedType T>
    constexpr bool operator()(const T& a, const T& b) const noexcept {
        return compare(a, b) < 0;
    }
};

} // namespace refnum

template <refnum::Binding B> struct std::hash<refnum::Refined<B>> {
    std::size_t operator()(const refnum::Refined<B>& r) const noexcept {
        using P = typename refnum::Refined<B>::primitive_type;
        const P x = r.value();
        if constexpr (std::floating_point<P>) {
            // every NaN compares equal, so every NaN must hash alike
            if (x != x)
                return std::hash<P>{}(std::numeric_limits<P>::quiet_NaN());
        }
        return std::hash<P>{}(x);
    }
};

#include <refnum/operators.hpp>

#endif // REFNUM_REFINED_HPP
