#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <random>
#include <type_traits>

#include <refnum/types.hpp>

using refnum::underlying;
using refnum::ushr;

namespace {

template <typename P> bool same_value(P a, P b) {
    if constexpr (std::is_floating_point_v<P>) {
        if (a != a && b != b)
            return true;
    }
    return a == b;
}

// Reference results on the unwrapped operands. Integer arithmetic is the
// exact result reduced modulo 2^N of the promoted type.
template <typename A, typename B, typename Op> auto raw(A a, B b, Op op) {
    using T = decltype(a + b);
    if constexpr (std::is_integral_v<T>) {
        using U = std::make_unsigned_t<T>;
        return static_cast<T>(op(static_cast<U>(static_cast<T>(a)), static_cast<U>(static_cast<T>(b))));
    } else {
        return static_cast<T>(op(static_cast<T>(a), static_cast<T>(b)));
    }
}

template <typename A, typename B> auto raw_mod(A a, B b) {
    using T = decltype(a + b);
    return static_cast<T>(std::fmod(static_cast<T>(a), static_cast<T>(b)));
}

// Shift counts use the low log2(N) bits of the promoted left width.
template <typename A, typename B> int raw_count(A, B b) {
    using T = decltype(+A{});
    return static_cast<int>(static_cast<long long>(b) & static_cast<long long>(sizeof(T) * 8 - 1));
}

template <typename A, typename B> auto raw_shl(A a, B b) {
    using T = decltype(+a);
    return static_cast<T>(static_cast<std::make_unsigned_t<T>>(+a) << raw_count(a, b));
}

template <typename A, typename B> auto raw_shr(A a, B b) {
    return +a >> raw_count(a, b);
}

template <typename F> void for_each_primitive(F&& f) {
    f(std::int8_t{});
    f(std::int16_t{});
    f(char{});
    f(std::int32_t{});
    f(std::int64_t{});
    f(float{});
    f(double{});
}

template <typename P> P random_peer(std::mt19937_64& rng) {
    if constexpr (std::is_floating_point_v<P>) {
        std::uniform_real_distribution<P> d(P(-100), P(100));
        return d(rng);
    } else if constexpr (std::is_same_v<P, char>) {
        std::uniform_int_distribution<int> d(32, 126);
        return static_cast<P>(d(rng));
    } else {
        std::uniform_int_distribution<int> d(-50, 50);
        return static_cast<P>(d(rng));
    }
}

// (l op r) must have the type and the value of the same expression on the
// unwrapped operands.
template <typename L, typename R> void expect_same_as_raw(const L& l, const R& r) {
    const auto a = underlying(l);
    const auto b = underlying(r);
    using T = decltype(a + b);

    static_assert(std::is_same_v<decltype(l + r), T>);
    static_assert(std::is_same_v<decltype(l - r), decltype(a - b)>);
    static_assert(std::is_same_v<decltype(l * r), decltype(a * b)>);
    static_assert(std::is_same_v<decltype(l / r), decltype(a / b)>);
    static_assert(std::is_same_v<decltype(l % r), T>);

    EXPECT_TRUE(same_value(l + r, raw(a, b, std::plus<>{})));
    EXPECT_TRUE(same_value(l - r, raw(a, b, std::minus<>{})));
    EXPECT_TRUE(same_value(l * r, raw(a, b, std::multiplies<>{})));
    if constexpr (std::is_integral_v<T>) {
        const auto ta = static_cast<T>(a);
        const auto tb = static_cast<T>(b);
        if (ta == std::numeric_limits<T>::min() && tb == -1) {
            EXPECT_EQ(l / r, ta);
            EXPECT_EQ(l % r, 0);
        } else if (tb != 0) {
            EXPECT_EQ(l / r, ta / tb);
            EXPECT_EQ(l % r, ta % tb);
        }
    } else {
        EXPECT_TRUE(same_value(l / r, a / b));
        EXPECT_TRUE(same_value(l % r, raw_mod(a, b)));
    }

    EXPECT_EQ(l < r, a < b);
    EXPECT_EQ(l <= r, a <= b);
    EXPECT_EQ(l > r, a > b);
    EXPECT_EQ(l >= r, a >= b);
    EXPECT_EQ(l == r, a == b);
    EXPECT_EQ(l != r, a != b);

    if constexpr (std::is_integral_v<decltype(a)> && std::is_integral_v<decltype(b)>) {
        static_assert(std::is_same_v<decltype(l | r), decltype(a | b)>);
        static_assert(std::is_same_v<decltype(l << r), decltype(a << b)>);
        EXPECT_EQ(l | r, a | b);
        EXPECT_EQ(l & r, a & b);
        EXPECT_EQ(l ^ r, a ^ b);
        EXPECT_EQ(l << r, raw_shl(a, b));
        EXPECT_EQ(l >> r, raw_shr(a, b));
    }
}

template <typename T> void check_against_every_peer(std::uint64_t seed) {
    using P = typename T::primitive_type;
    std::mt19937_64 rng(seed);
    int checked = 0;
    for (int i = 0; i < 400; ++i) {
        const auto v = T::from(random_peer<P>(rng));
        if (!v)
            continue;
        ++checked;
        for_each_primitive([&](auto tag) {
            using Y = decltype(tag);
            const Y y = random_peer<Y>(rng);
            expect_same_as_raw(*v, y);
            expect_same_as_raw(y, *v);
        });
    }
    EXPECT_GT(checked, 0);
}

// The bounds of T against the bounds of every primitive, where integer
// results wrap.
template <typename T> void check_extremes_against_every_peer() {
    for (const T v : {T::MinValue, T::MaxValue}) {
        for_each_primitive([&](auto tag) {
            using Y = decltype(tag);
            using lim = std::numeric_limits<Y>;
            for (const Y y : {lim::lowest(), lim::max(), Y(-1), Y(1)}) {
                expect_same_as_raw(v, y);
                expect_same_as_raw(y, v);
            }
        });
    }
}

template <typename L, typename R> concept HasBitOr = requires(L l, R r) { l | r; };
template <typename L, typename R> concept HasShift = requires(L l, R r) { l << r; };
template <typename T> concept HasComplement = requires(T t) { ~t; };

} // namespace

// --- Refinement op primitive, both operand positions ---

TEST(OperatorsAgainstPrimitives, IntTypes) {
    check_against_every_peer<refnum::PosInt>(1);
    check_against_every_peer<refnum::NegZInt>(2);
    check_against_every_peer<refnum::NonZeroInt>(3);
}

TEST(OperatorsAgainstPrimitives, LongTypes) {
    check_against_every_peer<refnum::PosLong>(4);
    check_against_every_peer<refnum::NegLong>(5);
}

TEST(OperatorsAgainstPrimitives, FloatingTypes) {
    check_against_every_peer<refnum::PosZFloat>(6);
    check_against_every_peer<refnum::NegFiniteFloat>(7);
    check_against_every_peer<refnum::PosDouble>(8);
    check_against_every_peer<refnum::NonZeroFiniteDouble>(9);
}

TEST(OperatorsAgainstPrimitives, NumericChar) {
    check_against_every_peer<refnum::NumericChar>(10);
}

TEST(OperatorsAgainstPrimitives, Extremes) {
    check_extremes_against_every_peer<refnum::PosInt>();
    check_extremes_against_every_peer<refnum::NegInt>();
    check_extremes_against_every_peer<refnum::NonZeroInt>();
    check_extremes_against_every_peer<refnum::PosZLong>();
    check_extremes_against_every_peer<refnum::NonZeroLong>();
    check_extremes_against_every_peer<refnum::NumericChar>();
    check_extremes_against_every_peer<refnum::PosDouble>();
    check_extremes_against_every_peer<refnum::NegFiniteFloat>();
}

// --- Refinement op refinement ---

TEST(OperatorsBetweenRefinements, MixedTypes) {
    constexpr refnum::PosInt a = 7;
    constexpr refnum::NegLong b = -3;
    constexpr refnum::PosZDouble c = 2.5;
    constexpr refnum::NumericChar d = '4';
    constexpr refnum::NonZeroFloat e = -1.25f;
    expect_same_as_raw(a, b);
    expect_same_as_raw(a, c);
    expect_same_as_raw(b, d);
    expect_same_as_raw(c, e);
    expect_same_as_raw(d, a);
    expect_same_as_raw(e, b);
}

TEST(OperatorsBetweenRefinements, ResultTypesFollowPromotion) {
    static_assert(std::is_same_v<decltype(refnum::PosInt(1) + refnum::PosLong(1)), std::int64_t>);
    static_assert(std::is_same_v<decltype(refnum::PosInt(1) + refnum::PosFloat(1.0f)), float>);
    static_assert(std::is_same_v<decltype(refnum::PosLong(1) * refnum::PosDouble(1.0)), double>);
    static_assert(std::is_same_v<decltype(refnum::NumericChar('1') + std::int8_t{1}), int>);
    static_assert(std::is_same_v<decltype(std::int16_t{1} - refnum::NegInt(-1)), int>);
}

TEST(OperatorsBetweenRefinements, UsableInConstantExpressions) {
    static_assert(refnum::PosInt(3) + 4 == 7);
    static_assert(10 - refnum::PosInt(3) == 7);
    static_assert(refnum::PosZDouble(3.0) + 3 == 6.0);
    static_assert(refnum::PosInt(7) % refnum::PosInt(4) == 3);
    static_assert(refnum::PosInt(6) < refnum::PosLong(7));
    static_assert((refnum::PosInt(6) | 1) == 7);
}

// --- Native edge behaviour is preserved ---

TEST(OperatorsEdgeCases, MixedWidthArithmeticPromotesFirst) {
    // int + long is computed in long, so MaxValue + 1 does not wrap
    EXPECT_EQ(refnum::PosInt::MaxValue + std::int64_t{1},
              std::int64_t{std::numeric_limits<std::int32_t>::max()} + 1);
    EXPECT_EQ(refnum::NegInt::MinValue - 1.0,
              static_cast<double>(std::numeric_limits<std::int32_t>::min()) - 1.0);
}

TEST(OperatorsEdgeCases, IntegerArithmeticWraps) {
    using refnum::NonZeroInt;
    using refnum::NonZeroLong;
    using refnum::PosInt;
    using refnum::PosLong;
    constexpr auto imin = std::numeric_limits<std::int32_t>::min();
    constexpr auto imax = std::numeric_limits<std::int32_t>::max();
    constexpr auto lmin = std::numeric_limits<std::int64_t>::min();
    constexpr auto lmax = std::numeric_limits<std::int64_t>::max();

    static_assert(PosInt::MaxValue + 1 == imin);
    static_assert(1 + PosInt::MaxValue == imin);
    static_assert(PosInt::MaxValue * 2 == -2);
    static_assert(PosInt::MaxValue + PosInt::MaxValue == -2);
    static_assert(NonZeroInt::MinValue - 1 == imax);
    static_assert(NonZeroInt::MinValue * 2 == 0);
    static_assert(PosLong::MaxValue + 1 == lmin);
    static_assert(NonZeroLong::MinValue - std::int64_t{1} == lmax);
    static_assert(PosLong::MaxValue * PosLong::MaxValue == 1);
}

TEST(OperatorsEdgeCases, MinValueDividedByMinusOneWraps) {
    using refnum::NegInt;
    using refnum::NonZeroInt;
    using refnum::NonZeroLong;
    constexpr auto imin = std::numeric_limits<std::int32_t>::min();
    constexpr auto lmin = std::numeric_limits<std::int64_t>::min();

    static_assert(NonZeroInt::MinValue / -1 == imin);
    static_assert(NonZeroInt::MinValue % -1 == 0);
    static_assert(imin / NegInt(-1) == imin);
    static_assert(imin % NegInt(-1) == 0);
    static_assert(NonZeroLong::MinValue / std::int64_t{-1} == lmin);
    static_assert(NonZeroInt(-7) / -1 == 7);
    static_assert(NonZeroInt(-7) % -2 == -1);
}

TEST(OperatorsEdgeCases, NegatingMinValueWraps) {
    static_assert(-refnum::NonZeroInt::MinValue == std::numeric_limits<std::int32_t>::min());
    static_assert(-refnum::NegLong::MinValue == std::numeric_limits<std::int64_t>::min());
    static_assert(-refnum::PosInt::MaxValue == -std::numeric_limits<std::int32_t>::max());
}

TEST(OperatorsEdgeCases, FloatingDivisionByZero) {
    constexpr refnum::PosDouble one = 1.0;
    EXPECT_EQ(one / 0.0, std::numeric_limits<double>::infinity());
    EXPECT_EQ(-one / 0.0, -std::numeric_limits<double>::infinity());
    const double nan = refnum::PosZDouble(0.0) / 0.0;
    EXPECT_TRUE(std::isnan(nan));
    EXPECT_TRUE(std::isnan(one % 0.0));
}

TEST(OperatorsEdgeCases, FloatingRemainderTakesDividendSign) {
    EXPECT_EQ(refnum::NegDouble(-7.5) % 2, -1.5);
    EXPECT_EQ(refnum::PosFloat(7.5f) % -2, 1.5f);
    static_assert(std::is_same_v<decltype(refnum::PosFloat(7.5f) % 2), float>);
}

// --- Equality ---

TEST(OperatorsEquality, NaNEqualsNaNForTheSameType) {
    const auto a = refnum::NonZeroDouble::ensuring_valid(std::numeric_limits<double>::quiet_NaN());
    const auto b = refnum::NonZeroDouble::ensuring_valid(-std::numeric_limits<double>::quiet_NaN());
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a != b);
    EXPECT_TRUE(a == a);
}

TEST(OperatorsEquality, NaNStaysUnequalToPrimitivesAndOtherTypes) {
    const auto a = refnum::NonZeroDouble::ensuring_valid(std::numeric_limits<double>::quiet_NaN());
    const auto f = refnum::NonZeroFloat::ensuring_valid(std::numeric_limits<float>::quiet_NaN());
    EXPECT_FALSE(a == std::numeric_limits<double>::quiet_NaN());
    EXPECT_TRUE(a != std::numeric_limits<double>::quiet_NaN());
    EXPECT_FALSE(a == f);
    EXPECT_FALSE(a < a);
    EXPECT_FALSE(a > a);
}

TEST(OperatorsEquality, SignedZeros) {
    constexpr refnum::PosZDouble pz = 0.0;
    constexpr refnum::PosZDouble nz = -0.0;
    static_assert(pz == nz);
    static_assert(pz == 0);
}

// --- Bitwise ---

TEST(OperatorsBitwise, OnlyForIntegralOperands) {
    static_assert(HasBitOr<refnum::PosInt, int>);
    static_assert(HasBitOr<std::int8_t, refnum::NegLong>);
    static_assert(HasBitOr<refnum::PosInt, refnum::NumericChar>);
    static_assert(!HasBitOr<refnum::PosDouble, int>);
    static_assert(!HasBitOr<refnum::PosInt, double>);
    static_assert(!HasBitOr<refnum::PosFloat, refnum::PosInt>);
    static_assert(!HasShift<refnum::PosZDouble, int>);
    static_assert(HasComplement<refnum::PosInt>);
    static_assert(!HasComplement<refnum::PosDouble>);
}

TEST(OperatorsBitwise, UnsignedShiftRight) {
    constexpr refnum::NegInt m1 = -1;
    constexpr refnum::NegLong lm1 = -1;
    static_assert(ushr(m1, 28) == 15);
    static_assert(ushr(lm1, 60) == 15);
    static_assert(ushr(refnum::NegInt(-8), 1) == 2147483644);
    static_assert(ushr(refnum::PosInt(64), 3) == 8);
    static_assert(std::is_same_v<decltype(ushr(refnum::NegInt(-8), std::int64_t{1})), std::int32_t>);
}

TEST(OperatorsBitwise, UnsignedShiftCountWrapsAtWidth) {
    constexpr refnum::NegInt x = -8;
    static_assert(ushr(x, 33) == ushr(x, 1));
    static_assert(ushr(x, 32) == -8);
    static_assert(ushr(refnum::NegLong(-8), 65) == ushr(refnum::NegLong(-8), 1));
}

TEST(OperatorsBitwise, ShiftCountWrapsAtWidth) {
    constexpr refnum::PosInt one = 1;
    constexpr auto imin = std::numeric_limits<std::int32_t>::min();
    static_assert((one << 40) == (1 << 8));
    static_assert((one << 32) == 1);
    static_assert((one << 31) == imin);
    static_assert((one << -1) == imin);
    static_assert((refnum::PosLong(1) << 64) == 1);
    static_assert((refnum::PosLong(1) << 63) == std::numeric_limits<std::int64_t>::min());
    static_assert((refnum::NegInt(-16) >> 34) == -4);
    static_assert((refnum::NegInt(-16) >> 32) == -16);
    static_assert((std::int32_t{1} << refnum::PosInt(33)) == 2);
    static_assert((refnum::NumericChar('1') << 33) == 98);
    static_assert(std::is_same_v<decltype(one << std::int64_t{1}), std::int32_t>);
}

TEST(OperatorsBitwise, LeftShiftOfNegativeValues) {
    static_assert((refnum::NegInt(-1) << 4) == -16);
    static_assert((refnum::NonZeroInt::MinValue << 1) == 0);
    static_assert((refnum::PosInt::MaxValue << 1) == -2);
}

TEST(OperatorsBitwise, UnsignedShiftPromotesSmallTypes) {
    // byte -1 promotes to int -1 before shifting
    static_assert(ushr(std::int8_t{-1}, 28) == 15);
    static_assert(ushr(refnum::NumericChar('8'), 1) == 28);
}

// --- Unary ---

TEST(OperatorsUnary, PlusKeepsTheType) {
    constexpr refnum::PosInt p = 5;
    static_assert(std::is_same_v<decltype(+p), refnum::PosInt>);
    static_assert((+p).value() == 5);
}

TEST(OperatorsUnary, MinusAndComplementReturnThePromotedPrimitive) {
    constexpr refnum::PosInt p = 5;
    constexpr refnum::NumericChar c = '1';
    constexpr refnum::PosFloat f = 2.5f;
    static_assert(std::is_same_v<decltype(-p), std::int32_t>);
    static_assert(std::is_same_v<decltype(-c), int>);
    static_assert(std::is_same_v<decltype(-f), float>);
    static_assert(-p == -5);
    static_assert(~p == ~5);
    static_assert(-c == -49);
    static_assert(-f == -2.5f);
}
