// Floating-point extras
//
// Demonstrates: round/ceil/floor with derived result types, angle
// conversion, infinities, min/max, ranges and the total ordering.
// Build: cmake --build build --target 04_floating_extras
// Run:   ./build/04_floating_extras

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <limits>
#include <type_traits>
#include <vector>

#include <refnum/refnum.hpp>

using namespace refnum;

// Rounding a positive double can reach zero, so the result is non-negative.
static_assert(std::is_same_v<decltype(PosDouble(0.4).round()), PosZLong>);
static_assert(std::is_same_v<decltype(PosDouble(0.4).floor()), PosZDouble>);
static_assert(std::is_same_v<decltype(NegFloat(-0.4f).ceil()), NegZFloat>);

int main() {
    std::printf("=== Floating extras ===\n\n");

    constexpr PosDouble x = 2.5;
    std::cout << x << ".round()  = " << x.round() << "\n";
    std::cout << x << ".floor()  = " << x.floor() << "\n";
    std::cout << x << ".ceil()   = " << x.ceil() << "\n";
    std::cout << x << ".is_whole = " << std::boolalpha << x.is_whole() << "\n";

    constexpr PosDouble deg = 180.0;
    std::cout << deg << ".to_radians() = " << deg.to_radians() << "\n";

    const auto inf = PosDouble::positive_infinity();
    std::cout << inf << ".round() saturates to " << inf.round() << "\n";

    std::cout << "max(1.5, 2.5) = " << PosDouble(1.5).max(x) << "\n";

    std::printf("\n0.0 to 1.0 by 0.25:");
    for (double v : PosZDouble(0.0).to(1.0, 0.25))
        std::printf(" %g", v);
    std::printf("\n");

    std::vector<NonZeroDouble> xs{NonZeroDouble(2.0),
                                  NonZeroDouble::ensuring_valid(
                                      std::numeric_limits<double>::quiet_NaN()),
                                  NonZeroDouble(-1.0)};
    std::sort(xs.begin(), xs.end(), Ordering{});
    std::printf("\nsorted with NaN last:");
    for (const auto& v : xs)
        std::cout << " " << v;
    std::printf("\n");
    return 0;
}
