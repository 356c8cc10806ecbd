// Widening between refinement types
//
// Demonstrates: implicit conversion to primitives and to refinement types
// whose predicate is implied, and the catalog's widening graph.
// Build: cmake --build build --target 03_widening
// Run:   ./build/03_widening

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <type_traits>

#include <refnum/refnum.hpp>

using namespace refnum;

// Accepts anything that is known to be non-negative.
static double half(PosZDouble x) { return x / 2; }

// --- Compile-time facts ---
static_assert(std::is_convertible_v<PosInt, PosZLong>);
static_assert(std::is_convertible_v<NumericChar, PosInt>);
static_assert(!std::is_convertible_v<PosZInt, PosInt>);
static_assert(!std::is_convertible_v<PosZDouble, PosZFloat>);

int main() {
    std::printf("=== Widening ===\n\n");

    constexpr PosInt p = 10;
    constexpr PosFloat f = 2.5f;
    constexpr NumericChar c = '4';

    const std::int64_t as_long = p;
    const PosZLong as_posz_long = p;
    std::cout << "PosInt -> long        : " << as_long << "\n";
    std::cout << "PosInt -> PosZLong    : " << as_posz_long << "\n";
    std::cout << "half(PosInt(10))      : " << half(p) << "\n";
    std::cout << "half(PosFloat(2.5))   : " << half(f) << "\n";
    std::cout << "half(NumericChar('4')): " << half(c) << "\n";

    std::printf("\nPosInt widens to:\n");
    constexpr auto targets = widening_targets(bindings::PosInt);
    for (std::size_t i = 0; i < targets.count; ++i)
        std::cout << "  " << targets.names[i].view() << "\n";

    return 0;
}
