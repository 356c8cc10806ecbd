// Basic refinement types
//
// Demonstrates: literal-checked construction, value access, to_string and
// arithmetic that behaves exactly like the underlying primitive.
// Build: cmake --build build --target 01_basic_refinement
// Run:   ./build/01_basic_refinement

#include <cstdio>
#include <iostream>

#include <refnum/refnum.hpp>

using refnum::NumericChar;
using refnum::PosInt;
using refnum::PosZDouble;

// --- Example 1: Literals are checked while compiling ---
// PosInt bad = -1; would stop the build with
//   refinement error: literal does not satisfy the predicate
//     type:      PosInt
//     predicate: #v > 0
constexpr PosInt answer = 42;
static_assert(answer.value() == 42);

// --- Example 2: Arithmetic yields plain primitives ---
constexpr auto sum = PosZDouble(3.0) + 3; // double
static_assert(sum == 6.0);

int main() {
    std::printf("=== Basic refinement types ===\n\n");

    std::cout << "answer           = " << answer << "\n";
    std::cout << "answer + 1       = " << answer + 1 << "\n";
    std::cout << "PosZDouble(3)+3  = " << sum << "\n";

    // --- Example 3: Bounds of every type ---
    std::cout << "PosInt range     = [" << PosInt::MinValue.value() << ", "
              << PosInt::MaxValue.value() << "]\n";
    std::cout << "PosZDouble max   = " << PosZDouble::MaxValue << "\n";

    // --- Example 4: Characters ---
    constexpr NumericChar seven = '7';
    std::cout << seven << " as digit = " << seven.as_digit() << "\n";

    std::printf("\nAll examples passed.\n");
    return 0;
}
