// Validating runtime values
//
// Demonstrates: from, ensuring_valid, from_or_else, good_or_else,
// pass_or_else, trying_valid and is_valid on values only known at runtime.
// Build: cmake --build build --target 02_validation_paths
// Run:   ./build/02_validation_paths 17 -3

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include <refnum/refnum.hpp>

using refnum::AssertionError;
using refnum::PosInt;

static void inspect(int x) {
    std::printf("--- %d ---\n", x);

    std::printf("is_valid       : %s\n", PosInt::is_valid(x) ? "yes" : "no");

    if (const auto p = PosInt::from(x))
        std::cout << "from           : " << *p << "\n";
    else
        std::cout << "from           : (absent)\n";

    std::cout << "from_or_else   : " << PosInt::from_or_else(x, PosInt(1)) << "\n";

    const auto good = PosInt::good_or_else(
        x, [](int bad) { return std::to_string(bad) + " is not positive"; });
    if (good.is_good())
        std::cout << "good_or_else   : Good(" << good.good() << ")\n";
    else
        std::cout << "good_or_else   : Bad(" << good.bad() << ")\n";

    const auto pass = PosInt::pass_or_else(x, [](int bad) { return -bad; });
    if (pass.is_pass())
        std::cout << "pass_or_else   : Pass\n";
    else
        std::cout << "pass_or_else   : Fail(" << pass.error() << ")\n";

    const auto tried = PosInt::trying_valid(x);
    std::cout << "trying_valid   : "
              << (tried.is_good() ? tried.good().to_string() : std::string(tried.bad().what()))
              << "\n";

    try {
        std::cout << "ensuring_valid : " << PosInt::ensuring_valid(x) << "\n";
    } catch (const AssertionError& e) {
        std::cout << "ensuring_valid : threw \"" << e.what() << "\"\n";
    }
    std::printf("\n");
}

int main(int argc, char** argv) {
    std::printf("=== Validation paths ===\n\n");
    if (argc > 1) {
        for (int i = 1; i < argc; ++i)
            inspect(std::atoi(argv[i]));
    } else {
        inspect(17);
        inspect(0);
        inspect(-3);
    }
    return 0;
}
