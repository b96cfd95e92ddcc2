#include "deterministic_math.hpp"

#include <cstdint>
#include <iostream>

// Prints the ln(n + e) table compiled into deterministic_math.cpp, one row of
// eight entries per line, and reports rows where the compiled value drifted.
int main() {
    using Math = wh::DeterministicMath;

    std::uint32_t drift = 0;
    for (std::uint32_t n = 0; n < Math::kLnTableSize; ++n) {
        std::uint64_t reference = Math::lnShiftedReference(n);
        if (reference != Math::lnShifted(n)) {
            ++drift;
            std::cerr << "entry " << n << ": table=" << Math::lnShifted(n) << " reference=" << reference << '\n';
        }
        if (n % 8 == 0) {
            std::cout << "   ";
        }
        std::cout << ' ' << reference << ',';
        if (n % 8 == 7) {
            std::cout << "  // " << (n - 7) << ".." << n << '\n';
        }
    }
    return drift == 0 ? 0 : 1;
}
