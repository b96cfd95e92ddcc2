#pragma once

#include <cstddef>
#include <cstdint>

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>

namespace wh {

class DeterministicMath {
public:
    using HighPrecision = boost::multiprecision::cpp_dec_float_50;
    // Double-width accumulator for multiply-then-divide steps over 64-bit operands.
    using Wide = boost::multiprecision::int256_t;

    static constexpr std::int64_t kPrecision = 1'000'000;
    static constexpr std::size_t kLnTableSize = 256;

    // round(ln(n + e) * 1e6) from the compiled table; n past the table reads the last entry.
    static std::uint64_t lnShifted(std::uint32_t n);

    // Same quantity evaluated with 50 significant digits. Used to audit the table,
    // never on the settlement path.
    static std::uint64_t lnShiftedReference(std::uint32_t n);

    // floor(amount * weight / total) for non-negative operands; total must be positive.
    static std::uint64_t proportionalShare(std::uint64_t amount, const Wide& weight, const Wide& total);

    static std::uint64_t toUint64(const Wide& value);
    static std::int64_t toInt64(const Wide& value);
};

} // namespace wh
