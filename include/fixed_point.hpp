#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace wh {

// Prediction and truth values on the ledger: signed fixed-point, six decimal places.
class Fixed64 {
public:
    static constexpr std::int64_t kScale = 1'000'000; // microunits
    static constexpr int kDecimals = 6;
    static constexpr std::int64_t kMaxWhole =
        std::numeric_limits<std::int64_t>::max() / kScale;
    static constexpr std::int64_t kMinWhole =
        std::numeric_limits<std::int64_t>::min() / kScale;

    Fixed64() : raw_(0) {}
    explicit Fixed64(std::int64_t whole) : raw_(scaleWhole(whole)) {}
    static Fixed64 fromRaw(std::int64_t raw) { return Fixed64(raw, RawTag{}); }

    // Exact decimal parse: "151", "151.00", "-0.5", "+2.000001". More than six
    // fractional digits, empty input or stray characters throw std::invalid_argument.
    static Fixed64 parse(const std::string& text) {
        std::size_t pos = 0;
        bool negative = false;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            negative = text[pos] == '-';
            ++pos;
        }
        if (pos == text.size()) {
            throw std::invalid_argument("empty fixed-point literal");
        }

        __int128 whole = 0;
        std::size_t wholeDigits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            whole = whole * 10 + (text[pos] - '0');
            if (whole > static_cast<__int128>(kMaxWhole) + 1) {
                throw std::out_of_range("fixed-point literal out of range: " + text);
            }
            ++pos;
            ++wholeDigits;
        }

        __int128 fraction = 0;
        int fractionDigits = 0;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (fractionDigits == kDecimals) {
                    throw std::invalid_argument("more than six decimal places: " + text);
                }
                fraction = fraction * 10 + (text[pos] - '0');
                ++pos;
                ++fractionDigits;
            }
        }
        if (pos != text.size() || (wholeDigits == 0 && fractionDigits == 0)) {
            throw std::invalid_argument("malformed fixed-point literal: " + text);
        }
        for (int i = fractionDigits; i < kDecimals; ++i) {
            fraction *= 10;
        }

        __int128 raw = whole * kScale + fraction;
        if (negative) {
            raw = -raw;
        }
        if (raw > std::numeric_limits<std::int64_t>::max() ||
            raw < std::numeric_limits<std::int64_t>::min()) {
            throw std::out_of_range("fixed-point literal out of range: " + text);
        }
        return Fixed64(static_cast<std::int64_t>(raw), RawTag{});
    }

    std::int64_t raw() const { return raw_; }

    // Always six decimal places, e.g. "152.750000".
    std::string toString() const {
        __int128 value = raw_;
        bool negative = value < 0;
        if (negative) {
            value = -value;
        }
        std::string fraction = std::to_string(static_cast<long long>(value % kScale));
        fraction.insert(0, static_cast<std::size_t>(kDecimals) - fraction.size(), '0');
        std::string out = negative ? "-" : "";
        out += std::to_string(static_cast<unsigned long long>(value / kScale));
        out += '.';
        out += fraction;
        return out;
    }

    bool operator<(Fixed64 other) const { return raw_ < other.raw_; }
    bool operator>(Fixed64 other) const { return raw_ > other.raw_; }
    bool operator==(Fixed64 other) const { return raw_ == other.raw_; }
    bool operator!=(Fixed64 other) const { return raw_ != other.raw_; }

private:
    struct RawTag {};
    explicit Fixed64(std::int64_t raw, RawTag) : raw_(raw) {}

    static std::int64_t scaleWhole(std::int64_t whole) {
        if (whole > kMaxWhole || whole < kMinWhole) {
            throw std::overflow_error("Fixed64 whole value out of range");
        }
        __int128 wide = static_cast<__int128>(whole) * static_cast<__int128>(kScale);
        return static_cast<std::int64_t>(wide);
    }

    std::int64_t raw_;
};

} // namespace wh
