#include "bytes.hpp"

#include "picosha2.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace wh {

namespace {

int hexNibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

template <typename It>
std::string hexEncode(It first, It last) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (; first != last; ++first) {
        oss << std::setw(2) << static_cast<int>(*first);
    }
    return oss.str();
}

} // namespace

Bytes32 sha256Digest(const std::vector<std::uint8_t>& data) {
    Bytes32 out{};
    picosha2::hash256(data.begin(), data.end(), out.begin(), out.end());
    return out;
}

Bytes32 sha256Digest(const std::string& data) {
    Bytes32 out{};
    picosha2::hash256(data.begin(), data.end(), out.begin(), out.end());
    return out;
}

std::string toHex(const Bytes32& value) {
    return hexEncode(value.begin(), value.end());
}

std::string toHex(const std::vector<std::uint8_t>& value) {
    return hexEncode(value.begin(), value.end());
}

Bytes32 bytes32FromHex(const std::string& hex) {
    if (hex.size() != 64) {
        throw std::invalid_argument("expected 64 hex digits, got " + std::to_string(hex.size()));
    }
    Bytes32 out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = hexNibble(hex[2 * i]);
        int lo = hexNibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in \"" + hex + "\"");
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

Identity identityFromLabel(const std::string& label) {
    return sha256Digest("identity:" + label);
}

void appendU32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void appendU64(std::vector<std::uint8_t>& out, std::uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void appendI64(std::vector<std::uint8_t>& out, std::int64_t value) {
    appendU64(out, static_cast<std::uint64_t>(value));
}

void appendBytes(std::vector<std::uint8_t>& out, const Bytes32& value) {
    out.insert(out.end(), value.begin(), value.end());
}

} // namespace wh
