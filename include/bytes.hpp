#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wh {

using Bytes32 = std::array<std::uint8_t, 32>;

// Ledger identities (wallets, program ids) and derived account addresses share one shape.
using Identity = Bytes32;
using Address = Bytes32;

Bytes32 sha256Digest(const std::vector<std::uint8_t>& data);
Bytes32 sha256Digest(const std::string& data);

std::string toHex(const Bytes32& value);
std::string toHex(const std::vector<std::uint8_t>& value);
// Throws std::invalid_argument unless `hex` is exactly 64 hex digits.
Bytes32 bytes32FromHex(const std::string& hex);

// Deterministic identity for tests, demos and fixtures; not a key pair.
Identity identityFromLabel(const std::string& label);

void appendU32(std::vector<std::uint8_t>& out, std::uint32_t value);
void appendU64(std::vector<std::uint8_t>& out, std::uint64_t value);
void appendI64(std::vector<std::uint8_t>& out, std::int64_t value);
void appendBytes(std::vector<std::uint8_t>& out, const Bytes32& value);

} // namespace wh
