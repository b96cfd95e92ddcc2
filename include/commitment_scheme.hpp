#pragma once

#include "bytes.hpp"

#include <cstdint>

namespace wh {

using Salt = Bytes32;
using CommitmentHash = Bytes32;

// H(prediction as 8 little-endian bytes || salt || participant), H = SHA-256.
// Not Keccak-256: commitments built by Keccak-based clients fail verification
// here with HashMismatch.
// The participant term binds a commitment to its author so it cannot be replayed
// under another identity.
CommitmentHash computeCommitment(std::int64_t prediction, const Salt& salt, const Identity& participant);

bool verifyCommitment(const CommitmentHash& expected,
                      std::int64_t prediction,
                      const Salt& salt,
                      const Identity& participant);

} // namespace wh
