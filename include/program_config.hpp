#pragma once

#include "bytes.hpp"

#include <cstdint>

namespace wh {

struct ProgramConfig {
    // Seed for derived addresses; two deployments with different ids never collide.
    Identity programId = defaultProgramId();
    // Minimum balance the platform requires an escrow account to keep.
    std::uint64_t escrowReserve = 890'880;
    // Commitments one settle call may carry before it has to be split.
    std::uint32_t maxSettleBatch = 32;

    static Identity defaultProgramId();
};

// Defaults overridden by WH_PROGRAM_ID (64 hex digits), WH_ESCROW_RESERVE and
// WH_MAX_SETTLE_BATCH. Malformed values throw std::runtime_error.
ProgramConfig loadProgramConfigFromEnv();

} // namespace wh
