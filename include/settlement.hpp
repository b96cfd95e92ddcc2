#pragma once

#include "records.hpp"

#include <cstdint>
#include <vector>

namespace wh {

struct ParticipantPayout {
    Identity participant{};
    std::uint32_t submitOrder = 0;
    std::uint64_t stake = 0;
    bool revealed = false;
    // Deviation from consensus points the same way as the truth's deviation.
    bool aligned = false;
    std::uint64_t accuracyWeight = 0; // W_e, 1e12 for an exact hit
    std::uint64_t timeWeight = 0;     // T_f, 1e6 for the first committer
    std::uint64_t score = 0;          // W_e * T_f / 1e6 for aligned revealers, else 0
    std::uint64_t reserveCharge = 0;  // part of the reserve taken from this stake
    std::uint64_t bonus = 0;          // share of the loser pool
    std::uint64_t payout = 0;
};

struct SettlementPlan {
    // No participant revealed: stakes are refunded pro rata, minus the reserve.
    bool degenerate = false;
    // Every aligned score was zero: the loser pool was split by stake instead.
    bool stakeWeightedFallback = false;
    std::int64_t truthValue = 0;
    std::int64_t consensus = 0;
    // truth - consensus, saturated at the i64 bounds.
    std::int64_t truthEdge = 0;
    std::uint64_t totalStake = 0;
    std::uint64_t loserPool = 0;
    std::uint64_t bonusPool = 0;
    std::uint64_t reserveRetained = 0;
    std::uint64_t totalPayout = 0;
    // Sorted by submit order.
    std::vector<ParticipantPayout> payouts;
};

// Partitions the staked value of a finalized topic. Pure and deterministic: the
// same commitments, truth and reserve always produce the same plan, and
// totalPayout + reserveRetained == totalStake.
//
// Throws ProgramError(ArithmeticOverflow) if stakes do not sum within u64.
SettlementPlan computeSettlement(std::int64_t truthValue,
                                 std::uint64_t reserve,
                                 const std::vector<Commitment>& commitments);

// floor(amount * w_i / sum(w)) per entry; the leftover units go one each to
// positive-weight entries in ascending submit order. Weights must not all be
// zero unless amount is zero.
std::vector<std::uint64_t> apportion(std::uint64_t amount,
                                     const std::vector<std::uint64_t>& weights,
                                     const std::vector<std::uint32_t>& submitOrders);

} // namespace wh
