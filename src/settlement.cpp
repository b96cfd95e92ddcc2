#include "settlement.hpp"

#include "deterministic_math.hpp"
#include "errors.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace wh {

namespace {

using Wide = DeterministicMath::Wide;
constexpr std::int64_t kPrecision = DeterministicMath::kPrecision;

// PRECISION^2 / (|truth - prediction| + 1): PRECISION^2 for an exact hit, zero once the
// error reaches PRECISION^2 raw units.
std::uint64_t accuracyWeight(std::int64_t truth, std::int64_t prediction) {
    Wide error = boost::multiprecision::abs(Wide(truth) - Wide(prediction));
    return DeterministicMath::toUint64(Wide(kPrecision) * Wide(kPrecision) / (error + 1));
}

// PRECISION^2 / ln(order + e) at 1e6 scale: PRECISION for the first committer.
std::uint64_t timeWeight(std::uint32_t submitOrder) {
    return static_cast<std::uint64_t>(kPrecision) * static_cast<std::uint64_t>(kPrecision) /
           DeterministicMath::lnShifted(submitOrder);
}

bool sameDirection(const Wide& edge, const Wide& truthEdge) {
    return (edge >= 0 && truthEdge >= 0) || (edge <= 0 && truthEdge <= 0);
}

std::int64_t saturateInt64(const Wide& value) {
    if (value > Wide(std::numeric_limits<std::int64_t>::max())) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (value < Wide(std::numeric_limits<std::int64_t>::min())) {
        return std::numeric_limits<std::int64_t>::min();
    }
    return value.convert_to<std::int64_t>();
}

} // namespace

std::vector<std::uint64_t> apportion(std::uint64_t amount,
                                     const std::vector<std::uint64_t>& weights,
                                     const std::vector<std::uint32_t>& submitOrders) {
    if (weights.size() != submitOrders.size()) {
        throw std::invalid_argument("apportion: weights and submit orders differ in length");
    }
    std::vector<std::uint64_t> shares(weights.size(), 0);
    if (amount == 0) {
        return shares;
    }

    Wide total = 0;
    for (auto w : weights) {
        total += w;
    }
    if (total == 0) {
        throw std::invalid_argument("apportion: cannot split a positive amount over zero weight");
    }

    std::uint64_t assigned = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        shares[i] = DeterministicMath::proportionalShare(amount, Wide(weights[i]), total);
        assigned += shares[i];
    }

    std::vector<std::size_t> byOrder(weights.size());
    std::iota(byOrder.begin(), byOrder.end(), 0);
    std::sort(byOrder.begin(), byOrder.end(), [&](std::size_t a, std::size_t b) {
        return submitOrders[a] < submitOrders[b];
    });

    // Each floor loses less than one unit, so the leftover is below the count of
    // positive weights and one pass hands it all out.
    std::uint64_t leftover = amount - assigned;
    for (std::size_t idx : byOrder) {
        if (leftover == 0) {
            break;
        }
        if (weights[idx] == 0) {
            continue;
        }
        ++shares[idx];
        --leftover;
    }
    return shares;
}

SettlementPlan computeSettlement(std::int64_t truthValue,
                                 std::uint64_t reserve,
                                 const std::vector<Commitment>& commitments) {
    SettlementPlan plan;
    plan.truthValue = truthValue;

    std::vector<const Commitment*> ordered;
    ordered.reserve(commitments.size());
    for (const auto& c : commitments) {
        ordered.push_back(&c);
    }
    std::sort(ordered.begin(), ordered.end(), [](const Commitment* a, const Commitment* b) {
        return a->submitOrder < b->submitOrder;
    });

    Wide totalStake = 0;
    Wide revealedStake = 0;
    Wide weightedPredictions = 0;
    Wide loserPool = 0;
    for (const Commitment* c : ordered) {
        ParticipantPayout entry;
        entry.participant = c->participant;
        entry.submitOrder = c->submitOrder;
        entry.stake = c->stakeAmount;
        entry.revealed = c->revealed;
        plan.payouts.push_back(entry);

        totalStake += c->stakeAmount;
        if (c->revealed) {
            revealedStake += c->stakeAmount;
            weightedPredictions += Wide(c->stakeAmount) * Wide(c->predictionValue);
        } else {
            loserPool += c->stakeAmount;
        }
    }
    plan.totalStake = DeterministicMath::toUint64(totalStake);
    plan.loserPool = DeterministicMath::toUint64(loserPool);
    plan.reserveRetained = std::min(reserve, plan.totalStake);

    std::vector<std::uint32_t> orders;
    orders.reserve(plan.payouts.size());
    for (const auto& p : plan.payouts) {
        orders.push_back(p.submitOrder);
    }

    if (revealedStake == 0) {
        // Nobody revealed: no consensus exists, so refund everyone by stake.
        plan.degenerate = true;
        std::vector<std::uint64_t> stakes;
        stakes.reserve(plan.payouts.size());
        for (const auto& p : plan.payouts) {
            stakes.push_back(p.stake);
        }
        auto charges = apportion(plan.reserveRetained, stakes, orders);
        for (std::size_t i = 0; i < plan.payouts.size(); ++i) {
            plan.payouts[i].reserveCharge = charges[i];
            plan.payouts[i].payout = plan.payouts[i].stake - charges[i];
            plan.totalPayout += plan.payouts[i].payout;
        }
        return plan;
    }

    plan.consensus = DeterministicMath::toInt64(weightedPredictions / revealedStake);
    // Edges span up to twice the i64 range; only their signs feed the gate.
    Wide truthEdge = Wide(truthValue) - Wide(plan.consensus);
    plan.truthEdge = saturateInt64(truthEdge);

    // The reserve comes out of forfeited stake first, then out of revealers' stakes.
    std::uint64_t poolCharge = std::min(plan.reserveRetained, plan.loserPool);
    std::uint64_t stakeCharge = plan.reserveRetained - poolCharge;
    plan.bonusPool = plan.loserPool - poolCharge;

    std::vector<std::uint64_t> revealedStakes(plan.payouts.size(), 0);
    std::vector<std::uint64_t> scores(plan.payouts.size(), 0);
    bool anyScore = false;
    for (std::size_t i = 0; i < plan.payouts.size(); ++i) {
        ParticipantPayout& p = plan.payouts[i];
        if (!p.revealed) {
            continue;
        }
        const Commitment* c = ordered[i];
        revealedStakes[i] = p.stake;

        Wide edge = Wide(c->predictionValue) - Wide(plan.consensus);
        p.aligned = sameDirection(edge, truthEdge);
        p.accuracyWeight = accuracyWeight(truthValue, c->predictionValue);
        p.timeWeight = timeWeight(p.submitOrder);
        if (p.aligned) {
            p.score = DeterministicMath::toUint64(Wide(p.accuracyWeight) * Wide(p.timeWeight) / kPrecision);
        }
        scores[i] = p.score;
        anyScore = anyScore || p.score > 0;
    }

    auto charges = apportion(stakeCharge, revealedStakes, orders);
    plan.stakeWeightedFallback = !anyScore;
    auto bonuses = apportion(plan.bonusPool, anyScore ? scores : revealedStakes, orders);

    for (std::size_t i = 0; i < plan.payouts.size(); ++i) {
        ParticipantPayout& p = plan.payouts[i];
        if (!p.revealed) {
            continue;
        }
        p.reserveCharge = charges[i];
        p.bonus = bonuses[i];
        p.payout = p.stake - p.reserveCharge + p.bonus;
        plan.totalPayout += p.payout;
    }
    return plan;
}

} // namespace wh
