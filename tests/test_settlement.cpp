#include "commitment_scheme.hpp"
#include "deterministic_math.hpp"
#include "errors.hpp"
#include "settlement.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace wh;

constexpr std::uint64_t kReserve = 890'880;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "settlement_test failure: " << msg << std::endl;
    std::exit(1);
}

void expect(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

void expectEq(std::uint64_t actual, std::uint64_t expected, const std::string& msg) {
    if (actual != expected) {
        fail(msg + ": expected " + std::to_string(expected) + ", got " + std::to_string(actual));
    }
}

Commitment makeCommitment(const std::string& who,
                          std::uint32_t order,
                          std::uint64_t stake,
                          bool revealed,
                          std::int64_t prediction) {
    Commitment c;
    c.topicRef = identityFromLabel("topic");
    c.participant = identityFromLabel(who);
    c.stakeAmount = stake;
    c.submitOrder = order;
    c.revealed = revealed;
    c.predictionValue = revealed ? prediction : 0;
    return c;
}

const ParticipantPayout& payoutFor(const SettlementPlan& plan, const std::string& who) {
    Identity id = identityFromLabel(who);
    for (const auto& p : plan.payouts) {
        if (p.participant == id) {
            return p;
        }
    }
    fail("no payout entry for " + who);
}

void checkConservation(const SettlementPlan& plan, const std::string& label) {
    std::uint64_t sum = 0;
    for (const auto& p : plan.payouts) {
        sum += p.payout;
    }
    expectEq(sum, plan.totalPayout, label + ": totalPayout matches entries");
    expectEq(plan.totalPayout + plan.reserveRetained, plan.totalStake, label + ": conservation");
}

void testThreeParticipantScenario() {
    std::vector<Commitment> commitments{
        makeCommitment("a", 0, 100'000'000, true, 150'000'000),
        makeCommitment("b", 1, 100'000'000, true, 155'500'000),
        makeCommitment("c", 2, 100'000'000, false, 148'000'000),
    };
    SettlementPlan plan = computeSettlement(151'000'000, kReserve, commitments);

    expect(!plan.degenerate, "scenario is not degenerate");
    expect(plan.consensus == 152'750'000, "consensus is 152.75");
    expect(plan.truthEdge == -1'750'000, "truth edge is -1.75");
    expectEq(plan.loserPool, 100'000'000, "loser pool is C's stake");
    expectEq(plan.bonusPool, 100'000'000 - kReserve, "reserve comes out of the loser pool");

    const auto& a = payoutFor(plan, "a");
    const auto& b = payoutFor(plan, "b");
    const auto& c = payoutFor(plan, "c");
    expect(a.aligned && !b.aligned, "A aligned with truth, B is not");
    expectEq(b.score, 0, "misaligned score");
    expectEq(a.payout, 200'000'000 - kReserve, "A takes the whole bonus pool");
    expectEq(b.payout, 100'000'000, "B gets exactly its stake back");
    expectEq(c.payout, 0, "C forfeits");
    expect(a.payout > b.payout, "A outranks B");
    checkConservation(plan, "scenario");
}

void testSingleParticipantExactHit() {
    std::vector<Commitment> commitments{ makeCommitment("solo", 0, 50'000'000, true, 42'000'000) };
    SettlementPlan plan = computeSettlement(42'000'000, kReserve, commitments);
    const auto& solo = payoutFor(plan, "solo");
    expectEq(solo.accuracyWeight, 1'000'000'000'000ULL, "exact hit has maximal accuracy weight");
    expectEq(solo.timeWeight, 1'000'000, "first committer has maximal time weight");
    expectEq(solo.payout, 50'000'000 - kReserve, "payout is stake minus reserve");
    expectEq(plan.loserPool, 0, "no loser pool");
    checkConservation(plan, "single");
}

void testAlignedRevealersOutrankMisaligned() {
    std::vector<Commitment> commitments{
        makeCommitment("low", 0, 100'000'000, true, 100'000'000),
        makeCommitment("mid", 1, 100'000'000, true, 110'000'000),
        makeCommitment("high", 2, 100'000'000, true, 130'000'000),
        makeCommitment("silent", 3, 100'000'000, false, 0),
    };
    SettlementPlan plan = computeSettlement(105'000'000, 0, commitments);

    const auto& low = payoutFor(plan, "low");
    const auto& mid = payoutFor(plan, "mid");
    const auto& high = payoutFor(plan, "high");
    expect(plan.truthEdge < 0, "truth sits below consensus");
    expect(low.aligned && mid.aligned && !high.aligned, "alignment gate");
    expect(low.payout > high.payout, "low outranks misaligned high");
    expect(mid.payout > high.payout, "mid outranks misaligned high");
    expectEq(high.payout, 100'000'000, "misaligned keeps its stake");
    // Equal error, so the earlier committer earns the larger share.
    expect(low.score > mid.score, "time decay favours the earlier submitter");
    expectEq(payoutFor(plan, "silent").payout, 0, "non-revealer forfeits");
    checkConservation(plan, "ordering");
}

void testStakeWeightedFallback() {
    // The only aligned revealer is so far off that its accuracy weight floors to zero.
    std::vector<Commitment> commitments{
        makeCommitment("zero", 0, 100'000'000, true, 0),
        makeCommitment("ten", 1, 300'000'000, true, 10'000'000),
        makeCommitment("gone", 2, 100'000'000, false, 0),
    };
    SettlementPlan plan = computeSettlement(2'000'000'000'000LL, 0, commitments);
    expect(plan.stakeWeightedFallback, "fallback engaged");
    expectEq(payoutFor(plan, "zero").payout, 125'000'000, "quarter of the pool");
    expectEq(payoutFor(plan, "ten").payout, 375'000'000, "three quarters of the pool");
    checkConservation(plan, "fallback");
}

void testDegenerateRefund() {
    std::vector<Commitment> commitments{
        makeCommitment("x", 0, 100'000'000, false, 0),
        makeCommitment("y", 1, 50'000'000, false, 0),
    };
    SettlementPlan plan = computeSettlement(1'000'000, 900'000, commitments);
    expect(plan.degenerate, "no reveals is degenerate");
    expectEq(payoutFor(plan, "x").payout, 99'400'000, "x refunded minus its reserve share");
    expectEq(payoutFor(plan, "y").payout, 49'700'000, "y refunded minus its reserve share");
    checkConservation(plan, "degenerate");
}

void testReserveLargerThanStakes() {
    std::vector<Commitment> commitments{ makeCommitment("tiny", 0, 1'000, true, 5) };
    SettlementPlan plan = computeSettlement(5, kReserve, commitments);
    expectEq(plan.reserveRetained, 1'000, "reserve capped by deposits");
    expectEq(payoutFor(plan, "tiny").payout, 0, "everything retained");
    checkConservation(plan, "tiny");
}

void testApportionRemainder() {
    auto shares = apportion(10, { 1, 1, 1 }, { 2, 0, 1 });
    expect(shares == std::vector<std::uint64_t>{ 3, 4, 3 }, "leftover goes to the lowest submit order");

    shares = apportion(5, { 0, 2, 0 }, { 0, 1, 2 });
    expect(shares == std::vector<std::uint64_t>{ 0, 5, 0 }, "zero weights receive nothing");

    shares = apportion(0, { 0, 0 }, { 0, 1 });
    expect(shares == std::vector<std::uint64_t>{ 0, 0 }, "nothing to split");

    bool threw = false;
    try {
        apportion(1, { 0, 0 }, { 0, 1 });
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "positive amount over zero weight throws");
}

void testConservationSweep() {
    std::uint64_t state = 0x9E3779B97F4A7C15ULL;
    auto next = [&state]() {
        state = state * 6364136223846793005ULL + 1442695040888963407ULL;
        return state >> 33;
    };

    for (int round = 0; round < 200; ++round) {
        std::vector<Commitment> commitments;
        std::uint32_t count = 1 + static_cast<std::uint32_t>(next() % 12);
        for (std::uint32_t i = 0; i < count; ++i) {
            std::uint64_t stake = 10'000'000 + next() % 500'000'000;
            bool revealed = next() % 3 != 0;
            auto prediction = static_cast<std::int64_t>(next() % 400'000'000) - 50'000'000;
            commitments.push_back(makeCommitment("p" + std::to_string(i), i, stake, revealed, prediction));
        }
        auto truth = static_cast<std::int64_t>(next() % 400'000'000) - 50'000'000;
        std::uint64_t reserve = next() % 2'000'000;
        SettlementPlan plan = computeSettlement(truth, reserve, commitments);
        checkConservation(plan, "sweep round " + std::to_string(round));

        bool anyRevealed = false;
        for (const auto& c : commitments) {
            anyRevealed = anyRevealed || c.revealed;
        }
        for (const auto& p : plan.payouts) {
            if (anyRevealed && !p.revealed) {
                expectEq(p.payout, 0, "forfeiture in sweep");
            }
            if (p.revealed) {
                expect(p.payout + p.reserveCharge >= p.stake, "revealer recovers stake net of reserve share");
            }
        }
    }
}

void testOverflowIsReported() {
    std::vector<Commitment> commitments{
        makeCommitment("big1", 0, std::numeric_limits<std::uint64_t>::max(), true, 1),
        makeCommitment("big2", 1, 1, true, 1),
    };
    bool threw = false;
    try {
        computeSettlement(1, 0, commitments);
    } catch (const ProgramError& err) {
        threw = err.code() == ErrorCode::ArithmeticOverflow;
    }
    expect(threw, "total stake beyond u64 reports ArithmeticOverflow");
}

void testExtremePredictionsStillSettle() {
    constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

    // A dust stake revealing the most negative value must not block everyone else's payout.
    std::vector<Commitment> commitments{
        makeCommitment("outlier", 0, 1, true, kMin),
        makeCommitment("honest", 1, 100'000'000'000ULL, true, 150'000'000),
        makeCommitment("silent", 2, 50'000'000, false, 0),
    };
    SettlementPlan plan = computeSettlement(151'000'000, kReserve, commitments);
    expect(plan.consensus == 57'766'279, "consensus with an extreme outlier");
    expect(plan.truthEdge == 93'233'721, "truth edge with an extreme outlier");
    expect(!payoutFor(plan, "outlier").aligned, "outlier points away from the truth");
    expectEq(payoutFor(plan, "outlier").payout, 1, "outlier keeps its dust stake");
    expectEq(payoutFor(plan, "honest").payout, 100'000'000'000ULL + 50'000'000 - kReserve, "honest takes the pool");
    expectEq(payoutFor(plan, "silent").payout, 0, "silent forfeits");
    checkConservation(plan, "extreme outlier");

    // Both edges leave the i64 range; the reported truth edge saturates.
    commitments = {
        makeCommitment("floor", 0, 100'000'000, true, kMin),
        makeCommitment("zero", 1, 100'000'000, true, 0),
        makeCommitment("absent", 2, 100'000'000, false, 0),
    };
    plan = computeSettlement(kMax, 0, commitments);
    expect(plan.consensus == kMin / 2, "consensus halfway to the floor");
    expect(plan.truthEdge == kMax, "truth edge saturates");
    expect(payoutFor(plan, "zero").aligned && !payoutFor(plan, "floor").aligned, "gate uses full-width edges");
    expect(plan.stakeWeightedFallback, "accuracy weight floors to zero at this distance");
    expectEq(payoutFor(plan, "floor").payout, 150'000'000, "half the pool by stake");
    expectEq(payoutFor(plan, "zero").payout, 150'000'000, "half the pool by stake");
    checkConservation(plan, "extreme truth");
}

} // namespace

int main() {
    testThreeParticipantScenario();
    testSingleParticipantExactHit();
    testAlignedRevealersOutrankMisaligned();
    testStakeWeightedFallback();
    testDegenerateRefund();
    testReserveLargerThanStakes();
    testApportionRemainder();
    testConservationSweep();
    testOverflowIsReported();
    testExtremePredictionsStillSettle();

    std::cout << "settlement_test passed" << std::endl;
    return 0;
}
