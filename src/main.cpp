#include "commitment_scheme.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "program_config.hpp"
#include "secure_random.hpp"
#include "topic_program.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace wh;

namespace {

class FixedTruthProvider : public TruthProvider {
public:
    explicit FixedTruthProvider(Fixed64 value) : value_(value) {}

    TruthObservation observe(const Topic& topic) override {
        return TruthObservation{ value_.raw(), "fixed:" + topic.symbol + "=" + value_.toString() };
    }

private:
    Fixed64 value_;
};

struct Agent {
    std::string name;
    Identity id;
    Fixed64 prediction;
    bool reveals;
    Salt salt{};
};

void printPlan(const SettlementPlan& plan, const std::vector<Agent>& agents) {
    std::cout << "\n=== SETTLEMENT ===\n";
    std::cout << "Truth:      " << Fixed64::fromRaw(plan.truthValue).toString() << "\n";
    if (plan.degenerate) {
        std::cout << "Nobody revealed; stakes refunded minus reserve.\n";
    } else {
        std::cout << "Consensus:  " << Fixed64::fromRaw(plan.consensus).toString() << "\n";
        std::cout << "Truth edge: " << Fixed64::fromRaw(plan.truthEdge).toString() << "\n";
    }
    std::cout << "Loser pool: " << plan.loserPool << "  bonus pool: " << plan.bonusPool
              << "  reserve: " << plan.reserveRetained << "\n";
    if (plan.stakeWeightedFallback) {
        std::cout << "No aligned scores; loser pool split by stake.\n";
    }
    for (const auto& p : plan.payouts) {
        std::string name = toHex(p.participant).substr(0, 8);
        for (const auto& a : agents) {
            if (a.id == p.participant) {
                name = a.name;
            }
        }
        std::cout << "  [" << p.submitOrder << "] " << std::setw(8) << std::left << name << std::right
                  << " stake=" << p.stake << (p.revealed ? " revealed" : " forfeited")
                  << (p.aligned ? " aligned" : "") << " score=" << p.score << " payout=" << p.payout << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Fixed64 truth = Fixed64::parse("151.00");
    ProgramConfig config;
    try {
        if (argc > 1) {
            truth = Fixed64::parse(argv[1]);
        }
        config = loadProgramConfigFromEnv();
    } catch (const std::exception& ex) {
        std::cerr << "Usage: worth_hub_sim [truth-value]\n" << ex.what() << '\n';
        return 1;
    }

    Ledger ledger;
    ledger.setClock(1'700'000'000);
    TopicProgram program(ledger, config);
    TruthProviderPtr oracle = std::make_shared<FixedTruthProvider>(truth);

    const Identity creator = identityFromLabel("creator");
    const Identity oracleAuthority = identityFromLabel("oracle");
    const std::uint64_t stake = 100'000'000;
    std::vector<Agent> agents{
        { "alpha", identityFromLabel("alpha"), Fixed64::parse("150.00"), true },
        { "beta", identityFromLabel("beta"), Fixed64::parse("155.50"), true },
        { "gamma", identityFromLabel("gamma"), Fixed64::parse("148.00"), false },
    };

    const std::uint64_t topicId = 1;
    try {
        CreateTopicInstruction create;
        create.topicId = topicId;
        create.description = "Predict AAPL closing price in 24h";
        create.symbol = "AAPL";
        create.commitDeadline = ledger.now() + 3600;
        create.revealDeadline = ledger.now() + 7200;
        create.minStake = 10'000'000;
        create.truthAuthority = oracleAuthority;
        program.createTopic(creator, create);
        std::cout << "Topic " << topicId << " created (" << create.symbol << "), escrow reserve "
                  << config.escrowReserve << "\n";

        for (auto& agent : agents) {
            ledger.airdrop(agent.id, stake);
            agent.salt = generateSalt();
            program.commit(agent.id, topicId, computeCommitment(agent.prediction.raw(), agent.salt, agent.id), stake);
            std::cout << "  " << agent.name << " committed " << stake << "\n";
        }

        ledger.advanceClock(3600);
        for (const auto& agent : agents) {
            if (!agent.reveals) {
                std::cout << "  " << agent.name << " withholds its reveal\n";
                continue;
            }
            program.reveal(agent.id, topicId, agent.prediction.raw(), agent.salt);
            std::cout << "  " << agent.name << " revealed " << agent.prediction.toString() << "\n";
        }

        ledger.advanceClock(3600);
        auto topic = program.getTopic(topicId);
        TruthObservation observation = oracle->observe(*topic);
        program.finalize(oracleAuthority, topicId, observation.value);
        std::cout << "Finalized with " << observation.evidence << "\n";

        std::vector<Identity> participants;
        for (const auto& c : program.listCommitments(topicId)) {
            participants.push_back(c.participant);
        }
        SettlementPlan plan = program.settle(creator, topicId, participants);
        printPlan(plan, agents);
    } catch (const ProgramError& err) {
        std::cerr << "Instruction rejected [" << categoryName(err.category()) << "] " << err.what() << '\n';
        return 1;
    }

    std::cout << "\n=== BALANCES ===\n";
    for (const auto& agent : agents) {
        std::cout << "  " << agent.name << ": " << ledger.balanceOf(agent.id) << "\n";
    }
    std::cout << "  escrow: " << program.escrowBalance(topicId) << "\n";
    std::cout << "\nTranscript (" << ledger.transcript().size() << " events) root: "
              << ledger.transcript().merkleRoot() << "\n";
    return 0;
}
