#pragma once

#include "commitment_scheme.hpp"
#include "ledger.hpp"
#include "program_config.hpp"
#include "records.hpp"
#include "settlement.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wh {

struct CreateTopicInstruction {
    std::uint64_t topicId = 0;
    std::string description;
    std::string symbol;
    std::int64_t commitDeadline = 0;
    std::int64_t revealDeadline = 0;
    std::uint64_t minStake = 0;
    Identity truthAuthority{};
};

struct CommitInstruction {
    std::uint64_t topicId = 0;
    CommitmentHash commitmentHash{};
    std::uint64_t stake = 0;
};

struct RevealInstruction {
    std::uint64_t topicId = 0;
    std::int64_t predictionValue = 0;
    Salt salt{};
};

struct FinalizeInstruction {
    std::uint64_t topicId = 0;
    std::int64_t truthValue = 0;
};

struct SettleInstruction {
    std::uint64_t topicId = 0;
    std::vector<Identity> participants;
};

using Instruction = std::variant<CreateTopicInstruction,
                                 CommitInstruction,
                                 RevealInstruction,
                                 FinalizeInstruction,
                                 SettleInstruction>;

struct InstructionReceipt {
    std::vector<std::string> events;
    // Present for settle.
    std::optional<SettlementPlan> settlement;
};

// Topic lifecycle: Open -> Revealing -> Finalized -> Settled. Each instruction is
// checked against the topic's phase, the ledger clock and the signer, then
// applied in a single LedgerTransaction: on any ProgramError nothing it staged
// reaches the ledger.
class TopicProgram {
public:
    TopicProgram(Ledger& ledger, ProgramConfig config);

    InstructionReceipt process(const Identity& signer, const Instruction& instruction);

    void createTopic(const Identity& creator, const CreateTopicInstruction& params);
    void commit(const Identity& participant, std::uint64_t topicId, const CommitmentHash& hash, std::uint64_t stake);
    void reveal(const Identity& participant, std::uint64_t topicId, std::int64_t prediction, const Salt& salt);
    void finalize(const Identity& caller, std::uint64_t topicId, std::int64_t truthValue);
    SettlementPlan settle(const Identity& caller, std::uint64_t topicId, const std::vector<Identity>& participants);

    std::optional<Topic> getTopic(std::uint64_t topicId) const;
    std::optional<Commitment> getCommitment(std::uint64_t topicId, const Identity& participant) const;
    // Ordered by submit order.
    std::vector<Commitment> listCommitments(std::uint64_t topicId) const;
    std::optional<EscrowRecord> getEscrow(std::uint64_t topicId) const;
    std::uint64_t escrowBalance(std::uint64_t topicId) const;

    Address topicAddress(std::uint64_t topicId) const;
    Address escrowAddress(std::uint64_t topicId) const;
    Address commitmentAddress(std::uint64_t topicId, const Identity& participant) const;

    const ProgramConfig& config() const { return config_; }
    const Ledger& ledger() const { return ledger_; }

private:
    struct Handler;

    Address commitmentAddressFor(const Address& topicAddress, const Identity& participant) const;

    Ledger& ledger_;
    ProgramConfig config_;
};

} // namespace wh
