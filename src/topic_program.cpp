#include "topic_program.hpp"

#include "errors.hpp"
#include "escrow.hpp"
#include "fixed_point.hpp"

#include <algorithm>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace wh {

namespace {

std::vector<std::uint8_t> seedBytes(const std::string& label) {
    return std::vector<std::uint8_t>(label.begin(), label.end());
}

std::vector<std::uint8_t> seedBytes(const Bytes32& value) {
    return std::vector<std::uint8_t>(value.begin(), value.end());
}

std::string shortId(const Identity& id) {
    return toHex(id).substr(0, 16);
}

std::string fixedString(std::int64_t raw) {
    return Fixed64::fromRaw(raw).toString();
}

Topic loadTopic(const LedgerTransaction& tx, const Address& address, std::uint64_t topicId) {
    const Account* account = tx.find(address);
    if (account == nullptr || account->data.empty()) {
        throw ProgramError(ErrorCode::TopicNotFound, "topic " + std::to_string(topicId));
    }
    return decodeTopic(account->data);
}

std::optional<Commitment> loadCommitment(const LedgerTransaction& tx, const Address& address) {
    const Account* account = tx.find(address);
    if (account == nullptr || account->data.empty()) {
        return std::nullopt;
    }
    return decodeCommitment(account->data);
}

void collectCommitment(const Account& account, const Address& topicAddress, std::vector<Commitment>& out) {
    if (!hasCommitmentDiscriminator(account.data)) {
        return;
    }
    Commitment commitment = decodeCommitment(account.data);
    if (commitment.topicRef == topicAddress) {
        out.push_back(commitment);
    }
}

void sortBySubmitOrder(std::vector<Commitment>& commitments) {
    std::sort(commitments.begin(), commitments.end(), [](const Commitment& a, const Commitment& b) {
        return a.submitOrder < b.submitOrder;
    });
}

std::vector<Commitment> scanCommitments(const LedgerTransaction& tx, const Address& topicAddress) {
    std::vector<Commitment> out;
    tx.forEachAccount([&](const Address&, const Account& account) {
        collectCommitment(account, topicAddress, out);
    });
    sortBySubmitOrder(out);
    return out;
}

} // namespace

struct TopicProgram::Handler {
    TopicProgram& program;
    LedgerTransaction& tx;
    const Identity& signer;
    InstructionReceipt& receipt;

    void emit(const std::string& event) {
        tx.log(event);
        receipt.events.push_back(event);
    }

    void operator()(const CreateTopicInstruction& ix) {
        if (ix.description.size() > kMaxDescriptionLen) {
            throw ProgramError(ErrorCode::DescriptionTooLong);
        }
        if (ix.symbol.size() > kMaxSymbolLen) {
            throw ProgramError(ErrorCode::SymbolTooLong);
        }
        if (ix.commitDeadline <= tx.now()) {
            throw ProgramError(ErrorCode::InvalidDeadlines, "commit deadline is not in the future");
        }
        if (ix.revealDeadline <= ix.commitDeadline) {
            throw ProgramError(ErrorCode::InvalidDeadlines, "reveal deadline must follow commit deadline");
        }
        if (ix.minStake == 0) {
            throw ProgramError(ErrorCode::ZeroStake, "minimum stake");
        }

        Address address = program.topicAddress(ix.topicId);
        if (tx.exists(address)) {
            throw ProgramError(ErrorCode::TopicAlreadyExists, "topic " + std::to_string(ix.topicId));
        }

        Topic topic;
        topic.topicId = ix.topicId;
        topic.creator = signer;
        topic.truthAuthority = ix.truthAuthority;
        topic.description = ix.description;
        topic.symbol = ix.symbol;
        topic.commitDeadline = ix.commitDeadline;
        topic.revealDeadline = ix.revealDeadline;
        topic.minStake = ix.minStake;
        tx.storeData(address, encodeTopic(topic));

        Escrow escrow(tx, address, program.config_.programId);
        escrow.open(program.config_.escrowReserve);

        std::ostringstream oss;
        oss << "topic-created:id=" << topic.topicId << ":symbol=" << topic.symbol
            << ":commit_deadline=" << topic.commitDeadline << ":reveal_deadline=" << topic.revealDeadline;
        emit(oss.str());
    }

    void operator()(const CommitInstruction& ix) {
        Address address = program.topicAddress(ix.topicId);
        Topic topic = loadTopic(tx, address, ix.topicId);

        if (topic.status != TopicStatus::Open || tx.now() >= topic.commitDeadline) {
            throw ProgramError(ErrorCode::CommitPhaseEnded);
        }
        if (ix.stake == 0) {
            throw ProgramError(ErrorCode::ZeroStake);
        }
        if (ix.stake < topic.minStake) {
            throw ProgramError(ErrorCode::StakeBelowMinimum,
                               std::to_string(ix.stake) + " < " + std::to_string(topic.minStake));
        }
        Address commitmentAddr = program.commitmentAddressFor(address, signer);
        if (tx.exists(commitmentAddr)) {
            throw ProgramError(ErrorCode::DuplicateCommitment);
        }
        if (std::numeric_limits<std::uint64_t>::max() - topic.totalStake < ix.stake ||
            topic.commitmentCount == std::numeric_limits<std::uint32_t>::max()) {
            throw ProgramError(ErrorCode::ArithmeticOverflow, "topic totals");
        }

        Escrow escrow(tx, address, program.config_.programId);
        escrow.deposit(signer, ix.stake);

        Commitment commitment;
        commitment.topicRef = address;
        commitment.participant = signer;
        commitment.commitmentHash = ix.commitmentHash;
        commitment.stakeAmount = ix.stake;
        commitment.submitOrder = topic.commitmentCount;
        tx.storeData(commitmentAddr, encodeCommitment(commitment));

        topic.commitmentCount += 1;
        topic.totalStake += ix.stake;
        tx.storeData(address, encodeTopic(topic));

        std::ostringstream oss;
        oss << "commitment-received:topic=" << topic.topicId << ":order=" << commitment.submitOrder
            << ":participant=" << shortId(signer) << ":stake=" << ix.stake;
        emit(oss.str());
    }

    void operator()(const RevealInstruction& ix) {
        Address address = program.topicAddress(ix.topicId);
        Topic topic = loadTopic(tx, address, ix.topicId);

        Address commitmentAddr = program.commitmentAddressFor(address, signer);
        auto commitment = loadCommitment(tx, commitmentAddr);
        if (!commitment) {
            throw ProgramError(ErrorCode::UnknownParticipant, shortId(signer));
        }
        if (commitment->revealed) {
            throw ProgramError(ErrorCode::AlreadyRevealed);
        }
        if (tx.now() < topic.commitDeadline) {
            throw ProgramError(ErrorCode::CommitPhaseNotEnded);
        }
        if (tx.now() >= topic.revealDeadline ||
            (topic.status != TopicStatus::Open && topic.status != TopicStatus::Revealing)) {
            throw ProgramError(ErrorCode::RevealPhaseEnded);
        }
        if (!verifyCommitment(commitment->commitmentHash, ix.predictionValue, ix.salt, signer)) {
            throw ProgramError(ErrorCode::HashMismatch);
        }

        commitment->predictionValue = ix.predictionValue;
        commitment->revealed = true;
        tx.storeData(commitmentAddr, encodeCommitment(*commitment));

        topic.revealCount += 1;
        if (topic.status == TopicStatus::Open) {
            topic.status = TopicStatus::Revealing;
        }
        tx.storeData(address, encodeTopic(topic));

        std::ostringstream oss;
        oss << "commitment-revealed:topic=" << topic.topicId << ":participant=" << shortId(signer)
            << ":prediction=" << fixedString(ix.predictionValue);
        emit(oss.str());
    }

    void operator()(const FinalizeInstruction& ix) {
        Address address = program.topicAddress(ix.topicId);
        Topic topic = loadTopic(tx, address, ix.topicId);

        if (signer != topic.truthAuthority) {
            throw ProgramError(ErrorCode::UnauthorizedOracle);
        }
        if (topic.status == TopicStatus::Finalized) {
            throw ProgramError(ErrorCode::AlreadyFinalized);
        }
        if (topic.status == TopicStatus::Settled) {
            throw ProgramError(ErrorCode::AlreadySettled);
        }
        if (tx.now() < topic.revealDeadline) {
            throw ProgramError(ErrorCode::RevealPhaseNotEnded);
        }

        topic.truthValue = ix.truthValue;
        topic.status = TopicStatus::Finalized;
        tx.storeData(address, encodeTopic(topic));

        std::ostringstream oss;
        oss << "topic-finalized:id=" << topic.topicId << ":truth=" << fixedString(ix.truthValue)
            << ":reveals=" << topic.revealCount << "/" << topic.commitmentCount;
        emit(oss.str());
    }

    void operator()(const SettleInstruction& ix) {
        Address address = program.topicAddress(ix.topicId);
        Topic topic = loadTopic(tx, address, ix.topicId);

        if (topic.status == TopicStatus::Settled) {
            throw ProgramError(ErrorCode::AlreadySettled);
        }
        if (topic.status != TopicStatus::Finalized) {
            throw ProgramError(ErrorCode::InvalidTopicState, topicStatusName(topic.status));
        }

        std::vector<Commitment> commitments = scanCommitments(tx, address);
        if (commitments.size() != topic.commitmentCount) {
            throw ProgramError(ErrorCode::CorruptAccountData, "commitment count does not match topic");
        }

        std::set<Identity> listed;
        std::vector<Identity> toPay;
        for (const auto& participant : ix.participants) {
            if (!listed.insert(participant).second) {
                throw ProgramError(ErrorCode::DuplicateSettlementEntry, shortId(participant));
            }
            auto commitment = loadCommitment(tx, program.commitmentAddressFor(address, participant));
            if (!commitment) {
                throw ProgramError(ErrorCode::UnknownParticipant, shortId(participant));
            }
            if (!commitment->settled) {
                toPay.push_back(participant);
            }
        }

        std::size_t unsettled = static_cast<std::size_t>(
            std::count_if(commitments.begin(), commitments.end(), [](const Commitment& c) {
                return !c.settled;
            }));
        std::size_t batch = program.config_.maxSettleBatch;
        if (ix.participants.size() > batch) {
            throw ProgramError(ErrorCode::PartialSettlementNotAllowed,
                               "batch limit is " + std::to_string(batch));
        }
        if (toPay.size() < std::min(unsettled, batch)) {
            throw ProgramError(ErrorCode::PartialSettlementNotAllowed,
                               std::to_string(unsettled - toPay.size()) + " unsettled commitments left out");
        }

        Escrow escrow(tx, address, program.config_.programId);
        SettlementPlan plan = computeSettlement(topic.truthValue, escrow.reserve(), commitments);

        for (const auto& participant : toPay) {
            auto entry = std::find_if(plan.payouts.begin(), plan.payouts.end(),
                                      [&](const ParticipantPayout& p) { return p.participant == participant; });
            if (entry == plan.payouts.end()) {
                throw ProgramError(ErrorCode::UnknownParticipant, shortId(participant));
            }
            escrow.payout(participant, entry->payout);

            Address commitmentAddr = program.commitmentAddressFor(address, participant);
            Commitment commitment = *loadCommitment(tx, commitmentAddr);
            commitment.settled = true;
            tx.storeData(commitmentAddr, encodeCommitment(commitment));

            std::ostringstream oss;
            oss << "participant-settled:topic=" << topic.topicId << ":order=" << entry->submitOrder
                << ":participant=" << shortId(participant) << ":payout=" << entry->payout;
            emit(oss.str());
        }

        if (toPay.size() == unsettled) {
            topic.status = TopicStatus::Settled;
            tx.storeData(address, encodeTopic(topic));

            std::ostringstream oss;
            oss << "topic-settled:id=" << topic.topicId << ":truth=" << fixedString(topic.truthValue)
                << ":consensus=" << fixedString(plan.consensus) << ":participants=" << commitments.size()
                << ":loser_pool=" << plan.loserPool << ":reserve=" << plan.reserveRetained;
            emit(oss.str());
        }

        receipt.settlement = std::move(plan);
    }
};

TopicProgram::TopicProgram(Ledger& ledger, ProgramConfig config)
    : ledger_(ledger), config_(std::move(config)) {
    if (config_.maxSettleBatch == 0) {
        throw std::invalid_argument("maxSettleBatch must be positive");
    }
}

InstructionReceipt TopicProgram::process(const Identity& signer, const Instruction& instruction) {
    InstructionReceipt receipt;
    LedgerTransaction tx(ledger_);
    std::visit(Handler{ *this, tx, signer, receipt }, instruction);
    tx.commit();
    return receipt;
}

void TopicProgram::createTopic(const Identity& creator, const CreateTopicInstruction& params) {
    process(creator, params);
}

void TopicProgram::commit(const Identity& participant,
                          std::uint64_t topicId,
                          const CommitmentHash& hash,
                          std::uint64_t stake) {
    process(participant, CommitInstruction{ topicId, hash, stake });
}

void TopicProgram::reveal(const Identity& participant,
                          std::uint64_t topicId,
                          std::int64_t prediction,
                          const Salt& salt) {
    process(participant, RevealInstruction{ topicId, prediction, salt });
}

void TopicProgram::finalize(const Identity& caller, std::uint64_t topicId, std::int64_t truthValue) {
    process(caller, FinalizeInstruction{ topicId, truthValue });
}

SettlementPlan TopicProgram::settle(const Identity& caller,
                                    std::uint64_t topicId,
                                    const std::vector<Identity>& participants) {
    InstructionReceipt receipt = process(caller, SettleInstruction{ topicId, participants });
    if (!receipt.settlement) {
        throw std::logic_error("settle produced no settlement plan");
    }
    return *receipt.settlement;
}

std::optional<Topic> TopicProgram::getTopic(std::uint64_t topicId) const {
    const Account* account = ledger_.find(topicAddress(topicId));
    if (account == nullptr || account->data.empty()) {
        return std::nullopt;
    }
    return decodeTopic(account->data);
}

std::optional<Commitment> TopicProgram::getCommitment(std::uint64_t topicId, const Identity& participant) const {
    const Account* account = ledger_.find(commitmentAddress(topicId, participant));
    if (account == nullptr || account->data.empty()) {
        return std::nullopt;
    }
    return decodeCommitment(account->data);
}

std::vector<Commitment> TopicProgram::listCommitments(std::uint64_t topicId) const {
    Address address = topicAddress(topicId);
    std::vector<Commitment> out;
    for (const auto& entry : ledger_.accounts()) {
        collectCommitment(entry.second, address, out);
    }
    sortBySubmitOrder(out);
    return out;
}

std::optional<EscrowRecord> TopicProgram::getEscrow(std::uint64_t topicId) const {
    const Account* account = ledger_.find(escrowAddress(topicId));
    if (account == nullptr || account->data.empty()) {
        return std::nullopt;
    }
    return decodeEscrow(account->data);
}

std::uint64_t TopicProgram::escrowBalance(std::uint64_t topicId) const {
    return ledger_.balanceOf(escrowAddress(topicId));
}

Address TopicProgram::topicAddress(std::uint64_t topicId) const {
    std::vector<std::uint8_t> id;
    appendU64(id, topicId);
    return deriveAddress({ seedBytes("topic"), id }, config_.programId);
}

Address TopicProgram::escrowAddress(std::uint64_t topicId) const {
    return Escrow::addressFor(topicAddress(topicId), config_.programId);
}

Address TopicProgram::commitmentAddress(std::uint64_t topicId, const Identity& participant) const {
    return commitmentAddressFor(topicAddress(topicId), participant);
}

Address TopicProgram::commitmentAddressFor(const Address& topicAddress, const Identity& participant) const {
    return deriveAddress({ seedBytes("commitment"), seedBytes(topicAddress), seedBytes(participant) },
                         config_.programId);
}

} // namespace wh
