#pragma once

#include "bytes.hpp"
#include "commitment_scheme.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wh {

constexpr std::size_t kMaxDescriptionLen = 256;
constexpr std::size_t kMaxSymbolLen = 32;

enum class TopicStatus : std::uint8_t {
    Open = 0,
    Revealing = 1,
    Finalized = 2,
    Settled = 3,
};

const char* topicStatusName(TopicStatus status);

struct Topic {
    std::uint64_t topicId = 0;
    Identity creator{};
    Identity truthAuthority{};
    std::string description;
    std::string symbol;
    std::int64_t commitDeadline = 0;
    std::int64_t revealDeadline = 0;
    std::uint64_t minStake = 0;
    TopicStatus status = TopicStatus::Open;
    std::int64_t truthValue = 0; // fixed-point 1e6, meaningful once Finalized
    std::uint64_t totalStake = 0;
    std::uint32_t commitmentCount = 0;
    std::uint32_t revealCount = 0;
};

struct Commitment {
    Address topicRef{};
    Identity participant{};
    CommitmentHash commitmentHash{};
    std::uint64_t stakeAmount = 0;
    std::uint32_t submitOrder = 0;
    std::int64_t predictionValue = 0; // fixed-point 1e6, meaningful once revealed
    bool revealed = false;
    bool settled = false;
};

struct EscrowRecord {
    Address topic{};
    std::uint64_t reserve = 0;
    std::uint64_t deposited = 0;
    std::uint64_t paidOut = 0;
};

// Account data layout: 8-byte discriminator (SHA-256("account:<Name>")[0..8])
// followed by the fields in declaration order, little-endian, strings as
// u32 length + bytes, bools as one byte. Decoders throw ProgramError
// (CorruptAccountData) on any mismatch, including trailing bytes.
std::vector<std::uint8_t> encodeTopic(const Topic& topic);
Topic decodeTopic(const std::vector<std::uint8_t>& data);

std::vector<std::uint8_t> encodeCommitment(const Commitment& commitment);
Commitment decodeCommitment(const std::vector<std::uint8_t>& data);

std::vector<std::uint8_t> encodeEscrow(const EscrowRecord& escrow);
EscrowRecord decodeEscrow(const std::vector<std::uint8_t>& data);

bool hasCommitmentDiscriminator(const std::vector<std::uint8_t>& data);

} // namespace wh
