#include "escrow.hpp"

#include "errors.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace wh {

Escrow::Escrow(LedgerTransaction& tx, const Address& topicAddress, const Identity& programId)
    : tx_(tx), topicAddress_(topicAddress), address_(addressFor(topicAddress, programId)) {}

Address Escrow::addressFor(const Address& topicAddress, const Identity& programId) {
    static const std::string kSeed = "vault";
    std::vector<std::uint8_t> label(kSeed.begin(), kSeed.end());
    std::vector<std::uint8_t> topic(topicAddress.begin(), topicAddress.end());
    return deriveAddress({ label, topic }, programId);
}

void Escrow::open(std::uint64_t reserve) {
    if (tx_.exists(address_)) {
        throw ProgramError(ErrorCode::TopicAlreadyExists, "escrow account already in use");
    }
    EscrowRecord record;
    record.topic = topicAddress_;
    record.reserve = reserve;
    store(record);
}

void Escrow::deposit(const Identity& from, std::uint64_t amount) {
    EscrowRecord record = load();
    if (std::numeric_limits<std::uint64_t>::max() - record.deposited < amount) {
        throw ProgramError(ErrorCode::ArithmeticOverflow, "escrow deposits");
    }
    tx_.transfer(from, address_, amount);
    record.deposited += amount;
    store(record);
}

void Escrow::payout(const Identity& to, std::uint64_t amount) {
    if (amount == 0) {
        return;
    }
    EscrowRecord record = load();
    std::uint64_t held = balance();
    std::uint64_t floor = retainedReserve();
    if (held < floor || held - floor < amount) {
        throw ProgramError(ErrorCode::InsufficientFunds,
                           "escrow payout of " + std::to_string(amount) + " would breach reserve");
    }
    tx_.transfer(address_, to, amount);
    record.paidOut += amount;
    store(record);
}

std::uint64_t Escrow::balance() const {
    const Account* account = tx_.find(address_);
    return account == nullptr ? 0 : account->lamports;
}

std::uint64_t Escrow::retainedReserve() const {
    EscrowRecord record = load();
    return std::min(record.reserve, record.deposited);
}

EscrowRecord Escrow::load() const {
    const Account* account = tx_.find(address_);
    if (account == nullptr) {
        throw ProgramError(ErrorCode::CorruptAccountData, "escrow account missing");
    }
    return decodeEscrow(account->data);
}

void Escrow::store(const EscrowRecord& record) {
    tx_.storeData(address_, encodeEscrow(record));
}

} // namespace wh
