#pragma once

#include "ledger.hpp"
#include "records.hpp"

#include <cstdint>

namespace wh {

// Value-holding account paired 1:1 with a topic. The account's lamports are the
// escrowed value; its data records the reserve and running deposit/payout totals,
// so deposited == paidOut + balance at every instruction boundary.
class Escrow {
public:
    Escrow(LedgerTransaction& tx, const Address& topicAddress, const Identity& programId);

    static Address addressFor(const Address& topicAddress, const Identity& programId);

    void open(std::uint64_t reserve);
    void deposit(const Identity& from, std::uint64_t amount);
    // Refuses to leave less than retainedReserve() behind.
    void payout(const Identity& to, std::uint64_t amount);

    const Address& address() const { return address_; }
    std::uint64_t balance() const;
    std::uint64_t reserve() const { return load().reserve; }
    // The reserve actually withheld: the configured reserve, capped by what was deposited.
    std::uint64_t retainedReserve() const;
    EscrowRecord load() const;

private:
    void store(const EscrowRecord& record);

    LedgerTransaction& tx_;
    Address topicAddress_;
    Address address_;
};

} // namespace wh
