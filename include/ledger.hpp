#pragma once

#include "bytes.hpp"
#include "transcript_log.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace wh {

struct Account {
    std::uint64_t lamports = 0;
    std::vector<std::uint8_t> data;

    bool operator==(const Account& other) const {
        return lamports == other.lamports && data == other.data;
    }
};

// SHA-256(seed_1 || ... || seed_n || programId || "ProgramDerivedAddress").
Address deriveAddress(const std::vector<std::vector<std::uint8_t>>& seeds, const Identity& programId);

// In-process stand-in for the ledger platform: accounts keyed by address, an
// authoritative clock, and the program log. Wallets are accounts with no data.
class Ledger {
public:
    void setClock(std::int64_t unixTimestamp) { clock_ = unixTimestamp; }
    void advanceClock(std::int64_t seconds) { clock_ += seconds; }
    std::int64_t now() const { return clock_; }

    void airdrop(const Identity& wallet, std::uint64_t lamports);
    std::uint64_t balanceOf(const Address& address) const;
    const Account* find(const Address& address) const;
    const std::map<Address, Account>& accounts() const { return accounts_; }

    const TranscriptLog& transcript() const { return transcript_; }

private:
    friend class LedgerTransaction;

    std::map<Address, Account> accounts_;
    std::int64_t clock_ = 0;
    TranscriptLog transcript_;
};

// Staged view of the ledger for one instruction. Reads see staged writes first;
// commit() publishes writes and log lines together, destruction without commit
// drops them.
class LedgerTransaction {
public:
    explicit LedgerTransaction(Ledger& ledger);
    LedgerTransaction(const LedgerTransaction&) = delete;
    LedgerTransaction& operator=(const LedgerTransaction&) = delete;

    std::int64_t now() const { return ledger_.clock_; }

    bool exists(const Address& address) const;
    const Account* find(const Address& address) const;
    // Staged copy of an existing account, or a fresh empty one.
    Account& stage(const Address& address);
    void storeData(const Address& address, std::vector<std::uint8_t> data);

    // Throws ProgramError InsufficientFunds / ArithmeticOverflow.
    void transfer(const Address& from, const Address& to, std::uint64_t lamports);

    void forEachAccount(const std::function<void(const Address&, const Account&)>& visit) const;

    void log(std::string event);
    void commit();

private:
    Ledger& ledger_;
    std::map<Address, Account> staged_;
    std::vector<std::string> events_;
    bool committed_ = false;
};

} // namespace wh
