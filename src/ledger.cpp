#include "ledger.hpp"

#include "errors.hpp"

#include <limits>
#include <stdexcept>

namespace wh {

namespace {

void creditChecked(Account& account, std::uint64_t lamports) {
    if (std::numeric_limits<std::uint64_t>::max() - account.lamports < lamports) {
        throw ProgramError(ErrorCode::ArithmeticOverflow, "account balance");
    }
    account.lamports += lamports;
}

} // namespace

Address deriveAddress(const std::vector<std::vector<std::uint8_t>>& seeds, const Identity& programId) {
    static const std::string kMarker = "ProgramDerivedAddress";
    std::vector<std::uint8_t> material;
    for (const auto& seed : seeds) {
        material.insert(material.end(), seed.begin(), seed.end());
    }
    appendBytes(material, programId);
    material.insert(material.end(), kMarker.begin(), kMarker.end());
    return sha256Digest(material);
}

void Ledger::airdrop(const Identity& wallet, std::uint64_t lamports) {
    creditChecked(accounts_[wallet], lamports);
}

std::uint64_t Ledger::balanceOf(const Address& address) const {
    auto it = accounts_.find(address);
    return it == accounts_.end() ? 0 : it->second.lamports;
}

const Account* Ledger::find(const Address& address) const {
    auto it = accounts_.find(address);
    return it == accounts_.end() ? nullptr : &it->second;
}

LedgerTransaction::LedgerTransaction(Ledger& ledger) : ledger_(ledger) {}

bool LedgerTransaction::exists(const Address& address) const {
    return find(address) != nullptr;
}

const Account* LedgerTransaction::find(const Address& address) const {
    auto it = staged_.find(address);
    if (it != staged_.end()) {
        return &it->second;
    }
    return ledger_.find(address);
}

Account& LedgerTransaction::stage(const Address& address) {
    auto it = staged_.find(address);
    if (it != staged_.end()) {
        return it->second;
    }
    const Account* base = ledger_.find(address);
    return staged_.emplace(address, base ? *base : Account{}).first->second;
}

void LedgerTransaction::storeData(const Address& address, std::vector<std::uint8_t> data) {
    stage(address).data = std::move(data);
}

void LedgerTransaction::transfer(const Address& from, const Address& to, std::uint64_t lamports) {
    if (lamports == 0) {
        return;
    }
    Account& source = stage(from);
    if (source.lamports < lamports) {
        throw ProgramError(ErrorCode::InsufficientFunds,
                           "need " + std::to_string(lamports) + ", have " + std::to_string(source.lamports));
    }
    source.lamports -= lamports;
    creditChecked(stage(to), lamports);
}

void LedgerTransaction::forEachAccount(
    const std::function<void(const Address&, const Account&)>& visit) const {
    for (const auto& [address, account] : ledger_.accounts_) {
        auto staged = staged_.find(address);
        visit(address, staged != staged_.end() ? staged->second : account);
    }
    for (const auto& [address, account] : staged_) {
        if (ledger_.accounts_.count(address) == 0) {
            visit(address, account);
        }
    }
}

void LedgerTransaction::log(std::string event) {
    events_.push_back(std::move(event));
}

void LedgerTransaction::commit() {
    if (committed_) {
        throw std::logic_error("LedgerTransaction committed twice");
    }
    for (auto& [address, account] : staged_) {
        ledger_.accounts_[address] = std::move(account);
    }
    for (const auto& event : events_) {
        ledger_.transcript_.append(event);
    }
    staged_.clear();
    events_.clear();
    committed_ = true;
}

} // namespace wh
