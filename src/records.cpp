#include "records.hpp"

#include "errors.hpp"

#include <array>
#include <algorithm>

namespace wh {

namespace {

using Discriminator = std::array<std::uint8_t, 8>;

Discriminator discriminatorFor(const std::string& name) {
    Bytes32 digest = sha256Digest("account:" + name);
    Discriminator out{};
    std::copy(digest.begin(), digest.begin() + out.size(), out.begin());
    return out;
}

const Discriminator& topicDiscriminator() {
    static const Discriminator d = discriminatorFor("Topic");
    return d;
}

const Discriminator& commitmentDiscriminator() {
    static const Discriminator d = discriminatorFor("Commitment");
    return d;
}

const Discriminator& escrowDiscriminator() {
    static const Discriminator d = discriminatorFor("Escrow");
    return d;
}

void writeString(std::vector<std::uint8_t>& out, const std::string& s) {
    appendU32(out, static_cast<std::uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

void writeBool(std::vector<std::uint8_t>& out, bool value) {
    out.push_back(value ? 1 : 0);
}

class RecordReader {
public:
    RecordReader(const std::vector<std::uint8_t>& data, const char* recordName)
        : data_(data), name_(recordName), pos_(0) {}

    void expectDiscriminator(const Discriminator& expected) {
        need(expected.size());
        if (!std::equal(expected.begin(), expected.end(), data_.begin())) {
            fail("discriminator mismatch");
        }
        pos_ += expected.size();
    }

    std::uint8_t readU8() {
        need(1);
        return data_[pos_++];
    }

    std::uint32_t readU32() {
        need(4);
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<std::uint32_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 4;
        return v;
    }

    std::uint64_t readU64() {
        need(8);
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<std::uint64_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 8;
        return v;
    }

    std::int64_t readI64() { return static_cast<std::int64_t>(readU64()); }

    bool readBool() {
        std::uint8_t b = readU8();
        if (b > 1) {
            fail("bool out of range");
        }
        return b == 1;
    }

    Bytes32 readBytes32() {
        need(32);
        Bytes32 out{};
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + out.size()),
                  out.begin());
        pos_ += out.size();
        return out;
    }

    std::string readString(std::size_t maxLen) {
        std::uint32_t len = readU32();
        if (len > maxLen) {
            fail("string exceeds bound");
        }
        need(len);
        std::string out(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                        data_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
        pos_ += len;
        return out;
    }

    void expectEnd() const {
        if (pos_ != data_.size()) {
            fail("trailing bytes");
        }
    }

private:
    void need(std::size_t n) const {
        if (data_.size() - pos_ < n) {
            fail("truncated");
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw ProgramError(ErrorCode::CorruptAccountData, std::string(name_) + ": " + what);
    }

    const std::vector<std::uint8_t>& data_;
    const char* name_;
    std::size_t pos_;
};

} // namespace

const char* topicStatusName(TopicStatus status) {
    switch (status) {
    case TopicStatus::Open: return "Open";
    case TopicStatus::Revealing: return "Revealing";
    case TopicStatus::Finalized: return "Finalized";
    case TopicStatus::Settled: return "Settled";
    }
    return "Unknown";
}

std::vector<std::uint8_t> encodeTopic(const Topic& topic) {
    std::vector<std::uint8_t> out;
    out.reserve(8 + 8 + 64 + (4 + kMaxDescriptionLen) + (4 + kMaxSymbolLen) + 49);
    out.insert(out.end(), topicDiscriminator().begin(), topicDiscriminator().end());
    appendU64(out, topic.topicId);
    appendBytes(out, topic.creator);
    appendBytes(out, topic.truthAuthority);
    writeString(out, topic.description);
    writeString(out, topic.symbol);
    appendI64(out, topic.commitDeadline);
    appendI64(out, topic.revealDeadline);
    appendU64(out, topic.minStake);
    out.push_back(static_cast<std::uint8_t>(topic.status));
    appendI64(out, topic.truthValue);
    appendU64(out, topic.totalStake);
    appendU32(out, topic.commitmentCount);
    appendU32(out, topic.revealCount);
    return out;
}

Topic decodeTopic(const std::vector<std::uint8_t>& data) {
    RecordReader in(data, "Topic");
    in.expectDiscriminator(topicDiscriminator());
    Topic topic;
    topic.topicId = in.readU64();
    topic.creator = in.readBytes32();
    topic.truthAuthority = in.readBytes32();
    topic.description = in.readString(kMaxDescriptionLen);
    topic.symbol = in.readString(kMaxSymbolLen);
    topic.commitDeadline = in.readI64();
    topic.revealDeadline = in.readI64();
    topic.minStake = in.readU64();
    std::uint8_t status = in.readU8();
    if (status > static_cast<std::uint8_t>(TopicStatus::Settled)) {
        throw ProgramError(ErrorCode::CorruptAccountData, "Topic: status out of range");
    }
    topic.status = static_cast<TopicStatus>(status);
    topic.truthValue = in.readI64();
    topic.totalStake = in.readU64();
    topic.commitmentCount = in.readU32();
    topic.revealCount = in.readU32();
    in.expectEnd();
    return topic;
}

std::vector<std::uint8_t> encodeCommitment(const Commitment& commitment) {
    std::vector<std::uint8_t> out;
    out.reserve(8 + 96 + 8 + 4 + 8 + 2);
    out.insert(out.end(), commitmentDiscriminator().begin(), commitmentDiscriminator().end());
    appendBytes(out, commitment.topicRef);
    appendBytes(out, commitment.participant);
    appendBytes(out, commitment.commitmentHash);
    appendU64(out, commitment.stakeAmount);
    appendU32(out, commitment.submitOrder);
    appendI64(out, commitment.predictionValue);
    writeBool(out, commitment.revealed);
    writeBool(out, commitment.settled);
    return out;
}

Commitment decodeCommitment(const std::vector<std::uint8_t>& data) {
    RecordReader in(data, "Commitment");
    in.expectDiscriminator(commitmentDiscriminator());
    Commitment commitment;
    commitment.topicRef = in.readBytes32();
    commitment.participant = in.readBytes32();
    commitment.commitmentHash = in.readBytes32();
    commitment.stakeAmount = in.readU64();
    commitment.submitOrder = in.readU32();
    commitment.predictionValue = in.readI64();
    commitment.revealed = in.readBool();
    commitment.settled = in.readBool();
    in.expectEnd();
    return commitment;
}

std::vector<std::uint8_t> encodeEscrow(const EscrowRecord& escrow) {
    std::vector<std::uint8_t> out;
    out.reserve(8 + 32 + 24);
    out.insert(out.end(), escrowDiscriminator().begin(), escrowDiscriminator().end());
    appendBytes(out, escrow.topic);
    appendU64(out, escrow.reserve);
    appendU64(out, escrow.deposited);
    appendU64(out, escrow.paidOut);
    return out;
}

EscrowRecord decodeEscrow(const std::vector<std::uint8_t>& data) {
    RecordReader in(data, "Escrow");
    in.expectDiscriminator(escrowDiscriminator());
    EscrowRecord escrow;
    escrow.topic = in.readBytes32();
    escrow.reserve = in.readU64();
    escrow.deposited = in.readU64();
    escrow.paidOut = in.readU64();
    in.expectEnd();
    return escrow;
}

bool hasCommitmentDiscriminator(const std::vector<std::uint8_t>& data) {
    const auto& d = commitmentDiscriminator();
    return data.size() >= d.size() && std::equal(d.begin(), d.end(), data.begin());
}

} // namespace wh
