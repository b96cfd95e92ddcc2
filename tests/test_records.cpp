#include "errors.hpp"
#include "records.hpp"

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace wh;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "records_test failure: " << msg << std::endl;
    std::exit(1);
}

void expect(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

void expectCorrupt(const std::function<void()>& decode, const std::string& msg) {
    try {
        decode();
    } catch (const ProgramError& err) {
        if (err.code() != ErrorCode::CorruptAccountData) {
            fail(msg + ": wrong error " + errorName(err.code()));
        }
        return;
    }
    fail(msg + ": decoded corrupt data");
}

Topic sampleTopic() {
    Topic topic;
    topic.topicId = 42;
    topic.creator = identityFromLabel("creator");
    topic.truthAuthority = identityFromLabel("oracle");
    topic.description = "BTC/USD daily close";
    topic.symbol = "BTCUSD";
    topic.commitDeadline = 1'700'000'000;
    topic.revealDeadline = 1'700'003'600;
    topic.minStake = 10'000'000;
    topic.status = TopicStatus::Finalized;
    topic.truthValue = -1'750'000;
    topic.totalStake = 300'000'000;
    topic.commitmentCount = 3;
    topic.revealCount = 2;
    return topic;
}

void testTopicLayout() {
    Topic topic = sampleTopic();
    auto data = encodeTopic(topic);
    // discriminator, id, two identities, two length-prefixed strings, fixed tail
    std::size_t expected = 8 + 8 + 64 + 4 + topic.description.size() + 4 + topic.symbol.size() + 49;
    expect(data.size() == expected, "topic encoded size");
    expect(toHex(std::vector<std::uint8_t>(data.begin(), data.begin() + 8)) == "b50f237d5589436a",
           "topic discriminator");
    expect(data[8] == 42 && data[9] == 0, "topic id is little-endian");

    Topic decoded = decodeTopic(data);
    expect(decoded.topicId == topic.topicId && decoded.description == topic.description &&
               decoded.symbol == topic.symbol && decoded.status == TopicStatus::Finalized &&
               decoded.truthValue == topic.truthValue && decoded.revealCount == 2,
           "topic fields survive encoding");
    expect(!hasCommitmentDiscriminator(data), "topic is not a commitment");
}

void testCommitmentLayout() {
    Commitment commitment;
    commitment.topicRef = identityFromLabel("topic");
    commitment.participant = identityFromLabel("alice");
    commitment.commitmentHash = sha256Digest(std::string("hash"));
    commitment.stakeAmount = 100'000'000;
    commitment.submitOrder = 5;
    commitment.predictionValue = 150'000'000;
    commitment.revealed = true;

    auto data = encodeCommitment(commitment);
    expect(data.size() == 126, "commitment encoded size");
    expect(hasCommitmentDiscriminator(data), "commitment discriminator");

    Commitment decoded = decodeCommitment(data);
    expect(decoded.participant == commitment.participant && decoded.submitOrder == 5 && decoded.revealed &&
               !decoded.settled && decoded.predictionValue == commitment.predictionValue,
           "commitment fields survive encoding");
}

void testEscrowLayout() {
    EscrowRecord escrow;
    escrow.topic = identityFromLabel("topic");
    escrow.reserve = 890'880;
    escrow.deposited = 300'000'000;
    escrow.paidOut = 299'109'120;
    auto data = encodeEscrow(escrow);
    expect(data.size() == 64, "escrow encoded size");
    EscrowRecord decoded = decodeEscrow(data);
    expect(decoded.reserve == escrow.reserve && decoded.paidOut == escrow.paidOut, "escrow fields");
}

void testCorruptData() {
    auto topicData = encodeTopic(sampleTopic());
    auto commitmentData = encodeCommitment(Commitment{});

    expectCorrupt([] { decodeTopic({}); }, "empty account");
    expectCorrupt([&] { decodeCommitment(topicData); }, "topic read as commitment");

    auto truncated = topicData;
    truncated.pop_back();
    expectCorrupt([&] { decodeTopic(truncated); }, "truncated topic");

    auto trailing = commitmentData;
    trailing.push_back(0);
    expectCorrupt([&] { decodeCommitment(trailing); }, "trailing byte");

    auto badBool = commitmentData;
    badBool[badBool.size() - 2] = 2;
    expectCorrupt([&] { decodeCommitment(badBool); }, "bool outside 0/1");

    Topic topic = sampleTopic();
    topic.description.clear();
    topic.symbol.clear();
    auto badStatus = encodeTopic(topic);
    // status byte follows the three 8-byte fields after the empty strings
    badStatus[8 + 8 + 64 + 4 + 4 + 24] = 9;
    expectCorrupt([&] { decodeTopic(badStatus); }, "status out of range");

    topic.symbol = std::string(kMaxSymbolLen + 1, 'X');
    auto longSymbol = encodeTopic(topic);
    expectCorrupt([&] { decodeTopic(longSymbol); }, "symbol longer than the limit");
}

} // namespace

int main() {
    testTopicLayout();
    testCommitmentLayout();
    testEscrowLayout();
    testCorruptData();

    std::cout << "records_test passed" << std::endl;
    return 0;
}
