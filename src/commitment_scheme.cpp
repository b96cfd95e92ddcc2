#include "commitment_scheme.hpp"

#include "secure_memory.hpp"

#include <vector>

namespace wh {

CommitmentHash computeCommitment(std::int64_t prediction, const Salt& salt, const Identity& participant) {
    std::vector<std::uint8_t> preimage;
    preimage.reserve(8 + salt.size() + participant.size());
    appendI64(preimage, prediction);
    appendBytes(preimage, salt);
    appendBytes(preimage, participant);

    CommitmentHash digest = sha256Digest(preimage);
    secureZero(preimage.data(), preimage.size());
    return digest;
}

bool verifyCommitment(const CommitmentHash& expected,
                      std::int64_t prediction,
                      const Salt& salt,
                      const Identity& participant) {
    CommitmentHash computed = computeCommitment(prediction, salt, participant);
    return constantTimeEqual(computed.data(), expected.data(), computed.size());
}

} // namespace wh
