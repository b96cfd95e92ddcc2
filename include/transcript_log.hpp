#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace wh {

struct MerkleProofStep {
    std::string siblingHash;
    bool siblingIsLeft = false;
};

// Append-only record of program events. Leaves are SHA-256 hex digests of the
// event text; odd layers duplicate their last node.
class TranscriptLog {
public:
    void append(const std::string& event);

    const std::vector<std::string>& events() const { return events_; }
    std::string getLeaf(std::size_t index) const;
    std::size_t size() const { return leaves_.size(); }

    std::string merkleRoot() const;
    std::vector<MerkleProofStep> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& event,
                            const std::vector<MerkleProofStep>& proof,
                            const std::string& root);

private:
    static std::string hash(const std::string& data);
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> events_;
    std::vector<std::string> leaves_;
};

} // namespace wh
