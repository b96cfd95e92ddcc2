#include "transcript_log.hpp"

#include "picosha2.h"

#include <vector>

namespace wh {

void TranscriptLog::append(const std::string& event) {
    events_.push_back(event);
    leaves_.push_back(hash(event));
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string TranscriptLog::hash(const std::string& data) {
    std::vector<unsigned char> digest(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), digest.begin(), digest.end());
    return picosha2::bytes_to_hex_string(digest.begin(), digest.end());
}

std::string TranscriptLog::hashPair(const std::string& left, const std::string& right) {
    return hash(left + right);
}

std::string TranscriptLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }

    return layer.front();
}

std::vector<MerkleProofStep> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<MerkleProofStep> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;

    while (layer.size() > 1) {
        std::size_t siblingIndex = (index % 2 == 0) ? index + 1 : index - 1;
        if (siblingIndex >= layer.size()) {
            siblingIndex = index;
        }
        proof.push_back({ layer[siblingIndex], index % 2 == 1 });

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }

    return proof;
}

bool TranscriptLog::verifyProof(const std::string& event,
                                const std::vector<MerkleProofStep>& proof,
                                const std::string& root) {
    std::string node = hash(event);
    for (const auto& step : proof) {
        node = step.siblingIsLeft ? hashPair(step.siblingHash, node) : hashPair(node, step.siblingHash);
    }
    return !root.empty() && node == root;
}

} // namespace wh
