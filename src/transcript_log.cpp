#include "transcript_log.hpp"

#include "picosha2.h"

#include <utility>
#include <vector>

namespace lf {

std::string TranscriptLog::hash(const std::string& data) {
    std::vector<unsigned char> digest(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), digest.begin(), digest.end());
    return picosha2::bytes_to_hex_string(digest.begin(), digest.end());
}

std::string TranscriptLog::hashPair(const std::string& left, const std::string& right) {
    return hash(left + right);
}

void TranscriptLog::append(const std::string& event) {
    leaves_.push_back(hash(event));
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
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

std::vector<std::string> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
        if (sibling >= layer.size()) {
            sibling = index;
        }
        proof.push_back(layer[sibling]);

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

bool TranscriptLog::verifyProof(const std::string& leafHash,
                                std::size_t leafIndex,
                                std::size_t leafCount,
                                const std::vector<std::string>& proof,
                                const std::string& root) {
    if (leafIndex >= leafCount) {
        return false;
    }

    std::string current = leafHash;
    std::size_t index = leafIndex;
    std::size_t width = leafCount;
    std::size_t step = 0;
    while (width > 1) {
        if (step >= proof.size()) {
            return false;
        }
        if (index % 2 == 0) {
            current = hashPair(current, proof[step]);
        } else {
            current = hashPair(proof[step], current);
        }
        ++step;
        index /= 2;
        width = (width + 1) / 2;
    }
    return step == proof.size() && current == root;
}

} // namespace lf
