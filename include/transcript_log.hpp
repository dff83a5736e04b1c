#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace lf {

// Ordered list of hashed battle checkpoints. Two runs of the same seed over the
// same snapshot must produce the same root.
class TranscriptLog {
public:
    void append(const std::string& event);
    std::string getLeaf(std::size_t index) const;
    const std::vector<std::string>& getLeaves() const { return leaves_; }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            std::size_t leafCount,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    std::size_t size() const { return leaves_.size(); }
    bool empty() const { return leaves_.empty(); }
    void clear() { leaves_.clear(); }

    static std::string hash(const std::string& data);

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> leaves_;
};

} // namespace lf
