#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace lf {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform01() = 0;
};

// Mulberry32. Every battle draw comes from one of these so that a seed fully
// determines the timeline.
class SeededRng : public RandomSource {
public:
    explicit SeededRng(std::uint32_t seed) : state_(seed) {}

    double next();
    double nextRange(double min, double max) { return min + next() * (max - min); }
    double uniform01() override { return next(); }

    std::uint32_t state() const { return state_; }

private:
    std::uint32_t state_;
};

class InsecureTestRng : public RandomSource {
public:
    explicit InsecureTestRng(std::uint64_t seed);
    double uniform01() override;

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_;
};

struct VrfKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

// VRF-backed stream for the winner draw. The alpha binds the match id, the
// snapshot digest, the client seed and the nonce, so a published proof lets
// anyone recompute the draw.
class ProvablyFairRng : public RandomSource {
public:
    ProvablyFairRng(std::string serverSecretKeyHex,
                    std::string serverPublicKeyHex,
                    std::string matchId,
                    std::string snapshotDigest,
                    std::string clientSeed,
                    std::uint64_t nonce);
    ProvablyFairRng(std::string vrfOutputHex,
                    std::string vrfProofHex,
                    std::string serverPublicKeyHex,
                    std::string matchId,
                    std::string snapshotDigest,
                    std::string clientSeed,
                    std::uint64_t nonce);
    ~ProvablyFairRng();

    ProvablyFairRng(const ProvablyFairRng&) = delete;
    ProvablyFairRng& operator=(const ProvablyFairRng&) = delete;

    double uniform01() override;

    static std::string buildAlpha(const std::string& matchId,
                                  const std::string& snapshotDigest,
                                  const std::string& clientSeed,
                                  std::uint64_t nonce);
    static bool verify(const std::string& vrfProofHex,
                       const std::string& vrfOutputHex,
                       const std::string& publicKeyHex,
                       const std::string& alpha);

    const std::string& getMatchId() const { return matchId_; }
    const std::string& getSnapshotDigest() const { return snapshotDigest_; }
    const std::string& getClientSeed() const { return clientSeed_; }
    const std::string& getAlpha() const { return alpha_; }
    const std::string& getVrfProof() const { return vrfProofHex_; }
    const std::string& getVrfOutput() const { return vrfOutputHex_; }
    const std::string& getPublicKey() const { return publicKeyHex_; }
    std::uint64_t getNonce() const { return nonce_; }
    std::uint64_t getCallCount() const { return callCount_; }

private:
    std::vector<unsigned char> deriveStreamKey() const;
    std::vector<unsigned char> streamBlock(std::uint64_t counter) const;

    std::string matchId_;
    std::string snapshotDigest_;
    std::string clientSeed_;
    std::string alpha_;
    std::string publicKeyHex_;
    std::vector<unsigned char> vrfProof_;
    std::vector<unsigned char> vrfOutput_;
    std::vector<unsigned char> streamKey_;
    std::string vrfProofHex_;
    std::string vrfOutputHex_;
    std::uint64_t nonce_;
    std::uint64_t callCount_;
};

VrfKeyPair generateVrfKeypair();
VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex);

} // namespace lf
