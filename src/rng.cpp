#include "rng.hpp"

#include "picosha2.h"

#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <sodium.h>

namespace lf {

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support (version >= 1.0.18)"
#endif

namespace {

void requireSodium() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

void wipe(std::vector<unsigned char>& bytes) {
    if (!bytes.empty()) {
        sodium_memzero(bytes.data(), bytes.size());
    }
}

void wipe(std::string& text) {
    if (!text.empty()) {
        sodium_memzero(&text[0], text.size());
    }
}

std::string toHex(const std::vector<unsigned char>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }

    std::vector<unsigned char> out(hex.size() / 2);
    std::size_t written = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.c_str(), hex.size(), nullptr, &written, nullptr) != 0 ||
        written != out.size()) {
        throw std::invalid_argument("hex string contains non-hex characters");
    }
    return out;
}

// Output of a proof that checks out against `publicKey` and `alpha`, or
// nothing. Lengths must already be validated by the caller.
std::optional<std::vector<unsigned char>> verifiedOutput(const std::vector<unsigned char>& proof,
                                                         const std::vector<unsigned char>& publicKey,
                                                         const std::string& alpha) {
    std::vector<unsigned char> output(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_verify(output.data(),
                          publicKey.data(),
                          proof.data(),
                          reinterpret_cast<const unsigned char*>(alpha.data()),
                          alpha.size()) != 0) {
        return std::nullopt;
    }
    return output;
}

bool artifactLengthsValid(const std::vector<unsigned char>& proof,
                          const std::vector<unsigned char>& output,
                          const std::vector<unsigned char>& publicKey) {
    return proof.size() == crypto_vrf_PROOFBYTES && output.size() == crypto_vrf_OUTPUTBYTES &&
           publicKey.size() == crypto_vrf_PUBLICKEYBYTES;
}

// Hex-encodes both halves and wipes the secret bytes.
VrfKeyPair encodeKeypair(const std::vector<unsigned char>& publicKey, std::vector<unsigned char>& secretKey) {
    VrfKeyPair pair{ toHex(publicKey), toHex(secretKey) };
    wipe(secretKey);
    return pair;
}

constexpr std::string_view kVrfDomainTag = "last-finger:vrf:v1";
constexpr std::string_view kStreamDomainTag = "last-finger:draw-stream:v1";

} // namespace

double SeededRng::next() {
    state_ += 0x6D2B79F5u;
    std::uint32_t t = state_;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    t ^= t >> 14;
    return static_cast<double>(t) / 4294967296.0;
}

InsecureTestRng::InsecureTestRng(std::uint64_t seed)
    : engine_(seed)
    , dist_(0.0, 1.0) {}

double InsecureTestRng::uniform01() {
    return dist_(engine_);
}

std::string ProvablyFairRng::buildAlpha(const std::string& matchId,
                                        const std::string& snapshotDigest,
                                        const std::string& clientSeed,
                                        std::uint64_t nonce) {
    if (matchId.empty()) {
        throw std::invalid_argument("matchId must not be empty for VRF domain separation");
    }
    std::ostringstream oss;
    oss << kVrfDomainTag << "|" << matchId << "|" << snapshotDigest << "|" << clientSeed << ":" << nonce;
    return oss.str();
}

ProvablyFairRng::ProvablyFairRng(std::string serverSecretKeyHex,
                                 std::string serverPublicKeyHex,
                                 std::string matchId,
                                 std::string snapshotDigest,
                                 std::string clientSeed,
                                 std::uint64_t nonce)
    : matchId_(std::move(matchId))
    , snapshotDigest_(std::move(snapshotDigest))
    , clientSeed_(std::move(clientSeed))
    , alpha_(buildAlpha(matchId_, snapshotDigest_, clientSeed_, nonce))
    , publicKeyHex_(std::move(serverPublicKeyHex))
    , nonce_(nonce)
    , callCount_(0) {
    requireSodium();

    auto secretKey = hexToBytes(serverSecretKeyHex);
    wipe(serverSecretKeyHex);
    auto publicKey = hexToBytes(publicKeyHex_);
    if (secretKey.size() != crypto_vrf_SECRETKEYBYTES || publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
        wipe(secretKey);
        throw std::invalid_argument("server VRF key length invalid");
    }

    vrfProof_.resize(crypto_vrf_PROOFBYTES);
    int proved = crypto_vrf_prove(vrfProof_.data(),
                                  secretKey.data(),
                                  reinterpret_cast<const unsigned char*>(alpha_.data()),
                                  alpha_.size());
    wipe(secretKey);
    if (proved != 0) {
        throw std::runtime_error("VRF prove failed");
    }

    // Catches a secret key that does not match the published public key.
    auto output = verifiedOutput(vrfProof_, publicKey, alpha_);
    if (!output) {
        throw std::runtime_error("VRF proof does not verify with provided public key");
    }
    vrfOutput_ = std::move(*output);
    vrfProofHex_ = toHex(vrfProof_);
    vrfOutputHex_ = toHex(vrfOutput_);
    streamKey_ = deriveStreamKey();
}

ProvablyFairRng::ProvablyFairRng(std::string vrfOutputHex,
                                 std::string vrfProofHex,
                                 std::string serverPublicKeyHex,
                                 std::string matchId,
                                 std::string snapshotDigest,
                                 std::string clientSeed,
                                 std::uint64_t nonce)
    : matchId_(std::move(matchId))
    , snapshotDigest_(std::move(snapshotDigest))
    , clientSeed_(std::move(clientSeed))
    , alpha_(buildAlpha(matchId_, snapshotDigest_, clientSeed_, nonce))
    , publicKeyHex_(std::move(serverPublicKeyHex))
    , vrfProofHex_(std::move(vrfProofHex))
    , vrfOutputHex_(std::move(vrfOutputHex))
    , nonce_(nonce)
    , callCount_(0) {
    requireSodium();

    vrfProof_ = hexToBytes(vrfProofHex_);
    vrfOutput_ = hexToBytes(vrfOutputHex_);
    auto publicKey = hexToBytes(publicKeyHex_);
    if (!artifactLengthsValid(vrfProof_, vrfOutput_, publicKey)) {
        throw std::invalid_argument("Invalid VRF artifact length");
    }

    auto output = verifiedOutput(vrfProof_, publicKey, alpha_);
    if (!output) {
        throw std::runtime_error("VRF proof rejected for provided public key");
    }
    if (*output != vrfOutput_) {
        throw std::runtime_error("VRF output mismatch");
    }
    streamKey_ = deriveStreamKey();
}

ProvablyFairRng::~ProvablyFairRng() {
    wipe(vrfProof_);
    wipe(vrfOutput_);
    wipe(streamKey_);
    wipe(clientSeed_);
    wipe(alpha_);
}

bool ProvablyFairRng::verify(const std::string& vrfProofHex,
                             const std::string& vrfOutputHex,
                             const std::string& publicKeyHex,
                             const std::string& alpha) {
    if (sodium_init() < 0) {
        return false;
    }

    std::vector<unsigned char> proof;
    std::vector<unsigned char> output;
    std::vector<unsigned char> publicKey;
    try {
        proof = hexToBytes(vrfProofHex);
        output = hexToBytes(vrfOutputHex);
        publicKey = hexToBytes(publicKeyHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (!artifactLengthsValid(proof, output, publicKey)) {
        return false;
    }
    auto recomputed = verifiedOutput(proof, publicKey, alpha);
    return recomputed && *recomputed == output;
}

// Stream key = SHA-256(tag | snapshot digest | VRF output). Every draw of this
// match is tied to the roster it was made for.
std::vector<unsigned char> ProvablyFairRng::deriveStreamKey() const {
    std::string material(kStreamDomainTag);
    material += '|';
    material += snapshotDigest_;
    material += '|';
    material.append(vrfOutput_.begin(), vrfOutput_.end());

    std::vector<unsigned char> key(picosha2::k_digest_size);
    picosha2::hash256(material.begin(), material.end(), key.begin(), key.end());
    wipe(material);
    return key;
}

// Block i = SHA-256(stream key || i as 8 big-endian bytes).
std::vector<unsigned char> ProvablyFairRng::streamBlock(std::uint64_t counter) const {
    std::vector<unsigned char> input(streamKey_);
    for (int shift = 56; shift >= 0; shift -= 8) {
        input.push_back(static_cast<unsigned char>(counter >> shift));
    }

    std::vector<unsigned char> block(picosha2::k_digest_size);
    picosha2::hash256(input.begin(), input.end(), block.begin(), block.end());
    return block;
}

double ProvablyFairRng::uniform01() {
    const auto block = streamBlock(callCount_++);

    // Top 53 bits of the first word fill a double's mantissa exactly.
    std::uint64_t word = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        word = (word << 8) | block[i];
    }
    return static_cast<double>(word >> 11) * 0x1.0p-53;
}

VrfKeyPair generateVrfKeypair() {
    requireSodium();

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    crypto_vrf_keypair(publicKey.data(), secretKey.data());
    return encodeKeypair(publicKey, secretKey);
}

VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex) {
    requireSodium();

    auto seed = hexToBytes(seedHex);
    if (seed.size() != crypto_vrf_SEEDBYTES) {
        wipe(seed);
        throw std::invalid_argument("Seed must decode to crypto_vrf_SEEDBYTES bytes");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    int derived = crypto_vrf_keypair_from_seed(publicKey.data(), secretKey.data(), seed.data());
    wipe(seed);
    if (derived != 0) {
        wipe(secretKey);
        throw std::runtime_error("Failed to derive VRF keypair from seed");
    }
    return encodeKeypair(publicKey, secretKey);
}

} // namespace lf
