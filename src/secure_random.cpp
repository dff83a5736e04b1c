#include "secure_random.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace lf {

namespace {

void requireSodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
}

} // namespace

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }

    requireSodium();
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

std::string secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    sodium_memzero(bytes.data(), bytes.size());
    return oss.str();
}

SecureRandomSource::SecureRandomSource() {
    requireSodium();
}

double SecureRandomSource::uniform01() {
    std::uint64_t val = 0;
    randombytes_buf(&val, sizeof(val));
    val &= (1ULL << 53) - 1;
    return static_cast<double>(val) / static_cast<double>(1ULL << 53);
}

} // namespace lf
