#pragma once

#include "rng.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lf {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
std::string secureRandomHex(std::size_t numBytes);

// OS-backed draw source for live matches. Never used inside a battle.
class SecureRandomSource : public RandomSource {
public:
    SecureRandomSource();
    double uniform01() override;
};

} // namespace lf
