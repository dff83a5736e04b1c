#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lf {

// Decimal digits only, no sign or whitespace, at most `max`.
std::optional<std::uint64_t> parseUnsigned(const std::string& text, std::uint64_t max);

} // namespace lf
