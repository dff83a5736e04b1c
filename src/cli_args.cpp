#include "cli_args.hpp"

#include <cerrno>
#include <cstdlib>

namespace lf {

std::optional<std::uint64_t> parseUnsigned(const std::string& text, std::uint64_t max) {
    // strtoull would wrap "-1" and skip leading blanks.
    if (text.empty() || text[0] < '0' || text[0] > '9') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    if (parsed > max) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(parsed);
}

} // namespace lf
