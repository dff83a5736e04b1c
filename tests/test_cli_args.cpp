#include "cli_args.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "cli_args_test failure: " << msg << std::endl;
    std::exit(1);
}

constexpr std::uint64_t kU32Max = std::numeric_limits<std::uint32_t>::max();
constexpr std::uint64_t kU64Max = std::numeric_limits<std::uint64_t>::max();

void checkAccepted() {
    if (lf::parseUnsigned("0", kU32Max) != 0u || lf::parseUnsigned("2000", kU32Max) != 2000u) {
        fail("plain decimal values rejected");
    }
    if (lf::parseUnsigned("4294967295", kU32Max) != kU32Max) {
        fail("uint32 maximum rejected");
    }
    if (lf::parseUnsigned("18446744073709551615", kU64Max) != kU64Max) {
        fail("uint64 maximum rejected");
    }
}

void checkRejected() {
    const char* bad[] = { "", "-1", "-0", "+5", " 7", "7 ", "12abc", "0x10", "abc" };
    for (const char* text : bad) {
        if (lf::parseUnsigned(text, kU64Max)) {
            fail(std::string("accepted malformed value '") + text + "'");
        }
    }
    if (lf::parseUnsigned("4294967296", kU32Max)) {
        fail("value above uint32 maximum was not rejected");
    }
    if (lf::parseUnsigned("18446744073709551616", kU64Max)) {
        fail("value above uint64 maximum was not rejected");
    }
    if (lf::parseUnsigned("65", 64)) {
        fail("explicit maximum ignored");
    }
}

} // namespace

int main() {
    checkAccepted();
    checkRejected();
    std::cout << "CLI argument checks passed.\n";
    return 0;
}
