#include "rng.hpp"
#include "secure_random.hpp"
#include "seed_search.hpp"
#include "snapshot.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "fairness_test failure: " << msg << std::endl;
    std::exit(1);
}

void checkUniform(lf::RandomSource& source, std::size_t players, std::size_t draws, double tolerance) {
    const lf::MatchSnapshot snapshot = lf::ringSnapshot(players);
    std::vector<std::size_t> counts(players, 0);
    for (std::size_t i = 0; i < draws; ++i) {
        ++counts[lf::drawWinnerIndex(snapshot, source)];
    }

    const double expected = 1.0 / static_cast<double>(players);
    for (std::size_t i = 0; i < players; ++i) {
        double share = static_cast<double>(counts[i]) / static_cast<double>(draws);
        if (std::abs(share - expected) > tolerance) {
            fail("tower " + std::to_string(i) + " of " + std::to_string(players) + " drawn with share " +
                 std::to_string(share));
        }
    }
}

} // namespace

int main() {
    lf::InsecureTestRng seeded(42);
    checkUniform(seeded, 2, 40000, 0.02);
    checkUniform(seeded, 4, 40000, 0.02);
    checkUniform(seeded, 7, 70000, 0.02);

    lf::SecureRandomSource secure;
    checkUniform(secure, 4, 4000, 0.05);

    std::cout << "Fairness checks passed.\n";
    return 0;
}
