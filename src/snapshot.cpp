#include "snapshot.hpp"

#include "deterministic_math.hpp"

#include "picosha2.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace lf {

MatchSnapshot::MatchSnapshot(double arenaWidth, double arenaHeight, std::vector<SnapshotEntry> entries)
    : arenaWidth_(arenaWidth)
    , arenaHeight_(arenaHeight)
    , entries_(std::move(entries)) {
    if (!(arenaWidth_ > 0.0) || !(arenaHeight_ > 0.0)) {
        throw std::invalid_argument("arena dimensions must be positive");
    }

    std::unordered_set<std::uint32_t> seen;
    for (const auto& entry : entries_) {
        if (!seen.insert(entry.id).second) {
            throw std::invalid_argument("snapshot contains duplicate tower id " + std::to_string(entry.id));
        }
    }
}

bool MatchSnapshot::contains(std::uint32_t id) const {
    return std::any_of(entries_.begin(), entries_.end(), [id](const SnapshotEntry& e) { return e.id == id; });
}

std::string MatchSnapshot::canonical() const {
    std::ostringstream oss;
    oss << "arena=" << DeterministicMath::toMicros(arenaWidth_) << "x" << DeterministicMath::toMicros(arenaHeight_)
        << ";";
    for (const auto& entry : entries_) {
        oss << entry.id << "@" << DeterministicMath::toMicros(entry.x) << "," << DeterministicMath::toMicros(entry.y)
            << "#" << std::hex << entry.color << std::dec << ";";
    }
    return oss.str();
}

std::string MatchSnapshot::digest() const {
    std::string text = canonical();
    return picosha2::hash256_hex_string(text);
}

MatchSnapshot ringSnapshot(std::size_t players, double arenaWidth, double arenaHeight) {
    const double cx = arenaWidth / 2.0;
    const double cy = arenaHeight / 2.0;
    const double ring = std::min(arenaWidth, arenaHeight) * 0.35;

    std::vector<SnapshotEntry> entries;
    entries.reserve(players);
    for (std::size_t i = 0; i < players; ++i) {
        double theta = DeterministicMath::kTwoPi * static_cast<double>(i) / static_cast<double>(players);
        entries.push_back(SnapshotEntry{ static_cast<std::uint32_t>(i),
                                         cx + std::cos(theta) * ring,
                                         cy + std::sin(theta) * ring,
                                         paletteColor(i) });
    }
    return MatchSnapshot(arenaWidth, arenaHeight, std::move(entries));
}

} // namespace lf
