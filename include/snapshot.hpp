#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lf {

constexpr std::array<std::uint32_t, 8> kTowerPalette{
    0xFF6B6B, // red
    0x4ECDC4, // teal
    0x45B7D1, // blue
    0x96CEB4, // green
    0xFFEAA7, // yellow
    0xDDA0DD, // plum
    0xFF8C42, // orange
    0x98D8C8, // mint
};

inline std::uint32_t paletteColor(std::size_t index) {
    return kTowerPalette[index % kTowerPalette.size()];
}

struct SnapshotEntry {
    std::uint32_t id;
    double x;
    double y;
    std::uint32_t color;
};

// Starting conditions of one battle attempt. Every seed probe and the live replay
// are built from the same instance.
class MatchSnapshot {
public:
    MatchSnapshot(double arenaWidth, double arenaHeight, std::vector<SnapshotEntry> entries);

    double arenaWidth() const { return arenaWidth_; }
    double arenaHeight() const { return arenaHeight_; }
    const std::vector<SnapshotEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    bool contains(std::uint32_t id) const;

    // SHA-256 over the canonical text form; binds VRF draws to these positions.
    std::string digest() const;
    std::string canonical() const;

private:
    double arenaWidth_;
    double arenaHeight_;
    std::vector<SnapshotEntry> entries_;
};

// Towers 0..players-1 spaced evenly on a ring around the arena center. Used by
// the CLI and tools so an audit can rebuild the exact snapshot from a count.
MatchSnapshot ringSnapshot(std::size_t players, double arenaWidth = 800.0, double arenaHeight = 600.0);

} // namespace lf
