#pragma once

#include <optional>
#include <string>
#include <vector>

namespace harmonicflow {

/// One playlist row as read by an ingestion adapter.
/// The core never modifies these; derived data lives beside them.
struct Track {
    std::string artist;
    std::string title;
    std::optional<double> bpm;
    std::string rawKey;
};

/// A loaded playlist plus the optional columns its source actually had,
/// so export can reproduce the same column set.
struct Playlist {
    std::vector<Track> tracks;
    bool hasArtist = true;
    bool hasBpm = true;
    std::string titleColumn = "Track Title";   // empty if the source had no title
    std::string keyColumn = "Key";
};

} // namespace harmonicflow
