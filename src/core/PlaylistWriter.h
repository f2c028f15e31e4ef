#pragma once

#include "core/Types.h"

#include <juce_core/juce_core.h>

#include <string>
#include <vector>

namespace harmonicflow {

/// Writes a reordered playlist as CSV with the columns the input carried:
/// Artist, title (under its input name), Key, BPM. Canonical wheel codes are
/// working data and are not exported.
class PlaylistWriter {
public:
    static juce::String toCsv(const Playlist& playlist, const std::vector<int>& order);

    static bool writeCsvFile(const std::string& path, const Playlist& playlist,
                             const std::vector<int>& order, std::string& error);

    /// "128" for whole numbers, otherwise up to two decimals ("127.5").
    static juce::String formatBpm(double bpm);
};

} // namespace harmonicflow
