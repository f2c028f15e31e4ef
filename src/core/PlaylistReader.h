#pragma once

#include "core/Types.h"

#include <juce_core/juce_core.h>

#include <optional>
#include <string>

namespace harmonicflow {

/// Reads playlist exports into a Playlist.
/// Supports Rekordbox TXT (tab-separated, UTF-16LE or UTF-8), CSV and
/// Rekordbox collection XML.
class PlaylistReader {
public:
    enum class Format { tabSeparated, commaSeparated, rekordboxXml };

    /// Chooses by extension: .xml, .csv, anything else is tab-separated.
    static Format formatForPath(const std::string& path);

    /// playlistName selects one playlist from a Rekordbox XML; empty reads the
    /// whole collection. Ignored for other formats.
    static bool readFile(const std::string& path, Playlist& out, std::string& error,
                         const std::string& playlistName = {});

    static bool readDelimited(const juce::String& text, juce::juce_wchar delimiter,
                              Playlist& out, std::string& error);

    static bool readRekordboxXml(const juce::String& xmlText, const std::string& playlistName,
                                 Playlist& out, std::string& error);

    /// Decodes file bytes: UTF-16 with BOM, UTF-16LE without BOM, else UTF-8.
    static juce::String decodeText(const juce::MemoryBlock& data);

    /// Numeric BPM or nullopt for empty, non-numeric or non-positive text.
    /// Accepts a comma as decimal separator.
    static std::optional<double> parseBpm(const juce::String& text);
};

} // namespace harmonicflow
