#include "core/PlaylistWriter.h"
#include "core/Logger.h"

namespace harmonicflow {

static juce::String csvField(const juce::String& value)
{
    if (value.containsAnyOf(",\"\r\n"))
        return "\"" + value.replace("\"", "\"\"") + "\"";
    return value;
}

juce::String PlaylistWriter::formatBpm(double bpm)
{
    auto text = juce::String(bpm, 2);
    if (text.containsChar('.'))
        text = text.trimCharactersAtEnd("0").trimCharactersAtEnd(".");
    return text;
}

juce::String PlaylistWriter::toCsv(const Playlist& playlist, const std::vector<int>& order)
{
    const bool hasTitle = !playlist.titleColumn.empty();

    juce::StringArray header;
    if (playlist.hasArtist) header.add("Artist");
    if (hasTitle)           header.add(csvField(playlist.titleColumn));
    header.add("Key");
    if (playlist.hasBpm)    header.add("BPM");

    juce::String csv = header.joinIntoString(",") + "\n";

    for (int index : order)
    {
        const auto& track = playlist.tracks[static_cast<size_t>(index)];

        juce::StringArray row;
        if (playlist.hasArtist) row.add(csvField(track.artist));
        if (hasTitle)           row.add(csvField(track.title));
        row.add(csvField(track.rawKey));
        if (playlist.hasBpm)    row.add(track.bpm ? formatBpm(*track.bpm) : juce::String());

        csv << row.joinIntoString(",") << "\n";
    }

    return csv;
}

bool PlaylistWriter::writeCsvFile(const std::string& path, const Playlist& playlist,
                                  const std::vector<int>& order, std::string& error)
{
    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
    if (!file.getParentDirectory().isDirectory())
    {
        error = "Directory not found: " + file.getParentDirectory().getFullPathName().toStdString();
        HF_WARN("PlaylistWriter::writeCsvFile: %s", error.c_str());
        return false;
    }

    if (!file.replaceWithText(toCsv(playlist, order), false, false, "\n"))
    {
        error = "Cannot write file: " + path;
        HF_WARN("PlaylistWriter::writeCsvFile: %s", error.c_str());
        return false;
    }

    HF_INFO("PlaylistWriter::writeCsvFile: wrote %d tracks to %s",
            static_cast<int>(order.size()), path.c_str());
    return true;
}

} // namespace harmonicflow
