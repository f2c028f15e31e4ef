#include "core/PlaylistReader.h"
#include "core/Logger.h"

#include <initializer_list>
#include <unordered_map>

namespace harmonicflow {

// ═══════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════

static int findColumn(const juce::StringArray& header, std::initializer_list<const char*> aliases)
{
    for (const char* alias : aliases)
    {
        for (int i = 0; i < header.size(); ++i)
        {
            if (header[i].equalsIgnoreCase(alias))
                return i;
        }
    }
    return -1;
}

static juce::String field(const juce::StringArray& row, int column)
{
    if (column < 0 || column >= row.size())
        return {};
    return row[column];
}

static juce::StringArray splitRow(const juce::String& line, juce::juce_wchar delimiter)
{
    juce::String breaks = juce::String::charToString(delimiter);
    juce::StringArray tokens;
    if (delimiter == ',')
    {
        tokens.addTokens(line, breaks, "\"");
        for (auto& token : tokens)
        {
            token = token.trim();
            if (token.startsWithChar('"'))
                token = token.unquoted().replace("\"\"", "\"");
        }
    }
    else
    {
        tokens.addTokens(line, breaks, "");
        tokens.trim();
    }
    return tokens;
}

// ═══════════════════════════════════════════════════════════════════
// Format detection / decoding
// ═══════════════════════════════════════════════════════════════════

PlaylistReader::Format PlaylistReader::formatForPath(const std::string& path)
{
    juce::String ext = juce::File::createFileWithoutCheckingPath(juce::String(path)).getFileExtension();
    if (ext.equalsIgnoreCase(".xml"))
        return Format::rekordboxXml;
    if (ext.equalsIgnoreCase(".csv"))
        return Format::commaSeparated;
    return Format::tabSeparated;
}

juce::String PlaylistReader::decodeText(const juce::MemoryBlock& data)
{
    auto size = data.getSize();
    auto* bytes = static_cast<const juce::uint8*>(data.getData());

    bool hasBom = size >= 2 && ((bytes[0] == 0xff && bytes[1] == 0xfe)
                             || (bytes[0] == 0xfe && bytes[1] == 0xff));

    // Rekordbox writes UTF-16LE; some tools drop the BOM. ASCII text then has
    // a zero in every odd byte.
    if (!hasBom && size >= 4 && bytes[0] != 0 && bytes[1] == 0 && bytes[3] == 0)
    {
        juce::MemoryBlock withBom;
        const juce::uint8 bom[] = { 0xff, 0xfe };
        withBom.append(bom, sizeof(bom));
        withBom.append(data.getData(), size);
        return juce::String::createStringFromData(withBom.getData(),
                                                  static_cast<int>(withBom.getSize()));
    }

    return juce::String::createStringFromData(data.getData(), static_cast<int>(size));
}

std::optional<double> PlaylistReader::parseBpm(const juce::String& text)
{
    auto t = text.trim().replaceCharacter(',', '.');
    if (t.isEmpty() || !t.containsOnly("0123456789."))
        return std::nullopt;
    if (t.indexOfChar('.') != t.lastIndexOfChar('.') || t == ".")
        return std::nullopt;

    double value = t.getDoubleValue();
    if (value <= 0.0)
        return std::nullopt;
    return value;
}

// ═══════════════════════════════════════════════════════════════════
// File entry point
// ═══════════════════════════════════════════════════════════════════

bool PlaylistReader::readFile(const std::string& path, Playlist& out, std::string& error,
                              const std::string& playlistName)
{
    HF_DEBUG("PlaylistReader::readFile: path=%s", path.c_str());

    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
    if (!file.existsAsFile())
    {
        error = "File not found: " + path;
        HF_WARN("PlaylistReader::readFile: %s", error.c_str());
        return false;
    }

    juce::MemoryBlock data;
    if (!file.loadFileAsData(data))
    {
        error = "Cannot read file: " + path;
        HF_WARN("PlaylistReader::readFile: %s", error.c_str());
        return false;
    }

    auto text = decodeText(data);
    if (text.trim().isEmpty())
    {
        error = "Empty file: " + path;
        HF_WARN("PlaylistReader::readFile: %s", error.c_str());
        return false;
    }

    switch (formatForPath(path))
    {
        case Format::rekordboxXml:   return readRekordboxXml(text, playlistName, out, error);
        case Format::commaSeparated: return readDelimited(text, ',', out, error);
        case Format::tabSeparated:   return readDelimited(text, '\t', out, error);
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════
// Delimited text (TXT / CSV)
// ═══════════════════════════════════════════════════════════════════

bool PlaylistReader::readDelimited(const juce::String& text, juce::juce_wchar delimiter,
                                   Playlist& out, std::string& error)
{
    auto lines = juce::StringArray::fromLines(text);
    lines.removeEmptyStrings(true);
    if (lines.isEmpty())
    {
        error = "No header row";
        HF_WARN("PlaylistReader::readDelimited: %s", error.c_str());
        return false;
    }

    auto header = splitRow(lines[0], delimiter);

    int keyCol = findColumn(header, {"Key", "Tonality"});
    if (keyCol < 0)
    {
        error = "Column 'Key' not found";
        HF_WARN("PlaylistReader::readDelimited: %s", error.c_str());
        return false;
    }
    int titleCol = findColumn(header, {"Track Title", "Title", "Name"});
    int artistCol = findColumn(header, {"Artist"});
    int bpmCol = findColumn(header, {"BPM", "AverageBpm"});

    Playlist playlist;
    playlist.hasArtist = artistCol >= 0;
    playlist.hasBpm = bpmCol >= 0;
    playlist.titleColumn = titleCol >= 0 ? header[titleCol].toStdString() : std::string();
    playlist.keyColumn = header[keyCol].toStdString();

    for (int i = 1; i < lines.size(); ++i)
    {
        auto row = splitRow(lines[i], delimiter);
        if (row.joinIntoString("").trim().isEmpty())
            continue;

        Track track;
        track.artist = field(row, artistCol).toStdString();
        track.title = field(row, titleCol).toStdString();
        track.bpm = parseBpm(field(row, bpmCol));
        track.rawKey = field(row, keyCol).toStdString();
        playlist.tracks.push_back(std::move(track));
    }

    HF_INFO("PlaylistReader::readDelimited: %d tracks", static_cast<int>(playlist.tracks.size()));
    out = std::move(playlist);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Rekordbox XML
// ═══════════════════════════════════════════════════════════════════

static Track trackFromXml(const juce::XmlElement& e)
{
    Track track;
    track.artist = e.getStringAttribute("Artist").toStdString();
    track.title = e.getStringAttribute("Name").toStdString();
    track.bpm = PlaylistReader::parseBpm(e.getStringAttribute("AverageBpm"));
    track.rawKey = e.getStringAttribute("Tonality").toStdString();
    return track;
}

// Depth-first search through folder nodes for a playlist node (Type="1").
static const juce::XmlElement* findPlaylistNode(const juce::XmlElement& parent,
                                                const juce::String& name)
{
    for (auto* node : parent.getChildWithTagNameIterator("NODE"))
    {
        if (node->getIntAttribute("Type") == 1 && node->getStringAttribute("Name") == name)
            return node;
        if (auto* found = findPlaylistNode(*node, name))
            return found;
    }
    return nullptr;
}

bool PlaylistReader::readRekordboxXml(const juce::String& xmlText, const std::string& playlistName,
                                      Playlist& out, std::string& error)
{
    auto xml = juce::parseXML(xmlText);
    if (!xml)
    {
        error = "Failed to parse XML";
        HF_WARN("PlaylistReader::readRekordboxXml: %s", error.c_str());
        return false;
    }

    auto* collection = xml->getChildByName("COLLECTION");
    if (!xml->hasTagName("DJ_PLAYLISTS") || !collection)
    {
        error = "Not a Rekordbox collection export";
        HF_WARN("PlaylistReader::readRekordboxXml: %s", error.c_str());
        return false;
    }

    Playlist playlist;

    if (playlistName.empty())
    {
        for (auto* e : collection->getChildWithTagNameIterator("TRACK"))
            playlist.tracks.push_back(trackFromXml(*e));
    }
    else
    {
        auto* playlists = xml->getChildByName("PLAYLISTS");
        const juce::XmlElement* node = playlists
            ? findPlaylistNode(*playlists, juce::String(playlistName)) : nullptr;
        if (!node)
        {
            error = "Playlist not found: " + playlistName;
            HF_WARN("PlaylistReader::readRekordboxXml: %s", error.c_str());
            return false;
        }

        // KeyType 0 references TrackID, KeyType 1 references Location.
        bool byLocation = node->getIntAttribute("KeyType") == 1;
        const char* refAttr = byLocation ? "Location" : "TrackID";

        std::unordered_map<std::string, const juce::XmlElement*> index;
        for (auto* e : collection->getChildWithTagNameIterator("TRACK"))
            index[e->getStringAttribute(refAttr).toStdString()] = e;

        for (auto* ref : node->getChildWithTagNameIterator("TRACK"))
        {
            auto key = ref->getStringAttribute("Key").toStdString();
            auto it = index.find(key);
            if (it == index.end())
            {
                HF_WARN("PlaylistReader::readRekordboxXml: playlist entry '%s' not in collection",
                        key.c_str());
                continue;
            }
            playlist.tracks.push_back(trackFromXml(*it->second));
        }
    }

    HF_INFO("PlaylistReader::readRekordboxXml: %d tracks", static_cast<int>(playlist.tracks.size()));
    out = std::move(playlist);
    return true;
}

} // namespace harmonicflow
