#include "core/KeyNormalizer.h"
#include "core/Logger.h"

#include <cctype>

namespace harmonicflow {

namespace {

struct PitchSpelling {
    const char* name;
    int majorNumber;   // B ring
    int minorNumber;   // A ring
};

// C major=8B, Db=3B, D=10B, Eb=5B, E=12B, F=7B, F#=2B, G=9B, Ab=4B, A=11B, Bb=6B, B=1B
// C minor=5A, C#=12A, D=7A, Eb=2A, E=9A, F=4A, F#=11A, G=6A, Ab=1A, A=8A, Bb=3A, B=10A
const PitchSpelling kSpellings[] = {
    {"C",  8,  5},
    {"C#", 3,  12},
    {"Db", 3,  12},
    {"D",  10, 7},
    {"D#", 5,  2},
    {"Eb", 5,  2},
    {"E",  12, 9},
    {"F",  7,  4},
    {"F#", 2,  11},
    {"Gb", 2,  11},
    {"G",  9,  6},
    {"G#", 4,  1},
    {"Ab", 4,  1},
    {"A",  11, 8},
    {"A#", 6,  3},
    {"Bb", 6,  3},
    {"B",  1,  10},
};

std::vector<std::pair<std::string, std::string>> buildTable()
{
    std::vector<std::pair<std::string, std::string>> table;

    for (const auto& s : kSpellings)
    {
        std::string name = s.name;
        std::string major = std::to_string(s.majorNumber) + "B";
        std::string minor = std::to_string(s.minorNumber) + "A";

        table.emplace_back(name, major);
        table.emplace_back(name + "m", minor);
        table.emplace_back(name + "maj", major);
        table.emplace_back(name + "min", minor);
        table.emplace_back(name + " maj", major);
        table.emplace_back(name + " min", minor);
        table.emplace_back(name + " major", major);
        table.emplace_back(name + " minor", minor);
    }

    // Open Key: 1d = C major (8B), 1m = A minor (8A), advancing by fifths.
    for (int openKey = 1; openKey <= 12; ++openKey)
    {
        int camelot = (openKey + 6) % 12 + 1;
        table.emplace_back(std::to_string(openKey) + "d", std::to_string(camelot) + "B");
        table.emplace_back(std::to_string(openKey) + "m", std::to_string(camelot) + "A");
    }

    return table;
}

std::string trim(const std::string& s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

bool equalsIgnoreCase(const std::string& a, const std::string& b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

} // namespace

const std::vector<std::pair<std::string, std::string>>& KeyNormalizer::lookupTable()
{
    static const auto table = buildTable();
    return table;
}

std::optional<CamelotKey> KeyNormalizer::normalize(const std::string& rawKey)
{
    std::string key = trim(rawKey);
    if (key.empty())
        return std::nullopt;

    // 1. Canonical code
    if (auto code = CamelotKey::fromCode(key))
        return code;

    // 2. Exact table spelling
    const auto& table = lookupTable();
    for (const auto& entry : table)
    {
        if (entry.first == key)
            return CamelotKey::fromCode(entry.second);
    }

    // 3. Zero-padded code
    if (key[0] == '0')
    {
        size_t firstNonZero = key.find_first_not_of('0');
        if (firstNonZero != std::string::npos)
        {
            if (auto code = CamelotKey::fromCode(key.substr(firstNonZero)))
                return code;
        }
    }

    // 4. Case-insensitive
    for (const auto& entry : table)
    {
        if (equalsIgnoreCase(entry.first, key))
            return CamelotKey::fromCode(entry.second);
    }
    for (int number = 1; number <= 12; ++number)
    {
        for (Ring ring : {Ring::minor, Ring::major})
        {
            CamelotKey candidate{number, ring};
            if (equalsIgnoreCase(candidate.toString(), key))
                return candidate;
        }
    }

    HF_TRACE("KeyNormalizer::normalize: no wheel position for '%s'", key.c_str());
    return std::nullopt;
}

} // namespace harmonicflow
