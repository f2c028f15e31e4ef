#include "core/Logger.h"
#include "core/Optimizer.h"
#include "core/PlaylistReader.h"
#include "core/PlaylistWriter.h"

#include <juce_core/juce_core.h>

#include <iomanip>
#include <iostream>

using namespace harmonicflow;

namespace {

void printUsage()
{
    std::cout << "Usage: harmonicflow <playlist.txt|.csv|.xml> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --policy=P, -p P      Energy flow: ramp_up (default), ramp_down, wave\n";
    std::cout << "  --output=F, -o F      Write the sorted playlist as CSV\n";
    std::cout << "  --playlist=NAME       Rekordbox XML: read this playlist instead of the collection\n";
    std::cout << "  --exact-limit=N       Largest key count solved exactly (3-20, default 20)\n";
    std::cout << "  --log-level=N         0=off 1=warn 2=info 3=debug 4=trace (default 1)\n";
    std::cout << "  --quiet, -q           Do not print the sorted table\n";
    std::cout << "  --help, -h            Show this help message\n";
}

std::string clip(const std::string& s, size_t width)
{
    if (s.size() <= width) return s;
    return s.substr(0, width - 1) + "~";
}

void printTable(const Playlist& playlist, const OptimizeResult& result)
{
    std::cout << std::left
              << std::setw(5) << "#"
              << std::setw(28) << "Artist"
              << std::setw(36) << "Title"
              << std::setw(8) << "Key"
              << std::setw(9) << "Camelot"
              << "BPM\n";

    int position = 1;
    for (int index : result.order)
    {
        const auto& track = playlist.tracks[static_cast<size_t>(index)];
        const auto& key = result.keys[static_cast<size_t>(index)];

        std::cout << std::setw(5) << position++
                  << std::setw(28) << clip(track.artist, 27)
                  << std::setw(36) << clip(track.title, 35)
                  << std::setw(8) << clip(track.rawKey, 7)
                  << std::setw(9) << (key ? key->toString() : std::string("-"))
                  << (track.bpm ? PlaylistWriter::formatBpm(*track.bpm).toStdString() : std::string("-"))
                  << "\n";
    }
}

void printSummary(const OptimizeResult& result, EnergyPolicy policy)
{
    const auto& r = result.report;
    std::cout << "\nTracks:       " << r.trackCount;
    if (r.keylessCount > 0)
        std::cout << " (" << r.keylessCount << " without key, appended)";
    std::cout << "\nStart BPM:    "
              << (r.startBpm ? PlaylistWriter::formatBpm(*r.startBpm).toStdString() : std::string("N/A"));
    std::cout << "\nPolicy:       " << energyPolicyToken(policy)
              << (result.exact ? "" : " (greedy key path)");

    std::cout << "\nKey path:     ";
    for (size_t i = 0; i < result.keyPath.size(); ++i)
        std::cout << (i ? " -> " : "") << result.keyPath[i].toString();

    std::cout << "\nTransitions:  " << r.transitionCount
              << "  perfect " << r.perfectCount
              << ", good " << r.goodCount
              << ", jumps " << r.badCount;
    std::cout << "\nTotal / worst: " << r.totalDistance << " / " << r.worstJump << "\n";
}

} // namespace

int main(int argc, char* argv[])
{
    juce::ArgumentList args(argc, argv);

    if (args.size() == 0 || args.containsOption("--help|-h"))
    {
        printUsage();
        return args.size() == 0 ? 1 : 0;
    }

    if (args.containsOption("--log-level"))
    {
        int level = args.getValueForOption("--log-level").getIntValue();
        if (level < 0 || level > 4)
        {
            std::cerr << "Error: --log-level must be 0-4\n";
            return 1;
        }
        Logger::setLevel(static_cast<LogLevel>(level));
    }

    if (args[0].isOption())
    {
        std::cerr << "Error: missing playlist file\n";
        printUsage();
        return 1;
    }
    std::string inputPath = args[0].text.toStdString();

    OptimizerConfig config;
    if (args.containsOption("--policy|-p"))
    {
        auto token = args.getValueForOption("--policy|-p").toStdString();
        auto policy = parseEnergyPolicy(token);
        if (!policy)
        {
            std::cerr << "Error: unknown policy '" << token << "' (ramp_up, ramp_down, wave)\n";
            return 1;
        }
        config.policy = *policy;
    }
    if (args.containsOption("--exact-limit"))
        config.exactSolverLimit = args.getValueForOption("--exact-limit").getIntValue();

    Playlist playlist;
    std::string error;
    if (!PlaylistReader::readFile(inputPath, playlist, error,
                                  args.getValueForOption("--playlist").toStdString()))
    {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    if (playlist.tracks.empty())
    {
        std::cerr << "Error: no tracks in " << inputPath << "\n";
        return 1;
    }

    auto result = Optimizer(config).optimize(playlist.tracks);

    if (!args.containsOption("--quiet|-q"))
        printTable(playlist, result);
    printSummary(result, config.policy);

    if (args.containsOption("--output|-o"))
    {
        auto outputPath = args.getValueForOption("--output|-o").toStdString();
        if (!PlaylistWriter::writeCsvFile(outputPath, playlist, result.order, error))
        {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        std::cout << "\nSaved " << outputPath << "\n";
    }

    return 0;
}
