#include "ffi/harmonicflow_ffi.h"
#include "core/KeyNormalizer.h"
#include "core/Logger.h"
#include "core/Optimizer.h"
#include "core/PlaylistReader.h"
#include "core/PlaylistWriter.h"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

// --- PlaylistHandle ---

struct PlaylistHandle {
    harmonicflow::Playlist playlist;
    std::optional<harmonicflow::OptimizeResult> result;
};

static PlaylistHandle* cast(HfPlaylist p)
{
    return static_cast<PlaylistHandle*>(p);
}

// --- String helpers ---

static char* to_c_string(const std::string& s)
{
    return strdup(s.c_str());
}

static void set_error(char** error, const std::string& msg)
{
    if (error) *error = to_c_string(msg);
}

static std::string from_c(const char* s)
{
    return s ? std::string(s) : std::string();
}

// --- Logger API ---

void hf_set_log_level(int level)
{
    harmonicflow::Logger::setLevel(static_cast<harmonicflow::LogLevel>(level));
}

void hf_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data)
{
    harmonicflow::Logger::setCallback(callback, user_data);
}

// --- String / List free ---

void hf_free_string(char* s)
{
    free(s);
}

void hf_free_string_list(HfStringList list)
{
    for (int i = 0; i < list.count; i++)
        free(list.items[i]);
    free(list.items);
}

void hf_free_int_list(HfIntList list)
{
    free(list.items);
}

// --- Keys ---

char* hf_normalize_key(const char* raw_key)
{
    if (!raw_key) return nullptr;
    auto key = harmonicflow::KeyNormalizer::normalize(raw_key);
    if (!key) return nullptr;
    return to_c_string(key->toString());
}

int hf_key_distance(const char* a, const char* b)
{
    return harmonicflow::keyDistance(from_c(a), from_c(b));
}

// --- Playlist lifecycle ---

HfPlaylist hf_playlist_create(void)
{
    return static_cast<HfPlaylist>(new PlaylistHandle());
}

void hf_playlist_destroy(HfPlaylist playlist)
{
    delete cast(playlist);
}

bool hf_playlist_load(HfPlaylist playlist, const char* path, const char* playlist_name,
                      char** error)
{
    if (!path)
    {
        set_error(error, "path is NULL");
        return false;
    }

    harmonicflow::Playlist loaded;
    std::string err;
    if (!harmonicflow::PlaylistReader::readFile(path, loaded, err, from_c(playlist_name)))
    {
        set_error(error, err);
        return false;
    }

    auto* h = cast(playlist);
    h->playlist = std::move(loaded);
    h->result.reset();
    return true;
}

void hf_playlist_add_track(HfPlaylist playlist, const char* artist, const char* title,
                           double bpm, const char* key)
{
    harmonicflow::Track track;
    track.artist = from_c(artist);
    track.title = from_c(title);
    if (!std::isnan(bpm) && bpm > 0.0)
        track.bpm = bpm;
    track.rawKey = from_c(key);

    auto* h = cast(playlist);
    h->playlist.tracks.push_back(std::move(track));
    h->result.reset();
}

int hf_playlist_track_count(HfPlaylist playlist)
{
    return static_cast<int>(cast(playlist)->playlist.tracks.size());
}

// --- Optimization ---

bool hf_playlist_optimize(HfPlaylist playlist, const char* policy, int exact_limit,
                          char** error)
{
    auto parsed = harmonicflow::parseEnergyPolicy(from_c(policy));
    if (!parsed)
    {
        set_error(error, "Unknown energy policy: " + from_c(policy));
        HF_WARN("hf_playlist_optimize: unknown policy '%s'", from_c(policy).c_str());
        return false;
    }

    harmonicflow::OptimizerConfig config;
    config.policy = *parsed;
    if (exact_limit > 0)
        config.exactSolverLimit = exact_limit;

    auto* h = cast(playlist);
    h->result = harmonicflow::Optimizer(config).optimize(h->playlist.tracks);
    return true;
}

HfIntList hf_playlist_order(HfPlaylist playlist)
{
    HfIntList list{nullptr, 0};
    auto* h = cast(playlist);
    if (!h->result || h->result->order.empty())
        return list;

    const auto& order = h->result->order;
    list.count = static_cast<int>(order.size());
    list.items = static_cast<int*>(malloc(sizeof(int) * order.size()));
    std::memcpy(list.items, order.data(), sizeof(int) * order.size());
    return list;
}

HfStringList hf_playlist_key_path(HfPlaylist playlist)
{
    HfStringList list{nullptr, 0};
    auto* h = cast(playlist);
    if (!h->result || h->result->keyPath.empty())
        return list;

    const auto& path = h->result->keyPath;
    list.count = static_cast<int>(path.size());
    list.items = static_cast<char**>(malloc(sizeof(char*) * path.size()));
    for (size_t i = 0; i < path.size(); i++)
        list.items[i] = to_c_string(path[i].toString());
    return list;
}

HfQualityReport hf_playlist_quality(HfPlaylist playlist)
{
    HfQualityReport q{};
    auto* h = cast(playlist);
    if (!h->result)
        return q;

    const auto& r = h->result->report;
    q.total_distance = r.totalDistance;
    q.perfect_count = r.perfectCount;
    q.good_count = r.goodCount;
    q.bad_count = r.badCount;
    q.worst_jump = r.worstJump;
    q.transition_count = r.transitionCount;
    q.track_count = r.trackCount;
    q.keyless_count = r.keylessCount;
    q.start_bpm = r.startBpm ? *r.startBpm : 0.0;
    return q;
}

bool hf_playlist_export_csv(HfPlaylist playlist, const char* path, char** error)
{
    auto* h = cast(playlist);
    if (!h->result)
    {
        set_error(error, "Playlist has not been optimized");
        return false;
    }
    if (!path)
    {
        set_error(error, "path is NULL");
        return false;
    }

    std::string err;
    if (!harmonicflow::PlaylistWriter::writeCsvFile(path, h->playlist, h->result->order, err))
    {
        set_error(error, err);
        return false;
    }
    return true;
}
