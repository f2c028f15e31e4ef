#ifndef HARMONICFLOW_FFI_H
#define HARMONICFLOW_FFI_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── Opaque handle ─────────────────────────────────────────────── */

typedef void* HfPlaylist;

/* ── String / list ownership ───────────────────────────────────── */

/// Free a string returned by any hf_* function.
/// Passing NULL is safe (no-op).
void hf_free_string(char* s);

typedef struct {
    char** items;
    int    count;
} HfStringList;

typedef struct {
    int* items;
    int  count;
} HfIntList;

void hf_free_string_list(HfStringList list);
void hf_free_int_list(HfIntList list);

/* ── Logging ───────────────────────────────────────────────────── */

/// Set log level globally. 0=off, 1=warn, 2=info, 3=debug, 4=trace.
void hf_set_log_level(int level);

/// Set a callback to receive log messages. Pass NULL to revert to stderr.
void hf_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data);

/* ── Keys ──────────────────────────────────────────────────────── */

/// Normalize key text ("Am", "08A", "1m") to a wheel code ("8A").
/// Returns NULL if the key is not recognised. Caller must hf_free_string() the result.
char* hf_normalize_key(const char* raw_key);

/// Harmonic distance between two wheel codes (0-7), or 100 if either is not
/// a canonical code.
int hf_key_distance(const char* a, const char* b);

/* ── Playlist lifecycle ────────────────────────────────────────── */

/// Create an empty playlist. Free with hf_playlist_destroy().
HfPlaylist hf_playlist_create(void);

/// Passing NULL is safe (no-op).
void hf_playlist_destroy(HfPlaylist playlist);

/// Replace the playlist's tracks with a file's contents (.txt, .csv, .xml).
/// playlist_name selects a Rekordbox XML playlist; NULL or "" reads the collection.
/// Returns false on failure (sets *error); the playlist is then unchanged.
bool hf_playlist_load(HfPlaylist playlist, const char* path, const char* playlist_name,
                      char** error);

/// Append a track. bpm <= 0 (or NaN) means no BPM. NULL strings are treated as "".
void hf_playlist_add_track(HfPlaylist playlist, const char* artist, const char* title,
                           double bpm, const char* key);

int hf_playlist_track_count(HfPlaylist playlist);

/* ── Optimization ──────────────────────────────────────────────── */

typedef struct {
    int    total_distance;
    int    perfect_count;
    int    good_count;
    int    bad_count;
    int    worst_jump;
    int    transition_count;
    int    track_count;
    int    keyless_count;
    double start_bpm;       /* 0.0 if the first track has no BPM */
} HfQualityReport;

/// Optimize the track order. policy is "ramp_up", "ramp_down" or "wave".
/// exact_limit <= 0 uses the default exact-solver limit.
/// Returns false on an unknown policy (sets *error).
bool hf_playlist_optimize(HfPlaylist playlist, const char* policy, int exact_limit,
                          char** error);

/// Optimized order as indices into the loaded tracks. Empty before optimize.
/// Free with hf_free_int_list().
HfIntList hf_playlist_order(HfPlaylist playlist);

/// Solved key path as wheel codes. Free with hf_free_string_list().
HfStringList hf_playlist_key_path(HfPlaylist playlist);

/// Quality figures of the last optimization (all zero before optimize).
HfQualityReport hf_playlist_quality(HfPlaylist playlist);

/// Write the optimized order as CSV. Returns false on failure (sets *error).
bool hf_playlist_export_csv(HfPlaylist playlist, const char* path, char** error);

#ifdef __cplusplus
}
#endif

#endif /* HARMONICFLOW_FFI_H */
