#include <catch2/catch_test_macros.hpp>
#include "ffi/harmonicflow_ffi.h"

#include <juce_core/juce_core.h>

#include <cmath>
#include <cstring>
#include <string>
#include <vector>

static std::vector<int> orderOf(HfPlaylist p)
{
    HfIntList list = hf_playlist_order(p);
    std::vector<int> order(list.items, list.items + list.count);
    hf_free_int_list(list);
    return order;
}

static HfPlaylist scenarioPlaylist()
{
    HfPlaylist p = hf_playlist_create();
    hf_playlist_add_track(p, "A", "One", 120.0, "8A");
    hf_playlist_add_track(p, "B", "Two", 128.0, "8A");
    hf_playlist_add_track(p, "C", "Three", 122.0, "9A");
    hf_playlist_add_track(p, "D", "Four", 126.0, "1B");
    return p;
}

// ═══════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("hf_playlist_create starts empty")
{
    HfPlaylist p = hf_playlist_create();
    REQUIRE(p != nullptr);
    CHECK(hf_playlist_track_count(p) == 0);
    CHECK(hf_playlist_order(p).count == 0);
    hf_playlist_destroy(p);
}

TEST_CASE("hf_playlist_destroy accepts NULL")
{
    hf_playlist_destroy(nullptr);
}

TEST_CASE("hf_playlist_add_track appends tracks")
{
    HfPlaylist p = scenarioPlaylist();
    CHECK(hf_playlist_track_count(p) == 4);
    hf_playlist_destroy(p);
}

// ═══════════════════════════════════════════════════════════════════
// Optimize
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("hf_playlist_optimize orders tracks and exposes the key path")
{
    HfPlaylist p = scenarioPlaylist();

    char* error = nullptr;
    REQUIRE(hf_playlist_optimize(p, "ramp_up", 0, &error));
    CHECK(error == nullptr);

    CHECK(orderOf(p) == std::vector<int>{0, 1, 2, 3});

    HfStringList path = hf_playlist_key_path(p);
    REQUIRE(path.count == 3);
    CHECK(std::string(path.items[0]) == "8A");
    CHECK(std::string(path.items[1]) == "9A");
    CHECK(std::string(path.items[2]) == "1B");
    hf_free_string_list(path);

    HfQualityReport q = hf_playlist_quality(p);
    CHECK(q.total_distance == 6);
    CHECK(q.transition_count == 3);
    CHECK(q.perfect_count == 2);
    CHECK(q.bad_count == 1);
    CHECK(q.worst_jump == 5);
    CHECK(q.track_count == 4);
    CHECK(q.start_bpm == 120.0);

    hf_playlist_destroy(p);
}

TEST_CASE("hf_playlist_optimize rejects an unknown policy")
{
    HfPlaylist p = scenarioPlaylist();
    hf_set_log_level(0);

    char* error = nullptr;
    CHECK_FALSE(hf_playlist_optimize(p, "shuffle", 0, &error));
    REQUIRE(error != nullptr);
    CHECK(std::string(error).find("shuffle") != std::string::npos);
    hf_free_string(error);
    CHECK(hf_playlist_order(p).count == 0);

    hf_set_log_level(1);
    hf_playlist_destroy(p);
}

TEST_CASE("hf_playlist_add_track treats non-positive or NaN BPM as missing")
{
    HfPlaylist p = hf_playlist_create();
    hf_playlist_add_track(p, nullptr, "NaN", std::nan(""), "8A");
    hf_playlist_add_track(p, nullptr, "Zero", 0.0, "8A");
    hf_playlist_add_track(p, nullptr, "Real", 120.0, "8A");

    REQUIRE(hf_playlist_optimize(p, "ramp_down", 0, nullptr));
    CHECK(orderOf(p) == std::vector<int>{2, 0, 1});
    CHECK(hf_playlist_quality(p).start_bpm == 120.0);

    hf_playlist_destroy(p);
}

TEST_CASE("hf_playlist_add_track invalidates a previous optimization")
{
    HfPlaylist p = scenarioPlaylist();
    REQUIRE(hf_playlist_optimize(p, "wave", 0, nullptr));
    CHECK(orderOf(p).size() == 4);

    hf_playlist_add_track(p, "E", "Five", 124.0, "Xyz");
    CHECK(hf_playlist_order(p).count == 0);
    CHECK(hf_playlist_quality(p).track_count == 0);

    REQUIRE(hf_playlist_optimize(p, "wave", 0, nullptr));
    auto order = orderOf(p);
    REQUIRE(order.size() == 5);
    CHECK(order.back() == 4);
    CHECK(hf_playlist_quality(p).keyless_count == 1);

    hf_playlist_destroy(p);
}

// ═══════════════════════════════════════════════════════════════════
// Load / export
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("hf_playlist_load with nonexistent file returns false and sets error")
{
    HfPlaylist p = hf_playlist_create();
    hf_set_log_level(0);

    char* error = nullptr;
    CHECK_FALSE(hf_playlist_load(p, "/no/such/file.txt", nullptr, &error));
    REQUIRE(error != nullptr);
    CHECK(std::strlen(error) > 0);
    hf_free_string(error);
    CHECK(hf_playlist_track_count(p) == 0);

    hf_set_log_level(1);
    hf_playlist_destroy(p);
}

TEST_CASE("hf_playlist_load reads a file, optimize, export round trip")
{
    juce::TemporaryFile input(".csv");
    REQUIRE(input.getFile().replaceWithText(
        "Artist,Title,Key,BPM\n"
        "Gamma,High,1B,126\n"
        "Alpha,Low,8A,120\n"
        "Delta,Lost,,100\n"
        "Beta,Mid,Am,128\n"));

    HfPlaylist p = hf_playlist_create();
    char* error = nullptr;
    REQUIRE(hf_playlist_load(p, input.getFile().getFullPathName().toRawUTF8(), "", &error));
    CHECK(hf_playlist_track_count(p) == 4);

    REQUIRE(hf_playlist_optimize(p, "ramp_up", 0, &error));

    juce::TemporaryFile output(".csv");
    REQUIRE(hf_playlist_export_csv(p, output.getFile().getFullPathName().toRawUTF8(), &error));

    auto lines = juce::StringArray::fromLines(output.getFile().loadFileAsString().trimEnd());
    REQUIRE(lines.size() == 5);
    CHECK(lines[0] == "Artist,Title,Key,BPM");
    CHECK(lines[1] == "Alpha,Low,8A,120");
    CHECK(lines[2] == "Beta,Mid,Am,128");
    CHECK(lines[3] == "Gamma,High,1B,126");
    CHECK(lines[4] == "Delta,Lost,,100");

    hf_playlist_destroy(p);
}

TEST_CASE("hf_playlist_export_csv before optimize fails")
{
    HfPlaylist p = scenarioPlaylist();
    char* error = nullptr;
    CHECK_FALSE(hf_playlist_export_csv(p, "/tmp/unused.csv", &error));
    REQUIRE(error != nullptr);
    hf_free_string(error);
    hf_playlist_destroy(p);
}
