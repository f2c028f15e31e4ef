#include <catch2/catch_test_macros.hpp>

#include "ffi/harmonicflow_ffi.h"
#include "core/Logger.h"

#include <string>
#include <vector>

// --- Callback test helpers ---

struct CapturedFFILog {
    int level;
    std::string message;
};

static std::vector<CapturedFFILog> g_ffiCaptured;

static void ffiCaptureCallback(int level, const char* message, void* /*userData*/)
{
    g_ffiCaptured.push_back({level, message});
}

static void resetFFI()
{
    hf_set_log_callback(nullptr, nullptr);
    hf_set_log_level(1); // warn
    g_ffiCaptured.clear();
}

// --- Tests ---

TEST_CASE("hf_set_log_level controls the core logger level")
{
    resetFFI();

    hf_set_log_level(3);
    REQUIRE(harmonicflow::Logger::getLevel() == harmonicflow::LogLevel::debug);

    hf_set_log_level(0);
    REQUIRE(harmonicflow::Logger::getLevel() == harmonicflow::LogLevel::off);

    resetFFI();
}

TEST_CASE("hf_set_log_callback captures messages")
{
    resetFFI();
    hf_set_log_level(3); // debug
    hf_set_log_callback(ffiCaptureCallback, nullptr);

    harmonicflow::Logger::log(harmonicflow::LogLevel::debug, __FILE__, __LINE__, "ffi callback test %d", 42);
    REQUIRE(g_ffiCaptured.size() == 1);
    REQUIRE(g_ffiCaptured[0].message.find("ffi callback test 42") != std::string::npos);
    REQUIRE(g_ffiCaptured[0].level == 3); // debug

    resetFFI();
}

TEST_CASE("hf_set_log_callback receives warnings from a failed load")
{
    resetFFI();
    hf_set_log_callback(ffiCaptureCallback, nullptr);

    HfPlaylist p = hf_playlist_create();
    char* error = nullptr;
    REQUIRE_FALSE(hf_playlist_load(p, "/no/such/file.txt", nullptr, &error));
    hf_free_string(error);
    hf_playlist_destroy(p);

    REQUIRE_FALSE(g_ffiCaptured.empty());
    REQUIRE(g_ffiCaptured[0].level == 1);
    REQUIRE(g_ffiCaptured[0].message.find("File not found") != std::string::npos);

    resetFFI();
}

TEST_CASE("hf_set_log_callback NULL reverts to stderr")
{
    resetFFI();
    hf_set_log_level(3);

    hf_set_log_callback(ffiCaptureCallback, nullptr);
    hf_set_log_callback(nullptr, nullptr);

    // Log should go to stderr, not crash, not be captured
    harmonicflow::Logger::log(harmonicflow::LogLevel::debug, __FILE__, __LINE__, "after null callback");
    REQUIRE(g_ffiCaptured.empty());

    resetFFI();
}
