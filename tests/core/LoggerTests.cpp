#include <catch2/catch_test_macros.hpp>

#include "core/KeyNormalizer.h"
#include "core/Logger.h"
#include "core/Optimizer.h"

#include <string>
#include <vector>

using namespace harmonicflow;

// --- Callback test helpers ---

struct CapturedLog {
    int level;
    std::string message;
};

static std::vector<CapturedLog> g_captured;

static void captureCallback(int level, const char* message, void* /*userData*/)
{
    g_captured.push_back({level, message});
}

static void resetLogger()
{
    Logger::setCallback(nullptr, nullptr);
    Logger::setLevel(LogLevel::warn);
    g_captured.clear();
}

// --- Level tests ---

TEST_CASE("Logger default level is warn")
{
    resetLogger();
    REQUIRE(Logger::getLevel() == LogLevel::warn);
}

TEST_CASE("Logger setLevel and getLevel round-trip")
{
    resetLogger();

    for (auto level : {LogLevel::off, LogLevel::warn, LogLevel::info,
                       LogLevel::debug, LogLevel::trace})
    {
        Logger::setLevel(level);
        REQUIRE(Logger::getLevel() == level);
    }

    resetLogger();
}

// --- Macro gating tests ---

TEST_CASE("HF_WARN fires at warn level")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    HF_WARN("warn msg %d", 42);
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[warn]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("warn msg 42") != std::string::npos);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::warn));

    resetLogger();
}

TEST_CASE("HF_WARN is a no-op when level is off")
{
    resetLogger();
    Logger::setLevel(LogLevel::off);
    Logger::setCallback(captureCallback, nullptr);

    HF_WARN("should not appear");
    REQUIRE(g_captured.empty());

    resetLogger();
}

TEST_CASE("HF_INFO is suppressed at warn level")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    HF_INFO("should not appear");
    REQUIRE(g_captured.empty());

    resetLogger();
}

TEST_CASE("HF_DEBUG fires at debug level and not at info")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    Logger::setLevel(LogLevel::info);
    HF_DEBUG("hidden");
    REQUIRE(g_captured.empty());

    Logger::setLevel(LogLevel::debug);
    HF_DEBUG("debug msg %d", 99);
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[debug]") != std::string::npos);

    resetLogger();
}

TEST_CASE("HF_TRACE fires only at trace level")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    Logger::setLevel(LogLevel::debug);
    HF_TRACE("hidden");
    REQUIRE(g_captured.empty());

    Logger::setLevel(LogLevel::trace);
    HF_TRACE("trace msg %s", "x");
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[trace]") != std::string::npos);

    resetLogger();
}

// --- Message format tests ---

TEST_CASE("log message contains timestamp, level, file, and user message")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    Logger::setCallback(captureCallback, nullptr);

    HF_DEBUG("format test %d", 123);
    REQUIRE(g_captured.size() == 1);

    const auto& msg = g_captured[0].message;
    REQUIRE(msg.find("[debug]") != std::string::npos);
    REQUIRE(msg.find("LoggerTests.cpp:") != std::string::npos);
    REQUIRE(msg.find("/tests/") == std::string::npos);
    REQUIRE(msg.find("format test 123") != std::string::npos);
    // Timestamp: [NNNNNN] at the start
    REQUIRE(msg[0] == '[');
    REQUIRE(msg[7] == ']');

    resetLogger();
}

// --- Callback tests ---

TEST_CASE("setCallback nullptr reverts to stderr")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    Logger::setCallback(captureCallback, nullptr);
    Logger::setCallback(nullptr, nullptr);

    // Should not crash, should go to stderr (not captured)
    HF_DEBUG("after clear");
    REQUIRE(g_captured.empty());

    resetLogger();
}

TEST_CASE("callback receives correct level for each macro")
{
    resetLogger();
    Logger::setLevel(LogLevel::trace);
    Logger::setCallback(captureCallback, nullptr);

    HF_WARN("w");
    HF_INFO("i");
    HF_DEBUG("d");
    HF_TRACE("t");

    REQUIRE(g_captured.size() == 4);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::warn));
    REQUIRE(g_captured[1].level == static_cast<int>(LogLevel::info));
    REQUIRE(g_captured[2].level == static_cast<int>(LogLevel::debug));
    REQUIRE(g_captured[3].level == static_cast<int>(LogLevel::trace));

    resetLogger();
}

// --- Core diagnostics ---

TEST_CASE("Optimizer warns when no track has a recognisable key")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    Track t;
    t.rawKey = "???";
    Optimizer().optimize({t, t});

    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::warn));
    REQUIRE(g_captured[0].message.find("none of 2 tracks") != std::string::npos);

    resetLogger();
}

TEST_CASE("KeyNormalizer traces keys it cannot place")
{
    resetLogger();
    Logger::setLevel(LogLevel::trace);
    Logger::setCallback(captureCallback, nullptr);

    KeyNormalizer::normalize("Xyz");
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("'Xyz'") != std::string::npos);

    resetLogger();
}
