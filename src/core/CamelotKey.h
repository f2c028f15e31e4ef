#pragma once

#include <optional>
#include <string>

namespace harmonicflow {

/// Mode ring on the wheel: A = minor, B = major.
enum class Ring { minor, major };

/// A position on the 24-point Camelot wheel ("1A".."12B").
struct CamelotKey {
    int number = 1;          // 1..12, circular
    Ring ring = Ring::minor;

    /// Parses an exact canonical code ("8A", "12B"). No trimming, no case folding,
    /// no leading zeros.
    static std::optional<CamelotKey> fromCode(const std::string& code);

    std::string toString() const;

    bool operator==(const CamelotKey& other) const
    {
        return number == other.number && ring == other.ring;
    }
    bool operator!=(const CamelotKey& other) const { return !(*this == other); }
};

/// Cost returned when either side is not a canonical code. Larger than any
/// real wheel distance so it always loses against a real transition.
constexpr int kUnknownKeyDistance = 100;

/// Largest distance between two wheel positions (6 ring steps + 1 ring swap).
constexpr int kMaxKeyDistance = 7;

/// Shortest-path distance on the two-ring wheel graph.
int keyDistance(const CamelotKey& a, const CamelotKey& b);

/// Same as above for code strings; kUnknownKeyDistance if either is not canonical.
int keyDistance(const std::string& a, const std::string& b);

} // namespace harmonicflow
