#pragma once

#include "core/CamelotKey.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace harmonicflow {

/// Maps key text from DJ software exports onto wheel positions.
///
/// Resolution order, first match wins:
///   1. canonical code ("8A")
///   2. exact spelling from the lookup table ("Am", "F#", "Gbmin", "1m")
///   3. zero-padded canonical code ("08A")
///   4. case-insensitive match against the lookup table, then the canonical codes
/// Input is trimmed first. Anything else is keyless.
class KeyNormalizer {
public:
    static std::optional<CamelotKey> normalize(const std::string& rawKey);

    /// Ordered spelling table: musical name or Open Key notation -> canonical code.
    static const std::vector<std::pair<std::string, std::string>>& lookupTable();
};

} // namespace harmonicflow
