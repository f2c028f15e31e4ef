#pragma once

#include "core/CamelotKey.h"
#include "core/Types.h"

#include <optional>
#include <vector>

namespace harmonicflow {

/// Transition statistics for a finished order. Informational only.
struct QualityReport {
    int totalDistance = 0;
    int perfectCount = 0;     // distance <= 1
    int goodCount = 0;        // distance == 2
    int badCount = 0;         // distance > 2
    int worstJump = 0;
    int transitionCount = 0;  // adjacent keyed pairs

    int trackCount = 0;
    int keylessCount = 0;
    std::optional<double> startBpm;
};

class QualityReporter {
public:
    static constexpr int kPerfectThreshold = 1;
    static constexpr int kGoodDistance = 2;

    /// order indexes tracks and keys; keys[i] is the wheel position of tracks[i].
    /// Pairs touching a keyless track are skipped.
    static QualityReport report(const std::vector<int>& order,
                                const std::vector<Track>& tracks,
                                const std::vector<std::optional<CamelotKey>>& keys);
};

} // namespace harmonicflow
