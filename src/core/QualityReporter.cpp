#include "core/QualityReporter.h"

namespace harmonicflow {

QualityReport QualityReporter::report(const std::vector<int>& order,
                                      const std::vector<Track>& tracks,
                                      const std::vector<std::optional<CamelotKey>>& keys)
{
    QualityReport r;
    r.trackCount = static_cast<int>(order.size());
    if (!order.empty())
        r.startBpm = tracks[static_cast<size_t>(order.front())].bpm;

    for (size_t i = 0; i < order.size(); ++i)
    {
        const auto& key = keys[static_cast<size_t>(order[i])];
        if (!key)
        {
            r.keylessCount++;
            continue;
        }
        if (i == 0)
            continue;

        const auto& prevKey = keys[static_cast<size_t>(order[i - 1])];
        if (!prevKey)
            continue;

        int d = keyDistance(*prevKey, *key);
        r.totalDistance += d;
        r.transitionCount++;
        if (d > r.worstJump)
            r.worstJump = d;

        if (d <= kPerfectThreshold)
            r.perfectCount++;
        else if (d == kGoodDistance)
            r.goodCount++;
        else
            r.badCount++;
    }

    return r;
}

} // namespace harmonicflow
