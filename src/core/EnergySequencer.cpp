#include "core/EnergySequencer.h"
#include "core/Logger.h"

#include <algorithm>

namespace harmonicflow {

EnergySequencer::EnergySequencer(EnergyPolicy policy)
    : policy_(policy)
{
}

EnergyPolicy EnergySequencer::getPolicy() const
{
    return policy_;
}

static const KeyGroup* findGroup(const std::vector<KeyGroup>& groups, const CamelotKey& key)
{
    for (const auto& group : groups)
    {
        if (group.key == key)
            return &group;
    }
    return nullptr;
}

std::optional<double> EnergySequencer::meanBpm(const KeyGroup& group,
                                               const std::vector<Track>& tracks)
{
    double sum = 0.0;
    int count = 0;
    for (int index : group.trackIndices)
    {
        const auto& bpm = tracks[static_cast<size_t>(index)].bpm;
        if (bpm)
        {
            sum += *bpm;
            ++count;
        }
    }
    if (count == 0)
        return std::nullopt;
    return sum / count;
}

void EnergySequencer::sortByBpm(std::vector<int>& indices, const std::vector<Track>& tracks,
                                bool ascending)
{
    std::stable_sort(indices.begin(), indices.end(),
        [&tracks, ascending](int a, int b) {
            const auto& bpmA = tracks[static_cast<size_t>(a)].bpm;
            const auto& bpmB = tracks[static_cast<size_t>(b)].bpm;
            if (!bpmA || !bpmB)
                return bpmA.has_value() && !bpmB.has_value();
            return ascending ? *bpmA < *bpmB : *bpmA > *bpmB;
        });
}

SequenceResult EnergySequencer::sequence(const std::vector<CamelotKey>& path,
                                         const std::vector<KeyGroup>& groups,
                                         const std::vector<int>& keyless,
                                         const std::vector<Track>& tracks) const
{
    SequenceResult result;
    result.path = path;

    // 1-2. Direction from boundary group means
    if (path.size() >= 2)
    {
        const KeyGroup* first = findGroup(groups, path.front());
        const KeyGroup* last = findGroup(groups, path.back());
        auto firstMean = first ? meanBpm(*first, tracks) : std::nullopt;
        auto lastMean = last ? meanBpm(*last, tracks) : std::nullopt;

        if (firstMean && lastMean)
        {
            if (shouldReversePath(policy_, *firstMean, *lastMean))
            {
                std::reverse(result.path.begin(), result.path.end());
                result.reversed = true;
            }
        }
        else
        {
            HF_DEBUG("EnergySequencer: boundary group without BPM, keeping path direction");
        }
    }

    // 3-4. Per-group sort, concatenate, keyless last
    result.order.reserve(tracks.size());
    for (size_t i = 0; i < result.path.size(); ++i)
    {
        const KeyGroup* group = findGroup(groups, result.path[i]);
        if (!group)
        {
            HF_WARN("EnergySequencer: no group for key %s", result.path[i].toString().c_str());
            continue;
        }

        std::vector<int> indices = group->trackIndices;
        sortByBpm(indices, tracks, sortsAscending(policy_, static_cast<int>(i)));
        result.order.insert(result.order.end(), indices.begin(), indices.end());
    }

    result.order.insert(result.order.end(), keyless.begin(), keyless.end());
    return result;
}

} // namespace harmonicflow
