#include "core/Optimizer.h"
#include "core/KeyNormalizer.h"
#include "core/Logger.h"

namespace harmonicflow {

Optimizer::Optimizer(const OptimizerConfig& config)
    : config_(config)
{
}

const OptimizerConfig& Optimizer::getConfig() const
{
    return config_;
}

std::vector<KeyGroup> Optimizer::groupByKey(const std::vector<std::optional<CamelotKey>>& keys,
                                            std::vector<int>& keyless)
{
    std::vector<KeyGroup> groups;
    keyless.clear();

    for (size_t i = 0; i < keys.size(); ++i)
    {
        int index = static_cast<int>(i);
        if (!keys[i])
        {
            keyless.push_back(index);
            continue;
        }

        KeyGroup* group = nullptr;
        for (auto& g : groups)
        {
            if (g.key == *keys[i])
            {
                group = &g;
                break;
            }
        }
        if (!group)
        {
            groups.push_back({*keys[i], {}});
            group = &groups.back();
        }
        group->trackIndices.push_back(index);
    }

    return groups;
}

OptimizeResult Optimizer::optimize(const std::vector<Track>& tracks) const
{
    OptimizeResult result;

    result.keys.reserve(tracks.size());
    for (const auto& track : tracks)
        result.keys.push_back(KeyNormalizer::normalize(track.rawKey));

    std::vector<int> keyless;
    auto groups = groupByKey(result.keys, keyless);

    if (groups.empty())
    {
        HF_WARN("Optimizer: none of %d tracks has a recognisable key, order unchanged",
                static_cast<int>(tracks.size()));
        result.order = keyless;
        result.report = QualityReporter::report(result.order, tracks, result.keys);
        return result;
    }

    std::vector<CamelotKey> distinct;
    distinct.reserve(groups.size());
    for (const auto& group : groups)
        distinct.push_back(group.key);

    PathSolver solver(config_.exactSolverLimit);
    result.exact = static_cast<int>(distinct.size()) <= solver.getExactLimit();
    auto path = solver.solve(distinct);

    EnergySequencer sequencer(config_.policy);
    auto sequenced = sequencer.sequence(path, groups, keyless, tracks);
    result.order = std::move(sequenced.order);
    result.keyPath = std::move(sequenced.path);

    result.report = QualityReporter::report(result.order, tracks, result.keys);

    HF_INFO("Optimizer: %d tracks, %d keys (%s), %d keyless, policy=%s, total distance %d",
            static_cast<int>(tracks.size()), static_cast<int>(groups.size()),
            result.exact ? "exact" : "greedy", static_cast<int>(keyless.size()),
            energyPolicyToken(config_.policy), result.report.totalDistance);
    return result;
}

} // namespace harmonicflow
