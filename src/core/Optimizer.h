#pragma once

#include "core/CamelotKey.h"
#include "core/EnergyPolicy.h"
#include "core/EnergySequencer.h"
#include "core/PathSolver.h"
#include "core/QualityReporter.h"
#include "core/Types.h"

#include <optional>
#include <vector>

namespace harmonicflow {

struct OptimizerConfig {
    EnergyPolicy policy = EnergyPolicy::rampUp;
    int exactSolverLimit = PathSolver::kDefaultExactLimit;
};

struct OptimizeResult {
    std::vector<int> order;                        // indices into the input tracks
    std::vector<CamelotKey> keyPath;               // final key visiting order
    std::vector<std::optional<CamelotKey>> keys;   // per input track, nullopt if keyless
    QualityReport report;
    bool exact = true;                             // false if the greedy fallback ran
};

/// One optimization run: normalize keys, group, solve the key path, sequence by
/// energy policy, report. Never fails; unusable rows are appended unchanged.
class Optimizer {
public:
    explicit Optimizer(const OptimizerConfig& config = {});

    const OptimizerConfig& getConfig() const;

    OptimizeResult optimize(const std::vector<Track>& tracks) const;

    /// Groups keyed tracks by wheel position in order of first appearance.
    /// Indices whose key is nullopt go to keyless.
    static std::vector<KeyGroup> groupByKey(const std::vector<std::optional<CamelotKey>>& keys,
                                            std::vector<int>& keyless);

private:
    OptimizerConfig config_;
};

} // namespace harmonicflow
