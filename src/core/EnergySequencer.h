#pragma once

#include "core/CamelotKey.h"
#include "core/EnergyPolicy.h"
#include "core/Types.h"

#include <optional>
#include <vector>

namespace harmonicflow {

/// Tracks sharing one wheel position, held as indices into the source track list.
struct KeyGroup {
    CamelotKey key;
    std::vector<int> trackIndices;
};

struct SequenceResult {
    std::vector<int> order;          // indices into the source track list
    std::vector<CamelotKey> path;    // key path after direction selection
    bool reversed = false;
};

/// Expands a solved key path into a full track order following an energy policy.
class EnergySequencer {
public:
    explicit EnergySequencer(EnergyPolicy policy);

    EnergyPolicy getPolicy() const;

    /// Walks path (reversed if the policy's direction rule asks for it), sorts
    /// each group's tracks by BPM, then appends keyless indices unchanged.
    /// Every key in path must have a group in groups.
    SequenceResult sequence(const std::vector<CamelotKey>& path,
                            const std::vector<KeyGroup>& groups,
                            const std::vector<int>& keyless,
                            const std::vector<Track>& tracks) const;

    /// Mean of the group's numeric BPM values; nullopt if it has none.
    static std::optional<double> meanBpm(const KeyGroup& group,
                                         const std::vector<Track>& tracks);

    /// Stable BPM sort of indices. Tracks without BPM go last in either direction.
    static void sortByBpm(std::vector<int>& indices, const std::vector<Track>& tracks,
                          bool ascending);

private:
    EnergyPolicy policy_;
};

} // namespace harmonicflow
