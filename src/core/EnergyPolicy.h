#pragma once

#include <optional>
#include <string>

namespace harmonicflow {

/// BPM contour for a run. Each policy pairs a path-direction rule with a
/// within-group sort rule.
enum class EnergyPolicy { rampUp, rampDown, wave };

/// Accepts "ramp_up", "ramp_down", "wave" (case-insensitive, '-' allowed for '_').
std::optional<EnergyPolicy> parseEnergyPolicy(const std::string& token);

/// Canonical token for a policy ("ramp_up", ...).
const char* energyPolicyToken(EnergyPolicy policy);

/// Direction rule: true if the key path should be walked from its other end,
/// given the mean BPM of the path's first and last key groups.
/// wave keeps path order so both ends stay mixed.
bool shouldReversePath(EnergyPolicy policy, double firstMeanBpm, double lastMeanBpm);

/// Sort rule: true if the group at groupIndex (position in the final path)
/// sorts by ascending BPM.
bool sortsAscending(EnergyPolicy policy, int groupIndex);

} // namespace harmonicflow
