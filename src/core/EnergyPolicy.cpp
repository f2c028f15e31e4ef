#include "core/EnergyPolicy.h"

#include <cctype>

namespace harmonicflow {

std::optional<EnergyPolicy> parseEnergyPolicy(const std::string& token)
{
    std::string folded;
    folded.reserve(token.size());
    for (char c : token)
    {
        if (c == '-')
            folded += '_';
        else if (!std::isspace(static_cast<unsigned char>(c)))
            folded += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (folded == "ramp_up")   return EnergyPolicy::rampUp;
    if (folded == "ramp_down") return EnergyPolicy::rampDown;
    if (folded == "wave")      return EnergyPolicy::wave;
    return std::nullopt;
}

const char* energyPolicyToken(EnergyPolicy policy)
{
    switch (policy)
    {
        case EnergyPolicy::rampUp:   return "ramp_up";
        case EnergyPolicy::rampDown: return "ramp_down";
        case EnergyPolicy::wave:     return "wave";
    }
    return "ramp_up";
}

bool shouldReversePath(EnergyPolicy policy, double firstMeanBpm, double lastMeanBpm)
{
    switch (policy)
    {
        case EnergyPolicy::rampUp:   return firstMeanBpm > lastMeanBpm;
        case EnergyPolicy::rampDown: return firstMeanBpm < lastMeanBpm;
        case EnergyPolicy::wave:     return false;
    }
    return false;
}

bool sortsAscending(EnergyPolicy policy, int groupIndex)
{
    switch (policy)
    {
        case EnergyPolicy::rampUp:   return true;
        case EnergyPolicy::rampDown: return false;
        case EnergyPolicy::wave:     return groupIndex % 2 == 0;
    }
    return true;
}

} // namespace harmonicflow
