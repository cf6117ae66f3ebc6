#include "Decision/SkillCheck.h"
#include "Util/TextUtil.h"

#include <algorithm>

namespace
{
constexpr char const* kSkillFailureReason = "The attempt was not quite successful";
}

nlohmann::json SkillCheckResult::ToJson() const
{
    return {
        {"success", success},
        {"roll", roll},
        {"difficulty", difficulty},
        {"chance", chance},
        {"modifiers", nlohmann::json::array()},
        {"failure_reason", failureReason ? nlohmann::json(*failureReason) : nlohmann::json(nullptr)}};
}

double SkillCheckChance(DecisionSettings const& settings, WorldState const& world)
{
    double chance = settings.skillBaseChance;
    // Harder actions during unrest.
    if (EqualsInsensitive(TrimCopy(world.politicalStability), "unrest"))
        chance -= settings.unrestPenalty;
    return std::clamp(chance, 0.0, 1.0);
}

SkillCheckResult RollSkillCheck(DecisionSettings const& settings, WorldState const& world, RandomSource& rng)
{
    SkillCheckResult result;
    result.chance = SkillCheckChance(settings, world);
    result.success = rng.NextUnit() < result.chance;
    result.roll = rng.NextInt(1, 20);
    result.difficulty = settings.skillDifficulty;
    if (!result.success)
        result.failureReason = kSkillFailureReason;
    return result;
}
