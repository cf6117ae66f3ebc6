#include "Pacing/SceneContext.h"
#include "Util/TextUtil.h"

std::string NpcProfile::DisplayName() const
{
    return name.empty() ? TitleFromIdentifier(npcId) : name;
}

NpcProfile const* SceneContext::FindNpc(std::string const& npcId) const
{
    for (auto const& npc : presentNpcs)
    {
        if (npc.npcId == npcId)
        {
            return &npc;
        }
    }
    return nullptr;
}
