#include "Pacing/IdleNpcManager.h"
#include "test_fakes.h"

#include <catch2/catch.hpp>

using std::chrono::seconds;

TEST_CASE("IdleNpcManager cooldowns")
{
    auto clock = MakeManualClock();
    auto generator = std::make_shared<FakeDialogueGenerator>();
    auto sink = std::make_shared<RecordingEventSink>();
    // Anything past three minutes idle is a forced initiative here.
    IdleNpcSettings settings;
    settings.maxIdleSeconds = 180;
    IdleNpcManager npcs(settings, clock, generator, sink);
    RandomSource rng(5);

    SceneContext scene = MakeScene();
    scene.presentNpcs.push_back(MakeNpc("npc_a", "friendly"));
    scene.presentNpcs.push_back(MakeNpc("npc_b", "wise"));
    Duration idle = seconds(200);

    SECTION("one NPC's cooldown does not hold back another")
    {
        InitiativeCheck check = npcs.ShouldInitiate("npc_a", scene, idle, rng);
        REQUIRE(check.initiate);
        REQUIRE(check.theme == DialogueTheme::FriendlyCheckIn);
        REQUIRE(npcs.GenerateInitiative("npc_a", *check.theme, scene));

        clock->Advance(seconds(1));
        REQUIRE_FALSE(npcs.ShouldInitiate("npc_a", scene, idle, rng).initiate);

        InitiativeCheck other = npcs.ShouldInitiate("npc_b", scene, idle, rng);
        REQUIRE(other.initiate);
        REQUIRE(other.theme == DialogueTheme::LocalKnowledge);
    }

    SECTION("cooldown expires")
    {
        REQUIRE(npcs.GenerateInitiative("npc_a", DialogueTheme::FriendlyCheckIn, scene));
        clock->Advance(seconds(299));
        REQUIRE_FALSE(npcs.ShouldInitiate("npc_a", scene, idle, rng).initiate);
        clock->Advance(seconds(1));
        REQUIRE(npcs.ShouldInitiate("npc_a", scene, idle, rng).initiate);
    }

    SECTION("not idle long enough")
    {
        REQUIRE_FALSE(npcs.ShouldInitiate("npc_a", scene, seconds(179), rng).initiate);
        REQUIRE(npcs.ShouldInitiate("npc_a", scene, seconds(181), rng).initiate);
    }

    SECTION("per-NPC idle threshold")
    {
        // Friendly NPC, liked player, welcoming place: a certain yes once idle.
        scene.playerContext.reputationSummary = "Well liked around the mill";
        scene.playerContext.locationAura = "friendly";
        scene.presentNpcs[0].idleThresholdSeconds = 60;
        REQUIRE(npcs.ShouldInitiate("npc_a", scene, seconds(90), rng).initiate);
        REQUIRE_FALSE(npcs.ShouldInitiate("npc_b", scene, seconds(90), rng).initiate);
    }

    SECTION("absent NPC never speaks")
    {
        REQUIRE_FALSE(npcs.ShouldInitiate("npc_ghost", scene, idle, rng).initiate);
    }

    SECTION("initiative carries the rendered line and is recorded")
    {
        std::optional<NpcInitiative> initiative = npcs.CheckScene(scene, idle, rng);
        REQUIRE(initiative);
        REQUIRE(initiative->npcId == "npc_a");
        REQUIRE(initiative->npcName == "Npc A");
        REQUIRE(initiative->responseText == "Npc A says, \"Quiet day, isn't it?\"");
        REQUIRE(generator->lastTopics == ThemeTopics(DialogueTheme::FriendlyCheckIn));
        REQUIRE(sink->CountOf("NPC_INITIATED_DIALOGUE") == 1);

        std::optional<NpcInitiativeState> state = npcs.StateFor("npc_a");
        REQUIRE(state);
        REQUIRE(state->initiativeCount == 1);
        REQUIRE(state->lastInitiatedAt == clock->Now());
        REQUIRE(npcs.SessionInitiativeCount() == 1);

        nlohmann::json json = initiative->ToJson();
        REQUIRE(json["dialogue_theme"] == "friendly_check_in");
        REQUIRE(json["npc_initiated"] == true);
    }

    SECTION("scene order decides who speaks next")
    {
        REQUIRE(npcs.CheckScene(scene, idle, rng)->npcId == "npc_a");
        REQUIRE(npcs.CheckScene(scene, idle, rng)->npcId == "npc_b");
        REQUIRE_FALSE(npcs.CheckScene(scene, idle, rng));
    }
}

TEST_CASE("IdleNpcManager session cap")
{
    auto clock = MakeManualClock();
    IdleNpcSettings settings;
    settings.maxInitiativesPerSession = 2;
    IdleNpcManager npcs(settings, clock, std::make_shared<FakeDialogueGenerator>());
    RandomSource rng(5);

    SceneContext scene = MakeScene();
    for (char const* id : {"npc_a", "npc_b", "npc_c"})
        scene.presentNpcs.push_back(MakeNpc(id, "friendly"));

    REQUIRE(npcs.CheckScene(scene, seconds(600), rng));
    REQUIRE(npcs.CheckScene(scene, seconds(600), rng));
    REQUIRE_FALSE(npcs.ShouldInitiate("npc_c", scene, seconds(600), rng).initiate);
    REQUIRE_FALSE(npcs.CheckScene(scene, seconds(600), rng));
    REQUIRE(npcs.SessionInitiativeCount() == 2);
}

TEST_CASE("IdleNpcManager generator failures")
{
    auto clock = MakeManualClock();
    auto generator = std::make_shared<FakeDialogueGenerator>();
    IdleNpcManager npcs(IdleNpcSettings(), clock, generator);
    RandomSource rng(5);
    // Past the eight-minute mark nobody holds back.
    Duration idle = seconds(500);

    SceneContext scene = MakeScene();
    scene.presentNpcs.push_back(MakeNpc("npc_a", "friendly"));
    scene.presentNpcs.push_back(MakeNpc("npc_b", "friendly"));

    SECTION("throwing generator leaves the cooldown alone")
    {
        generator->throwOnGenerate = true;
        REQUIRE_FALSE(npcs.GenerateInitiative("npc_a", DialogueTheme::FriendlyCheckIn, scene));
        REQUIRE_FALSE(npcs.StateFor("npc_a"));
        REQUIRE(npcs.SessionInitiativeCount() == 0);
        REQUIRE(npcs.GetStatistics()["generator_failures"] == 1);

        generator->throwOnGenerate = false;
        REQUIRE(npcs.ShouldInitiate("npc_a", scene, idle, rng).initiate);
    }

    SECTION("blank dialogue counts as a failure")
    {
        generator->reply = "   ";
        REQUIRE_FALSE(npcs.GenerateInitiative("npc_a", DialogueTheme::FriendlyCheckIn, scene));
        REQUIRE(npcs.GetStatistics()["generator_failures"] == 1);
    }

    SECTION("a failed check cycle does not move on to the next NPC")
    {
        generator->throwOnGenerate = true;
        REQUIRE_FALSE(npcs.CheckScene(scene, idle, rng));
        REQUIRE(generator->calls == 1);
        REQUIRE(generator->lastNpcId == "npc_a");
    }

    SECTION("no generator attached")
    {
        IdleNpcManager silent(IdleNpcSettings(), clock, nullptr);
        REQUIRE_FALSE(silent.CheckScene(scene, idle, rng));
    }
}

TEST_CASE("SelectDialogueTheme")
{
    SceneContext scene = MakeScene();

    SECTION("world trouble comes first")
    {
        scene.worldState.politicalStability = "Rebellion";
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "shy"), scene) == DialogueTheme::WorldEventsConcern);
    }

    SECTION("personality")
    {
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "helpful"), scene) == DialogueTheme::FriendlyCheckIn);
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "scholarly"), scene) == DialogueTheme::LocalKnowledge);
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "inquisitive"), scene) == DialogueTheme::CuriousObservation);
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "merchant"), scene) == DialogueTheme::ProfessionalInquiry);
    }

    SECTION("reputation decides for reserved NPCs")
    {
        scene.playerContext.reputationSummary = "Widely disliked in the village";
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "gruff"), scene) == DialogueTheme::ConcernForPlayer);
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "friendly"), scene) == DialogueTheme::FriendlyCheckIn);
    }

    SECTION("reserved NPCs talk about the weather")
    {
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "shy"), scene) == DialogueTheme::WeatherComment);
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "gruff"), scene) == DialogueTheme::WeatherComment);
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "suspicious"), scene) == DialogueTheme::WeatherComment);
        std::vector<std::string> const topics = {"casual_conversation", "observation"};
        REQUIRE(ThemeTopics(DialogueTheme::WeatherComment) == topics);
    }

    SECTION("anyone else is friendly")
    {
        REQUIRE(SelectDialogueTheme(MakeNpc("npc", "bard"), scene) == DialogueTheme::FriendlyCheckIn);
    }
}

TEST_CASE("InitiativeRate")
{
    IdleNpcSettings settings;
    SceneContext scene = MakeScene();
    Duration idle = seconds(200);

    SECTION("temperament sets the base chance")
    {
        REQUIRE(InitiativeRate(MakeNpc("npc", "curious"), scene, idle, settings) == Approx(0.9));
        REQUIRE(InitiativeRate(MakeNpc("npc", "friendly"), scene, idle, settings) == Approx(0.8));
        REQUIRE(InitiativeRate(MakeNpc("npc", "wise"), scene, idle, settings) == Approx(0.6));
        REQUIRE(InitiativeRate(MakeNpc("npc", "shy"), scene, idle, settings) == Approx(0.3));
        REQUIRE(InitiativeRate(MakeNpc("npc", "gruff"), scene, idle, settings) == Approx(0.2));
        REQUIRE(InitiativeRate(MakeNpc("npc", "bard"), scene, idle, settings) == Approx(0.5));
    }

    SECTION("reputation")
    {
        scene.playerContext.reputationSummary = "Respected by the guild";
        REQUIRE(InitiativeRate(MakeNpc("npc", "wise"), scene, idle, settings) == Approx(0.8));
        scene.playerContext.reputationSummary = "Disliked by most villagers";
        REQUIRE(InitiativeRate(MakeNpc("npc", "wise"), scene, idle, settings) == Approx(0.3));
    }

    SECTION("unrest and aura")
    {
        scene.worldState.politicalStability = "Unrest";
        REQUIRE(InitiativeRate(MakeNpc("npc", "shy"), scene, idle, settings) == Approx(0.4));
        scene.worldState.politicalStability = "war";
        scene.playerContext.locationAura = "friendly";
        REQUIRE(InitiativeRate(MakeNpc("npc", "shy"), scene, idle, settings) == Approx(0.4));
        scene.playerContext.locationAura = "ominous";
        REQUIRE(InitiativeRate(MakeNpc("npc", "shy"), scene, idle, settings) == Approx(0.1));
    }

    SECTION("clamped to [0, 1]")
    {
        scene.playerContext.reputationSummary = "despised";
        scene.playerContext.locationAura = "ominous";
        REQUIRE(InitiativeRate(MakeNpc("npc", "gruff"), scene, idle, settings) == 0.0);
        scene.playerContext.reputationSummary = "well liked";
        scene.playerContext.locationAura = "friendly";
        REQUIRE(InitiativeRate(MakeNpc("npc", "curious"), scene, idle, settings) == 1.0);
    }

    SECTION("long idle forces the issue")
    {
        scene.playerContext.reputationSummary = "despised";
        scene.playerContext.locationAura = "ominous";
        REQUIRE(InitiativeRate(MakeNpc("npc", "gruff"), scene, seconds(480), settings) == 0.0);
        REQUIRE(InitiativeRate(MakeNpc("npc", "gruff"), scene, seconds(481), settings) == 1.0);
    }
}

TEST_CASE("IdleNpcManager initiative rolls")
{
    auto clock = MakeManualClock();
    auto generator = std::make_shared<FakeDialogueGenerator>();
    IdleNpcManager npcs(IdleNpcSettings(), clock, generator);

    SceneContext scene = MakeScene();
    scene.playerContext.reputationSummary = "Despised in these parts";
    scene.playerContext.locationAura = "ominous";
    scene.presentNpcs.push_back(MakeNpc("npc_miller", "gruff"));

    SECTION("an unwilling NPC stays quiet on every roll")
    {
        RandomSource rng(99);
        for (int i = 0; i < 20; ++i)
            REQUIRE_FALSE(npcs.ShouldInitiate("npc_miller", scene, seconds(300), rng).initiate);
        REQUIRE_FALSE(npcs.CheckScene(scene, seconds(300), rng));
        REQUIRE(generator->calls == 0);
    }

    SECTION("eight quiet minutes make even them speak")
    {
        RandomSource rng(99);
        std::optional<NpcInitiative> initiative = npcs.CheckScene(scene, seconds(481), rng);
        REQUIRE(initiative);
        REQUIRE(initiative->npcId == "npc_miller");
        REQUIRE(initiative->theme == DialogueTheme::WeatherComment);
    }

    SECTION("the same seed makes the same choices")
    {
        SceneContext mixed = MakeScene();
        mixed.presentNpcs.push_back(MakeNpc("npc_a", "shy"));
        mixed.presentNpcs.push_back(MakeNpc("npc_b", "wise"));

        IdleNpcManager other(IdleNpcSettings(), clock, generator);
        RandomSource first(1234);
        RandomSource second(1234);
        for (int i = 0; i < 10; ++i)
        {
            REQUIRE(npcs.ShouldInitiate("npc_a", mixed, seconds(200), first).initiate ==
                    other.ShouldInitiate("npc_a", mixed, seconds(200), second).initiate);
            REQUIRE(npcs.ShouldInitiate("npc_b", mixed, seconds(200), first).initiate ==
                    other.ShouldInitiate("npc_b", mixed, seconds(200), second).initiate);
        }
    }
}
