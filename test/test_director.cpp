#include "ollama-gm-director.h"
#include "test_fakes.h"

#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

using std::chrono::minutes;
using std::chrono::seconds;

namespace
{
struct DirectorFixture
{
    std::shared_ptr<ManualClock> clock = MakeManualClock();
    std::shared_ptr<FakeBranchHandler> branches = std::make_shared<FakeBranchHandler>();
    std::shared_ptr<FakeSummaryProvider> summaries = std::make_shared<FakeSummaryProvider>();
    std::shared_ptr<FakeDialogueGenerator> dialogue = std::make_shared<FakeDialogueGenerator>();
    std::shared_ptr<RecordingEventSink> sink = std::make_shared<RecordingEventSink>();

    DirectorCollaborators Collaborators() const
    {
        DirectorCollaborators collaborators;
        collaborators.branchHandler = branches;
        collaborators.summaryProvider = summaries;
        collaborators.dialogueGenerator = dialogue;
        collaborators.eventSink = sink;
        return collaborators;
    }
};

DecisionContext OpportunityTurn(std::string sessionId)
{
    DecisionContext context = MakeContext(std::move(sessionId));
    context.interpreterOutput = InterpreterOutput();
    context.interpreterOutput->alignedOpportunityId = std::string("haunted_mill");
    context.pendingOpportunities.push_back(OpportunityRef{"haunted_mill", "The Haunted Mill"});
    return context;
}
}

TEST_CASE("GameMasterDirector turns")
{
    DirectorFixture fixture;
    GameMasterDirector director(DirectorConfig(), fixture.Collaborators(), fixture.clock);

    SECTION("first input opens the session")
    {
        DecisionContext context = MakeContext("session-1");
        ParsedCommand look;
        look.action = "look";
        context.parsedCommand = look;

        DecisionResult result = director.HandleInput(context);
        REQUIRE(result.priorityUsed == DecisionPriority::ParsedCommand);
        REQUIRE(director.Sessions().Size() == 1);
        REQUIRE(director.Sessions().Find("session-1"));
        REQUIRE(director.GetStoryContext("session-1").pendingEvents == 1);
    }

    SECTION("invalid input never opens a session")
    {
        DecisionResult result = director.HandleInput(MakeContext("", "player-1"));
        REQUIRE(result.actionResult->outcome == ActionOutcome::Invalid);
        REQUIRE(director.Sessions().Size() == 0);
        REQUIRE(director.Engine().GetStats().validationFailures == 1);
    }

    SECTION("accepted opportunity lands in the ledger under its title")
    {
        fixture.branches->initiations["haunted_mill"] = BranchInitiation{true, "The door creaks.", std::string("b1")};
        director.HandleInput(OpportunityTurn("session-1"));

        StoryContext story = director.GetStoryContext("session-1");
        REQUIRE(story.recentEvents.size() == 1);
        REQUIRE(story.recentEvents[0].eventType == "NARRATIVE_BRANCH_INITIATED");
        REQUIRE(story.recentEvents[0].description == "Player began The Haunted Mill");
        REQUIRE(story.recentEvents[0].significance == 5);
    }

    SECTION("rejected opportunity is not a story event")
    {
        director.HandleInput(OpportunityTurn("session-1"));
        REQUIRE(director.GetStoryContext("session-1").pendingEvents == 0);
    }

    SECTION("sessions are independent")
    {
        director.HandleInput(MakeContext("session-1"));
        director.HandleInput(MakeContext("session-2"));
        std::vector<std::string> const expected = {"session-1", "session-2"};
        REQUIRE(director.Sessions().SessionIds() == expected);
        REQUIRE(director.Sessions().Find("session-1")->Seed() != director.Sessions().Find("session-2")->Seed());

        REQUIRE(director.EndSession("session-1"));
        REQUIRE_FALSE(director.EndSession("session-1"));
        REQUIRE(director.Sessions().Size() == 1);
    }
}

TEST_CASE("GameMasterDirector polls")
{
    DirectorFixture fixture;
    GameMasterDirector director(DirectorConfig(), fixture.Collaborators(), fixture.clock);

    SceneContext scene = MakeScene("session-1");

    SECTION("unknown sessions get nothing")
    {
        REQUIRE_FALSE(director.CheckAmbient(scene));
        REQUIRE_FALSE(director.CheckNpcInitiative(scene));
        REQUIRE_FALSE(director.CheckSummary("session-1"));
        REQUIRE(director.Sessions().Size() == 0);
    }

    SECTION("quiet session gets ambient narration once per cooldown")
    {
        director.HandleInput(MakeContext("session-1"));
        fixture.clock->Advance(minutes(16));

        std::optional<AmbientInjection> injection = director.CheckAmbient(scene);
        REQUIRE(injection);
        REQUIRE(injection->trigger == AmbientTrigger::TimeBased);
        REQUIRE(injection->ToJson()["source"] == "ambient");
        REQUIRE_FALSE(director.CheckAmbient(scene));
    }

    SECTION("idle NPC speaks up and is remembered")
    {
        director.HandleInput(MakeContext("session-1"));
        scene.presentNpcs.push_back(MakeNpc("npc_old_marta", "wise"));

        REQUIRE_FALSE(director.CheckNpcInitiative(scene));
        fixture.clock->Advance(seconds(481));

        std::optional<NpcInitiative> initiative = director.CheckNpcInitiative(scene);
        REQUIRE(initiative);
        REQUIRE(initiative->theme == DialogueTheme::LocalKnowledge);
        REQUIRE(fixture.sink->CountOf("NPC_INITIATED_DIALOGUE") == 1);

        StoryContext story = director.GetStoryContext("session-1");
        REQUIRE(story.pendingEvents == 1);
        REQUIRE(story.recentEvents[0].description == "Npc Old Marta initiated local_knowledge with player");
    }

    SECTION("world reactions feed the summary")
    {
        for (int i = 0; i < 10; ++i)
        {
            WorldReaction reaction;
            reaction.targetEntity = "village_elder";
            reaction.attitudeShift = true;
            reaction.description = LongDescription(200, "The elder reconsiders");
            director.RecordWorldReaction("session-1", reaction);
        }
        REQUIRE(director.Sessions().Size() == 1);

        std::optional<SummaryOutcome> outcome = director.CheckSummary("session-1");
        REQUIRE(outcome);
        REQUIRE(outcome->eventsSummarized == 10);
        REQUIRE_FALSE(outcome->usedFallback);

        StoryContext story = director.GetStoryContext("session-1");
        REQUIRE(story.HasSummary());
        REQUIRE(story.pendingEvents == 0);
        REQUIRE_FALSE(director.CheckSummary("session-1"));
    }
}

TEST_CASE("GameMasterDirector housekeeping")
{
    DirectorFixture fixture;
    GameMasterDirector director(DirectorConfig(), fixture.Collaborators(), fixture.clock);

    director.HandleInput(MakeContext("session-1"));
    fixture.clock->Advance(minutes(20));
    director.HandleInput(MakeContext("session-2"));
    fixture.clock->Advance(minutes(15));

    SECTION("stale sessions are reaped")
    {
        REQUIRE(director.ReapStaleSessions() == 1);
        REQUIRE_FALSE(director.Sessions().Find("session-1"));
        REQUIRE(director.Sessions().Find("session-2"));
    }

    SECTION("statistics cover the engine and every session")
    {
        nlohmann::json stats = director.GetStatistics();
        REQUIRE(stats["decisions"]["total_decisions"] == 2);
        REQUIRE(stats["live_sessions"] == 2);
        REQUIRE(stats["sessions"]["session-1"]["session_stale"] == true);
        REQUIRE(stats["sessions"]["session-2"]["session_stale"] == false);
        REQUIRE(stats["sessions"]["session-2"]["pacing"].contains("current_pacing_state"));
    }
}

TEST_CASE("GameMasterDirector housekeeping while a session is busy")
{
    DirectorFixture fixture;
    GameMasterDirector director(DirectorConfig(), fixture.Collaborators(), fixture.clock);
    director.HandleInput(MakeContext("session-2"));

    DecisionContext look = MakeContext("session-1");
    ParsedCommand command;
    command.action = "look";
    look.parsedCommand = command;

    constexpr int kTurns = 5000;
    std::atomic<bool> done{false};
    std::thread writer([&director, &done, &look]() {
        for (int i = 0; i < kTurns; ++i)
            director.HandleInput(look);
        done = true;
    });

    size_t reaped = 0;
    while (!done)
    {
        nlohmann::json stats = director.GetStatistics();
        REQUIRE(stats["live_sessions"].get<size_t>() >= 1);
        reaped += director.ReapStaleSessions();
    }
    writer.join();

    REQUIRE(reaped == 0);
    REQUIRE(director.Engine().GetStats().total == kTurns + 1);
    REQUIRE(director.GetStoryContext("session-1").pendingEvents == static_cast<size_t>(kTurns));
    REQUIRE(director.GetStatistics()["sessions"]["session-1"]["pacing"]["interactions_last_hour"] == kTurns);
}

TEST_CASE("GameMasterDirector from a config file")
{
    DirectorFixture fixture;
    std::unique_ptr<GameMasterDirector> director = GameMasterDirector::FromConfigFile(
        std::string(DIRECTOR_TEST_DATA_DIR) + "/ollama-gm-director.json.dist", fixture.Collaborators());

    REQUIRE(director);
    REQUIRE(director->Config().randomSeed == 24301);
    REQUIRE(director->HandleInput(MakeContext("session-1")).priorityUsed == DecisionPriority::Fallback);
}
