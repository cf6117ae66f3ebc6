#include "Util/Clock.h"
#include "Util/DirectorErrors.h"
#include "Util/RandomSource.h"
#include "Util/TextTemplate.h"
#include "Util/TextUtil.h"

#include <catch2/catch.hpp>

TEST_CASE("RenderTemplate")
{
    TemplateSlots slots = {{"location_name", "The Old Mill"}, {"ambient_detail", "Dust hangs in the light"}};

    SECTION("fills every slot")
    {
        REQUIRE(RenderTemplate("Time passes quietly in {location_name}. {ambient_detail}", slots) ==
                "Time passes quietly in The Old Mill. Dust hangs in the light");
    }

    SECTION("unused slots are fine")
    {
        REQUIRE(RenderTemplate("Nothing to fill.", slots) == "Nothing to fill.");
    }

    SECTION("missing slot")
    {
        REQUIRE_THROWS_AS(RenderTemplate("{npc_name} moves about nearby.", slots), TemplatingError);
    }

    SECTION("malformed template")
    {
        REQUIRE_THROWS_AS(RenderTemplate("The {location_name air", slots), TemplatingError);
    }
}

TEST_CASE("TextUtil")
{
    SECTION("identifiers become titles")
    {
        REQUIRE(TitleFromIdentifier("npc_old_marta") == "Npc Old Marta");
        REQUIRE(TitleFromIdentifier("haunted-mill") == "Haunted Mill");
    }

    SECTION("sentence terminators collapse runs")
    {
        REQUIRE(CountSentenceTerminators("Wait... what?! Fine.") == 3);
        REQUIRE(CountSentenceTerminators("no terminator") == 0);
    }

    SECTION("tool payloads are spotted")
    {
        REQUIRE(LooksLikeJsonOrToolBlock("<tool_call>summarize</tool_call>"));
        REQUIRE(LooksLikeJsonOrToolBlock("  [1, 2]"));
        REQUIRE_FALSE(LooksLikeJsonOrToolBlock("The hero rested."));
    }

    SECTION("escapes from config files")
    {
        REQUIRE(ExpandPromptEscapes("a\\nb\\tc") == "a\nb\tc");
    }

    SECTION("word counts")
    {
        REQUIRE(CountWords("  one two\tthree\n") == 3);
        REQUIRE(CountWords("") == 0);
    }
}

TEST_CASE("RandomSource")
{
    SECTION("same seed, same stream")
    {
        RandomSource a(42);
        RandomSource b(42);
        for (int i = 0; i < 20; ++i)
            REQUIRE(a.NextInt(1, 20) == b.NextInt(1, 20));
    }

    SECTION("reseeding restarts the stream")
    {
        RandomSource rng(42);
        double first = rng.NextUnit();
        rng.NextUnit();
        rng.Reseed(42);
        REQUIRE(rng.NextUnit() == first);
    }

    SECTION("degenerate ranges")
    {
        RandomSource rng(1);
        REQUIRE(rng.PickIndex(0) == 0);
        REQUIRE(rng.PickIndex(1) == 0);
        REQUIRE(rng.NextInt(5, 5) == 5);
    }

    SECTION("per-session seeds")
    {
        REQUIRE(RandomSource::DeriveSeed(7, "session-1") == RandomSource::DeriveSeed(7, "session-1"));
        REQUIRE(RandomSource::DeriveSeed(7, "session-1") != RandomSource::DeriveSeed(7, "session-2"));
        REQUIRE(RandomSource::DeriveSeed(7, "session-1") != RandomSource::DeriveSeed(8, "session-1"));
    }
}

TEST_CASE("Clock helpers")
{
    ManualClock clock(TimePoint(std::chrono::hours(0)));
    REQUIRE(FormatUtcMinute(clock.Now()) == "1970-01-01 00:00");

    clock.Advance(std::chrono::minutes(90));
    REQUIRE(FormatUtcMinute(clock.Now()) == "1970-01-01 01:30");
    REQUIRE(FormatUtcIso(clock.Now()) == "1970-01-01T01:30:00Z");

    TimePoint later = clock.Now();
    TimePoint earlier = later - std::chrono::seconds(10);
    REQUIRE(Elapsed(earlier, later) == std::chrono::seconds(10));
    REQUIRE(Elapsed(later, earlier) == Duration::zero());
}
