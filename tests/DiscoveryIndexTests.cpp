#include <catch2/catch.hpp>

#include "DiscoveryIndex.hpp"
#include "FakePlugin.hpp"

#include <atomic>
#include <thread>

using namespace MAESTRO;
using namespace MAESTRO::Testing;

namespace
{
    std::vector<std::string> Identities(const std::vector<QueryCandidate>& Candidates)
    {
        std::vector<std::string> Result;
        for (const auto& Candidate : Candidates)
        {
            Result.push_back(Candidate.Identity);
        }
        return Result;
    }
} // namespace

TEST_CASE("Goal fragments are derived from verbs and keywords", "[discovery]")
{
    const auto FRAGMENTS = DiscoveryIndex::ExtractGoalFragments("Analyze performance metrics and process data");

    const std::vector<std::string> EXPECTED = {
        "analyze data", "analyze performance", "monitor performance", "optimize performance", "process data", "transform data",
    };
    REQUIRE(FRAGMENTS == EXPECTED);
}

TEST_CASE("Text without verbs or keywords yields no fragments", "[discovery]")
{
    REQUIRE(DiscoveryIndex::ExtractGoalFragments("Computes statistics summary of numbers").empty());
}

TEST_CASE("Fragment relevance grows with the number of words", "[discovery]")
{
    REQUIRE(DiscoveryIndex::GetFragmentRelevance("troubleshoot") == Approx(1.0 / 3.0));
    REQUIRE(DiscoveryIndex::GetFragmentRelevance("process data") == Approx(2.0 / 3.0));
    REQUIRE(DiscoveryIndex::GetFragmentRelevance("process raw sensor data") == Approx(1.0));
}

TEST_CASE("The natural summary combines category, description and capabilities", "[discovery]")
{
    auto Descriptor         = MakeDescriptor("Collector", "Collects records", {}, {}, 0.0, "data");
    Descriptor.Capabilities = { "collect", "store" };
    REQUIRE(DiscoveryIndex::GenerateSummary(Descriptor) == "This is a data plugin that collects records. It can collect, store.");

    PluginDescriptor Empty;
    Empty.Identity = "Blank";
    Empty.Category = "";
    REQUIRE(DiscoveryIndex::GenerateSummary(Empty) == "Plugin Blank provides extended functionality.");
}

TEST_CASE("A goal without any overlap returns an empty list", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE(Index.Query("xyz_unmatched_goal", 5).empty());

    REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data records", {}, { "data" })));
    REQUIRE(Index.Index(MakeDescriptor("Stats", "Computes statistics summary of numbers", {}, {})));
    REQUIRE(Index.Query("xyz_unmatched_goal", 5).empty());
}

TEST_CASE("Empty goals and non-positive limits return nothing", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data records", {}, { "data" })));

    REQUIRE(Index.Query("", 5).empty());
    REQUIRE(Index.Query("   ", 5).empty());
    REQUIRE(Index.Query("process data", 0).empty());
    REQUIRE(Index.Query("process data", -1).empty());
    REQUIRE(Index.Query("process data", 5).size() == 1);
}

TEST_CASE("Direct matches are ranked with one result per plugin", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE(Index.Index(MakeDescriptor("Beta", "Process data records", {}, { "data" })));
    REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data records", {}, { "data" })));
    REQUIRE(Index.Index(MakeDescriptor("Stats", "Computes statistics summary of numbers", {}, {})));

    const auto CANDIDATES = Index.Query("Process   DATA", 5);
    REQUIRE(Identities(CANDIDATES) == std::vector<std::string> { "Alpha", "Beta" });
    for (const auto& Candidate : CANDIDATES)
    {
        REQUIRE(Candidate.Match == EMatchKind::Direct);
        REQUIRE(Candidate.Relevance == Approx(2.0 / 3.0));
    }

    SECTION("the limit bounds the result")
    {
        REQUIRE(Identities(Index.Query("process data", 1)) == std::vector<std::string> { "Alpha" });
    }

    SECTION("the restriction is applied before the limit")
    {
        REQUIRE(Identities(Index.Query("process data", 1, { "Beta" })) == std::vector<std::string> { "Beta" });
    }

    SECTION("the first word of the goal matches on its own")
    {
        REQUIRE(Identities(Index.Query("process invoices", 5)) == std::vector<std::string> { "Alpha", "Beta" });
    }
}

TEST_CASE("Recorded outcomes reorder otherwise equal candidates", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data records", {}, { "data" })));
    REQUIRE(Index.Index(MakeDescriptor("Beta", "Process data records", {}, { "data" })));

    SECTION("a failure ranks a plugin lower")
    {
        Index.RecordOutcome("Alpha", false, 1.0);
        REQUIRE(Identities(Index.Query("process data", 5)) == std::vector<std::string> { "Beta", "Alpha" });

        // More successes for the leader never move it down
        Index.RecordOutcome("Beta", true, 1.0);
        REQUIRE(Identities(Index.Query("process data", 5)) == std::vector<std::string> { "Beta", "Alpha" });
    }

    SECTION("usage breaks ties between equal success rates")
    {
        Index.RecordOutcome("Beta", true, 0.5);
        REQUIRE(Identities(Index.Query("process data", 5)) == std::vector<std::string> { "Beta", "Alpha" });
    }
}

TEST_CASE("Keyword overlap is the fallback when nothing matches directly", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data records", {}, { "data" })));
    REQUIRE(Index.Index(MakeDescriptor("Stats", "Computes statistics summary of numbers", {}, {})));

    const auto CANDIDATES = Index.Query("statistics summary", 5);
    REQUIRE(CANDIDATES.size() == 1);
    REQUIRE(CANDIDATES.front().Identity == "Stats");
    REQUIRE(CANDIDATES.front().Match == EMatchKind::Fuzzy);
    REQUIRE(CANDIDATES.front().Relevance == Approx(DiscoveryIndex::Defaults::FUZZY_RELEVANCE_CAP));

    const auto PARTIAL = Index.Query("statistics of weather", 5);
    REQUIRE(PARTIAL.size() == 1);
    REQUIRE(PARTIAL.front().Relevance == Approx(0.25));
}

TEST_CASE("Outcomes update running statistics", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data records", {}, { "data" })));

    Index.RecordOutcome("Alpha", true, 1.0);
    Index.RecordOutcome("Alpha", false, 3.0);

    const auto STATISTICS = Index.GetStatistics("Alpha");
    REQUIRE(STATISTICS);
    REQUIRE(STATISTICS->UsageCount == 2);
    REQUIRE(STATISTICS->SuccessRate == Approx(0.5));
    REQUIRE(STATISTICS->AverageExecutionTime == Approx(2.0));
}

TEST_CASE("Outcomes of unknown plugins are ignored", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE_NOTHROW(Index.RecordOutcome("Ghost", true, 1.0));
    REQUIRE_FALSE(Index.GetStatistics("Ghost"));
    REQUIRE(Index.GetIndexedPlugins().empty());
}

TEST_CASE("Re-indexing replaces metadata and keeps statistics", "[discovery]")
{
    TemporaryDatabase Database;
    DiscoveryIndex    Index(Database.GetPath());

    const auto DESCRIPTOR = MakeDescriptor("Alpha", "Process data records", {}, { "data" });
    REQUIRE(Index.Index(DESCRIPTOR));
    Index.RecordOutcome("Alpha", true, 2.0);

    const auto COUNT_MAPPINGS = [&Database]()
    {
        sqlite::database Inspector(Database.GetPath());
        int              Count = 0;
        Inspector << "SELECT COUNT(*) FROM goal_mappings WHERE plugin_name = ?;" << std::string("Alpha") >> Count;
        return Count;
    };

    const auto MAPPINGS_BEFORE = COUNT_MAPPINGS();
    const auto RANKING_BEFORE  = Identities(Index.Query("process data", 5));

    REQUIRE(Index.Index(DESCRIPTOR));

    REQUIRE(COUNT_MAPPINGS() == MAPPINGS_BEFORE);
    REQUIRE(Identities(Index.Query("process data", 5)) == RANKING_BEFORE);
    REQUIRE(Index.GetIndexedPlugins() == std::vector<std::string> { "Alpha" });
    REQUIRE(Index.GetStatistics("Alpha")->UsageCount == 1);

    SECTION("a changed description replaces the fragments")
    {
        REQUIRE(Index.Index(MakeDescriptor("Alpha", "Monitor servers", {}, {})));
        REQUIRE(Index.Query("process data", 5).empty());
        REQUIRE(Identities(Index.Query("monitor servers", 5)) == std::vector<std::string> { "Alpha" });
        REQUIRE(Index.GetStatistics("Alpha")->UsageCount == 1);
    }
}

TEST_CASE("The index persists across reopening", "[discovery]")
{
    TemporaryDatabase Database;

    {
        DiscoveryIndex Index(Database.GetPath());
        REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data records", {}, { "data" })));
        Index.RecordOutcome("Alpha", false, 4.0);
    }

    DiscoveryIndex Reopened(Database.GetPath());
    REQUIRE(Reopened.GetIndexedPlugins() == std::vector<std::string> { "Alpha" });
    REQUIRE(Identities(Reopened.Query("process data", 5)) == std::vector<std::string> { "Alpha" });

    const auto STATISTICS = Reopened.GetStatistics("Alpha");
    REQUIRE(STATISTICS);
    REQUIRE(STATISTICS->UsageCount == 1);
    REQUIRE(STATISTICS->SuccessRate == Approx(0.0));
}

TEST_CASE("Descriptors are stored with their relationships", "[discovery]")
{
    DiscoveryIndex Index;

    auto Descriptor              = MakeDescriptor("Analyzer", "Analyze data records", { "data" }, { "report" }, 0.5, "data");
    Descriptor.Tags              = { "statistics" };
    Descriptor.Capabilities      = { "compute mean" };
    Descriptor.CollaboratesWith  = { "Collector", "Writer" };
    Descriptor.AutoChainEligible = true;
    REQUIRE(Index.Index(Descriptor));

    const auto STORED = Index.GetDescriptor("Analyzer");
    REQUIRE(STORED);
    REQUIRE(STORED->Description == Descriptor.Description);
    REQUIRE(STORED->Category == "data");
    REQUIRE(STORED->Tags == Descriptor.Tags);
    REQUIRE(STORED->Capabilities == Descriptor.Capabilities);
    REQUIRE(STORED->InputTypes == Descriptor.InputTypes);
    REQUIRE(STORED->OutputTypes == Descriptor.OutputTypes);
    REQUIRE(STORED->CollaboratesWith == Descriptor.CollaboratesWith);
    REQUIRE(STORED->ChainPriority == Approx(0.5));
    REQUIRE(STORED->AutoChainEligible);

    REQUIRE(Index.GetCollaborators("Analyzer") == std::vector<std::string> { "Collector", "Writer" });
    REQUIRE_FALSE(Index.GetDescriptor("Missing"));
}

TEST_CASE("Removed plugins can no longer be found", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data records", {}, { "data" })));

    REQUIRE(Index.Remove("Alpha"));
    REQUIRE_FALSE(Index.Remove("Alpha"));
    REQUIRE(Index.Query("process data", 5).empty());
    REQUIRE(Index.GetIndexedPlugins().empty());
}

TEST_CASE("Plugins without an identity are not indexed", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE_FALSE(Index.Index(MakeDescriptor("", "Process data records", {}, {})));
}

TEST_CASE("A failed re-index leaves the previous entry intact", "[discovery]")
{
    TemporaryDatabase Database;
    DiscoveryIndex    Index(Database.GetPath());

    REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data into tables", {}, { "data" })));

    sqlite::database Inspector(Database.GetPath());
    const auto       COUNT_MAPPINGS = [&Inspector]()
    {
        int Count = 0;
        Inspector << "SELECT COUNT(*) FROM goal_mappings WHERE plugin_name = ?;" << std::string("Alpha") >> Count;
        return Count;
    };
    const auto MAPPINGS_BEFORE = COUNT_MAPPINGS();

    // Makes the insert of one of the new fragments fail halfway through the re-index
    Inspector << "CREATE TRIGGER reject_reports BEFORE INSERT ON goal_mappings WHEN NEW.goal_pattern = 'generate report' "
                 "BEGIN SELECT RAISE(ABORT, 'rejected'); END;";

    REQUIRE_FALSE(Index.Index(MakeDescriptor("Alpha", "Process data into a report", {}, { "data", "report" })));

    REQUIRE(COUNT_MAPPINGS() == MAPPINGS_BEFORE);
    REQUIRE(Index.GetDescriptor("Alpha")->Description == "Process data into tables");
    REQUIRE(Identities(Index.Query("transform data", 5)) == std::vector<std::string> { "Alpha" });
    REQUIRE(Index.Query("generate report", 5).empty());

    SECTION("the index stays writable")
    {
        Inspector << "DROP TRIGGER reject_reports;";
        REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data into a report", {}, { "data", "report" })));
        REQUIRE(Identities(Index.Query("generate report", 5)) == std::vector<std::string> { "Alpha" });
    }
}

TEST_CASE("Queries never see a plugin halfway through re-indexing", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE(Index.Index(MakeDescriptor("Alpha", "Process data records", {}, { "data" })));

    std::atomic<bool> IsDone { false };
    std::atomic<int>  FailedIndexes { 0 };
    std::thread       Writer(
        [&]()
        {
            for (int Round = 0; Round < 200; ++Round)
            {
                const auto DESCRIPTION = Round % 2 == 0 ? "Process data records" : "Process data rows and tables";
                if (!Index.Index(MakeDescriptor("Alpha", DESCRIPTION, {}, { "data" })))
                {
                    ++FailedIndexes;
                }
                Index.RecordOutcome("Alpha", true, 0.1);
            }
            IsDone = true;
        });

    int EmptyQueries = 0;
    int Queries      = 0;
    while (!IsDone || Queries == 0)
    {
        if (Index.Query("process data", 5).empty())
        {
            ++EmptyQueries;
        }
        ++Queries;
    }
    Writer.join();

    REQUIRE(FailedIndexes == 0);
    REQUIRE(EmptyQueries == 0);
    REQUIRE(Index.GetStatistics("Alpha")->UsageCount == 200);
}

TEST_CASE("Suggestions are phrased for the number of matches", "[discovery]")
{
    DiscoveryIndex Index;

    SECTION("no match offers a wider search")
    {
        REQUIRE(Index.GetSuggestionsText("fold laundry") ==
                "I couldn't find any plugins specifically for 'fold laundry'. Would you like me to search for related capabilities?");
    }

    SECTION("a single match offers to activate it")
    {
        const auto DESCRIPTOR = MakeDescriptor("Alpha", "Process data records", {}, { "data" }, 0.0, "data");
        REQUIRE(Index.Index(DESCRIPTOR));

        REQUIRE(Index.GetSuggestionsText("process data") == "I found 1 plugin that can help with 'process data': **Alpha** - " +
                                                                DiscoveryIndex::GenerateSummary(DESCRIPTOR) + " Want to activate it?");
    }

    SECTION("several matches list the best three")
    {
        for (const auto& Identity : { "Alpha", "Beta", "Delta", "Gamma" })
        {
            REQUIRE(Index.Index(MakeDescriptor(Identity, "Process data records", {}, { "data" })));
        }
        const auto SUMMARY = DiscoveryIndex::GenerateSummary(MakeDescriptor("Alpha", "Process data records", {}, { "data" }));

        const auto TEXT = Index.GetSuggestionsText("process data");
        REQUIRE_THAT(TEXT, Catch::StartsWith("I found 4 plugins that can help with 'process data':\n\n1. **Alpha** - " + SUMMARY + " (0.7 relevance)\n2. **Beta**"));
        REQUIRE_THAT(TEXT, Catch::Contains("3. **Delta**"));
        REQUIRE_THAT(TEXT, !Catch::Contains("**Gamma**"));
        REQUIRE_THAT(TEXT, Catch::EndsWith("\n\n...and 1 more. Which one would you like to use?"));

        REQUIRE(Index.Remove("Gamma"));
        REQUIRE_THAT(Index.GetSuggestionsText("process data"), Catch::EndsWith(" relevance)\n\nWhich one would you like to activate?"));
    }
}

TEST_CASE("The goal history keeps the latest goals", "[discovery]")
{
    DiscoveryIndex Index;
    REQUIRE(Index.GetGoalHistory().empty());

    const auto ASKED = DiscoveryIndex::Defaults::GOAL_HISTORY_SIZE + 2;
    for (std::size_t Goal = 0; Goal < ASKED; ++Goal)
    {
        Index.GetSuggestionsText("goal " + std::to_string(Goal));
    }

    const auto HISTORY = Index.GetGoalHistory();
    REQUIRE(HISTORY.size() == DiscoveryIndex::Defaults::GOAL_HISTORY_SIZE);
    REQUIRE(HISTORY.front().Goal == "goal 2");
    REQUIRE(HISTORY.back().Goal == "goal " + std::to_string(ASKED - 1));
    REQUIRE_THAT(HISTORY.back().Timestamp, Catch::EndsWith("Z"));

    const auto JENTRY = HISTORY.back().ToJson();
    REQUIRE(JENTRY.at(U("goal")).as_string() == HISTORY.back().Goal);
    REQUIRE(JENTRY.at(U("timestamp")).as_string() == HISTORY.back().Timestamp);
}
