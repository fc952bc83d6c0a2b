#include "DiscoveryIndex.hpp"
#include "Timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>

using namespace MAESTRO;

namespace
{
    /// @brief Related goals of keywords that often appear in plugin descriptions
    const std::vector<std::pair<std::string, std::vector<std::string>>> KEYWORD_GOALS = {
        { "performance", { "analyze performance", "optimize performance", "monitor performance" } },
        { "test", { "run tests", "generate tests", "validate code" } },
        { "debug", { "debug code", "find errors", "troubleshoot" } },
        { "code", { "generate code", "refactor code", "analyze code" } },
        { "data", { "process data", "analyze data", "transform data" } },
        { "file", { "manage files", "process files", "organize files" } },
        { "report", { "generate report", "publish report" } },
    };

    std::string ToLower(std::string Text)
    {
        std::transform(Text.begin(), Text.end(), Text.begin(), [](const unsigned char Character) { return static_cast<char>(std::tolower(Character)); });
        return Text;
    }

    std::vector<std::string> SplitWords(const std::string& Text)
    {
        std::vector<std::string> Words;
        std::istringstream       TextStream(Text);
        std::string              Word;
        while (TextStream >> Word)
        {
            Words.push_back(Word);
        }
        return Words;
    }

    /// @brief Lowercase the goal, turn punctuation into spaces and collapse runs of whitespace
    std::string NormalizeGoal(const std::string& Goal)
    {
        auto GoalLower = ToLower(Goal);
        std::replace_if(
            GoalLower.begin(), GoalLower.end(), [](const unsigned char Character) { return !std::isalnum(Character) && Character != '_'; }, ' ');

        std::string Normalized;
        for (const auto& Word : SplitWords(GoalLower))
        {
            if (!Normalized.empty())
            {
                Normalized += ' ';
            }
            Normalized += Word;
        }
        return Normalized;
    }

    std::vector<std::string> ParseStrings(const std::string& JsonText)
    {
        try
        {
            return StringsFromJson(web::json::value::parse(JsonText));
        }
        catch (const web::json::json_exception& Exception)
        {
            std::cerr << "Malformed json array in the discovery index: " << Exception.what() << std::endl;
            return {};
        }
    }

    bool IsAllowed(const std::string& Identity, const std::vector<std::string>& RestrictTo)
    {
        return RestrictTo.empty() || std::find(RestrictTo.begin(), RestrictTo.end(), Identity) != RestrictTo.end();
    }

    /**
     * @brief Rolls the open transaction back when it goes out of scope without Commit being called. The caller must hold the
     * database lock exclusively for the lifetime of the transaction.
     */
    class ScopedTransaction final
    {
    public:
        explicit ScopedTransaction(sqlite::database& Database)
            : m_Database(Database)
        {
            m_Database << "BEGIN;";
        }

        ~ScopedTransaction()
        {
            if (m_IsCommitted)
            {
                return;
            }

            try
            {
                m_Database << "ROLLBACK;";
            }
            catch (const sqlite::sqlite_exception& Exception)
            {
                std::cerr << "Failed to roll back a discovery index transaction: " << Exception.what() << std::endl;
            }
        }

        ScopedTransaction(const ScopedTransaction&)            = delete;
        ScopedTransaction& operator=(const ScopedTransaction&) = delete;

        void Commit()
        {
            m_Database << "COMMIT;";
            m_IsCommitted = true;
        }

    private:
        sqlite::database& m_Database;
        bool              m_IsCommitted = false;
    };

    std::string PrepareDatabaseFile(const std::string& DatabaseFile)
    {
        // Create the database directories if they don't exist
        if (DatabaseFile != DiscoveryIndex::Defaults::DATABASE_FILE)
        {
            if (const auto PARENT_PATH = std::filesystem::path(DatabaseFile).parent_path(); !PARENT_PATH.empty())
            {
                std::filesystem::create_directories(PARENT_PATH);
            }
        }
        return DatabaseFile;
    }
} // namespace

web::json::value QueryCandidate::ToJson() const
{
    web::json::value JCandidate      = web::json::value::object();
    JCandidate[U("plugin_name")]     = web::json::value::string(Identity);
    JCandidate[U("description")]     = web::json::value::string(Description);
    JCandidate[U("natural_summary")] = web::json::value::string(Summary);
    JCandidate[U("category")]        = web::json::value::string(Category);
    JCandidate[U("tags")]            = StringsToJson(Tags);
    JCandidate[U("relevance_score")] = web::json::value::number(Relevance);
    JCandidate[U("success_rate")]    = web::json::value::number(SuccessRate);
    JCandidate[U("usage_count")]     = web::json::value::number(UsageCount);
    JCandidate[U("match")]           = web::json::value::string(Match == EMatchKind::Direct ? U("direct") : U("fuzzy"));
    return JCandidate;
}

web::json::value GoalHistoryEntry::ToJson() const
{
    web::json::value JEntry  = web::json::value::object();
    JEntry[U("goal")]        = web::json::value::string(Goal);
    JEntry[U("timestamp")]   = web::json::value::string(Timestamp);
    return JEntry;
}

DiscoveryIndex::DiscoveryIndex(const std::string& DatabaseFile)
    : m_Database(PrepareDatabaseFile(DatabaseFile))
{
    CreateSchema();
}

void DiscoveryIndex::CreateSchema()
{
    m_Database << "CREATE TABLE IF NOT EXISTS plugin_metadata ("
                  "plugin_name TEXT PRIMARY KEY, "
                  "description TEXT NOT NULL DEFAULT '', "
                  "natural_summary TEXT NOT NULL DEFAULT '', "
                  "capabilities TEXT NOT NULL DEFAULT '[]', "
                  "tags TEXT NOT NULL DEFAULT '[]', "
                  "input_types TEXT NOT NULL DEFAULT '[]', "
                  "output_types TEXT NOT NULL DEFAULT '[]', "
                  "goals TEXT NOT NULL DEFAULT '[]', "
                  "category TEXT NOT NULL DEFAULT 'general', "
                  "author TEXT NOT NULL DEFAULT '', "
                  "version TEXT NOT NULL DEFAULT '1.0.0', "
                  "chain_priority REAL NOT NULL DEFAULT 0.0, "
                  "auto_chain INTEGER NOT NULL DEFAULT 0, "
                  "last_updated TEXT NOT NULL DEFAULT '', "
                  "usage_count INTEGER NOT NULL DEFAULT 0, "
                  "success_rate REAL NOT NULL DEFAULT 1.0, "
                  "avg_execution_time REAL NOT NULL DEFAULT 0.0);";

    // One row per (fragment, plugin) so re-indexing can never duplicate a mapping
    m_Database << "CREATE TABLE IF NOT EXISTS goal_mappings ("
                  "goal_pattern TEXT NOT NULL, "
                  "plugin_name TEXT NOT NULL, "
                  "relevance_score REAL NOT NULL, "
                  "usage_count INTEGER NOT NULL DEFAULT 0, "
                  "success_rate REAL NOT NULL DEFAULT 1.0, "
                  "PRIMARY KEY (goal_pattern, plugin_name));";

    m_Database << "CREATE INDEX IF NOT EXISTS goal_mappings_plugin ON goal_mappings (plugin_name);";

    m_Database << "CREATE TABLE IF NOT EXISTS plugin_relationships ("
                  "plugin_a TEXT NOT NULL, "
                  "plugin_b TEXT NOT NULL, "
                  "relationship_type TEXT NOT NULL DEFAULT 'collaborates', "
                  "strength REAL NOT NULL DEFAULT 1.0, "
                  "PRIMARY KEY (plugin_a, plugin_b, relationship_type));";
}

bool DiscoveryIndex::Index(const PluginDescriptor& Descriptor)
{
    if (Descriptor.Identity.empty())
    {
        std::cerr << "Cannot index a plugin without an identity" << std::endl;
        return false;
    }

    const auto NATURAL_SUMMARY = GenerateSummary(Descriptor);

    // The goals are derived from everything the plugin says about itself
    std::string GoalSource = Descriptor.Description + " " + NATURAL_SUMMARY;
    for (const auto& Tag : Descriptor.Tags)
    {
        GoalSource += " " + Tag;
    }
    const auto GOALS = ExtractGoalFragments(GoalSource);

    try
    {
        std::unique_lock<std::shared_mutex> Lock(m_DatabaseMutex);
        ScopedTransaction                   Transaction(m_Database);

        // Upsert the metadata. The usage statistics are left untouched
        m_Database << "INSERT INTO plugin_metadata "
                      "(plugin_name, description, natural_summary, capabilities, tags, input_types, output_types, goals, category, author, version, "
                      "chain_priority, auto_chain, last_updated) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
                      "ON CONFLICT(plugin_name) DO UPDATE SET "
                      "description = excluded.description, natural_summary = excluded.natural_summary, capabilities = excluded.capabilities, "
                      "tags = excluded.tags, input_types = excluded.input_types, output_types = excluded.output_types, goals = excluded.goals, "
                      "category = excluded.category, author = excluded.author, version = excluded.version, "
                      "chain_priority = excluded.chain_priority, auto_chain = excluded.auto_chain, last_updated = excluded.last_updated;"
                   << Descriptor.Identity << Descriptor.Description << NATURAL_SUMMARY << StringsToJson(Descriptor.Capabilities).serialize()
                   << StringsToJson(Descriptor.Tags).serialize() << StringsToJson(Descriptor.InputTypes).serialize()
                   << StringsToJson(Descriptor.OutputTypes).serialize() << StringsToJson(GOALS).serialize() << Descriptor.Category << Descriptor.Author
                   << Descriptor.Version << Descriptor.ChainPriority << (Descriptor.AutoChainEligible ? 1 : 0) << CurrentTimestamp();

        // Replace the goal mappings
        m_Database << "DELETE FROM goal_mappings WHERE plugin_name = ?;" << Descriptor.Identity;
        for (const auto& Goal : GOALS)
        {
            m_Database << "INSERT INTO goal_mappings (goal_pattern, plugin_name, relevance_score) VALUES (?, ?, ?);" << Goal << Descriptor.Identity
                       << GetFragmentRelevance(Goal);
        }

        // Replace the relationships
        m_Database << "DELETE FROM plugin_relationships WHERE plugin_a = ?;" << Descriptor.Identity;
        for (const auto& Collaborator : Descriptor.CollaboratesWith)
        {
            m_Database << "INSERT INTO plugin_relationships (plugin_a, plugin_b, relationship_type) VALUES (?, ?, 'collaborates');" << Descriptor.Identity
                       << Collaborator;
        }

        Transaction.Commit();

        std::cout << "Indexed plugin " << Descriptor.Identity << " with " << GOALS.size() << " goal patterns" << std::endl;
        return true;
    }
    catch (const sqlite::sqlite_exception& Exception)
    {
        std::cerr << "Failed to index plugin " << Descriptor.Identity << ": " << Exception.what() << " (" << Exception.get_sql() << ")" << std::endl;
        return false;
    }
}

bool DiscoveryIndex::Remove(const std::string& Identity)
{
    try
    {
        std::unique_lock<std::shared_mutex> Lock(m_DatabaseMutex);

        int PluginCount = 0;
        m_Database << "SELECT COUNT(*) FROM plugin_metadata WHERE plugin_name = ?;" << Identity >> PluginCount;
        if (PluginCount <= 0)
        {
            return false;
        }

        ScopedTransaction Transaction(m_Database);
        m_Database << "DELETE FROM goal_mappings WHERE plugin_name = ?;" << Identity;
        m_Database << "DELETE FROM plugin_relationships WHERE plugin_a = ?;" << Identity;
        m_Database << "DELETE FROM plugin_metadata WHERE plugin_name = ?;" << Identity;
        Transaction.Commit();
        return true;
    }
    catch (const sqlite::sqlite_exception& Exception)
    {
        std::cerr << "Failed to remove plugin " << Identity << ": " << Exception.what() << std::endl;
        return false;
    }
}

std::vector<QueryCandidate> DiscoveryIndex::Query(const std::string& Goal, const int LIMIT, const std::vector<std::string>& RestrictTo) const
{
    const auto NORMALIZED_GOAL = NormalizeGoal(Goal);
    if (NORMALIZED_GOAL.empty() || LIMIT <= 0)
    {
        return {};
    }

    try
    {
        std::shared_lock<std::shared_mutex> Lock(m_DatabaseMutex);

        auto Candidates = QueryDirect(NORMALIZED_GOAL, RestrictTo);

        // If no direct matches, try fuzzy matching
        if (Candidates.empty())
        {
            Candidates = QueryFuzzy(NORMALIZED_GOAL, RestrictTo);
        }

        if (Candidates.size() > static_cast<std::size_t>(LIMIT))
        {
            Candidates.resize(static_cast<std::size_t>(LIMIT));
        }
        return Candidates;
    }
    catch (const sqlite::sqlite_exception& Exception)
    {
        std::cerr << "Failed to query plugins for goal '" << Goal << "': " << Exception.what() << std::endl;
        return {};
    }
}

std::vector<QueryCandidate> DiscoveryIndex::QueryDirect(const std::string& Goal, const std::vector<std::string>& RestrictTo) const
{
    // The first word alone is only a useful pattern when it is not a filler word
    const auto  WORDS      = SplitWords(Goal);
    const auto& FIRST_WORD = WORDS.front().size() > Defaults::MIN_KEYWORD_LENGTH ? WORDS.front() : Goal;

    std::vector<QueryCandidate> Candidates;
    m_Database << "SELECT pm.plugin_name, pm.description, pm.natural_summary, pm.category, pm.tags, MAX(gm.relevance_score) AS relevance, pm.success_rate, "
                  "pm.usage_count "
                  "FROM goal_mappings gm JOIN plugin_metadata pm ON pm.plugin_name = gm.plugin_name "
                  "WHERE instr(gm.goal_pattern, ?) > 0 OR instr(gm.goal_pattern, ?) > 0 "
                  "GROUP BY pm.plugin_name "
                  "ORDER BY relevance DESC, pm.success_rate DESC, pm.usage_count DESC, pm.plugin_name ASC;"
               << Goal << FIRST_WORD >>
        [&](const std::string& Identity,
            const std::string& Description,
            const std::string& NaturalSummary,
            const std::string& Category,
            const std::string& Tags,
            const double       RELEVANCE,
            const double       SUCCESS_RATE,
            const int          USAGE_COUNT)
    {
        if (!IsAllowed(Identity, RestrictTo))
        {
            return;
        }

        Candidates.push_back({ Identity, Description, NaturalSummary, Category, ParseStrings(Tags), RELEVANCE, SUCCESS_RATE, USAGE_COUNT, EMatchKind::Direct });
    };

    return Candidates;
}

std::vector<QueryCandidate> DiscoveryIndex::QueryFuzzy(const std::string& Goal, const std::vector<std::string>& RestrictTo) const
{
    // Extract keywords from the goal
    std::vector<std::string> Keywords;
    for (const auto& Word : SplitWords(Goal))
    {
        if (Word.size() > Defaults::MIN_KEYWORD_LENGTH)
        {
            Keywords.push_back(Word);
        }
    }

    if (Keywords.empty())
    {
        return {};
    }

    std::vector<QueryCandidate> Candidates;
    m_Database << "SELECT plugin_name, description, natural_summary, capabilities, tags, category, success_rate, usage_count FROM plugin_metadata;" >>
        [&](const std::string& Identity,
            const std::string& Description,
            const std::string& NaturalSummary,
            const std::string& Capabilities,
            const std::string& Tags,
            const std::string& Category,
            const double       SUCCESS_RATE,
            const int          USAGE_COUNT)
    {
        if (!IsAllowed(Identity, RestrictTo))
        {
            return;
        }

        const auto HAYSTACK = ToLower(Description + " " + NaturalSummary + " " + Capabilities + " " + Tags);

        const auto MATCHED_KEYWORDS =
            std::count_if(Keywords.begin(), Keywords.end(), [&HAYSTACK](const std::string& Keyword) { return HAYSTACK.find(Keyword) != std::string::npos; });
        if (MATCHED_KEYWORDS == 0)
        {
            return;
        }

        const double RELEVANCE = Defaults::FUZZY_RELEVANCE_CAP * static_cast<double>(MATCHED_KEYWORDS) / static_cast<double>(Keywords.size());
        Candidates.push_back({ Identity, Description, NaturalSummary, Category, ParseStrings(Tags), RELEVANCE, SUCCESS_RATE, USAGE_COUNT, EMatchKind::Fuzzy });
    };

    std::sort(Candidates.begin(),
              Candidates.end(),
              [](const QueryCandidate& A, const QueryCandidate& B)
              {
                  if (A.Relevance != B.Relevance)
                  {
                      return A.Relevance > B.Relevance;
                  }
                  if (A.SuccessRate != B.SuccessRate)
                  {
                      return A.SuccessRate > B.SuccessRate;
                  }
                  if (A.UsageCount != B.UsageCount)
                  {
                      return A.UsageCount > B.UsageCount;
                  }
                  return A.Identity < B.Identity;
              });

    return Candidates;
}

void DiscoveryIndex::RecordOutcome(const std::string& Identity, const bool SUCCESS, const double EXECUTION_TIME)
{
    try
    {
        std::shared_lock<std::shared_mutex> DatabaseLock(m_DatabaseMutex);
        std::lock_guard<std::mutex>         PluginLock(m_PluginLocks.Get(Identity));

        // Outcomes may arrive before the plugin is indexed
        const auto CURRENT = ReadStatistics(Identity);
        if (!CURRENT)
        {
            return;
        }

        const auto   NEW_USAGE_COUNT  = CURRENT->UsageCount + 1;
        const double SUCCESS_VALUE    = SUCCESS ? 1.0 : 0.0;
        const double NEW_SUCCESS_RATE = (CURRENT->SuccessRate * CURRENT->UsageCount + SUCCESS_VALUE) / NEW_USAGE_COUNT;
        const double NEW_AVERAGE_TIME = (CURRENT->AverageExecutionTime * CURRENT->UsageCount + EXECUTION_TIME) / NEW_USAGE_COUNT;

        m_Database << "UPDATE plugin_metadata SET usage_count = ?, success_rate = ?, avg_execution_time = ? WHERE plugin_name = ?;" << NEW_USAGE_COUNT
                   << NEW_SUCCESS_RATE << NEW_AVERAGE_TIME << Identity;

        m_Database << "UPDATE goal_mappings SET success_rate = (success_rate * usage_count + ?) / (usage_count + 1), usage_count = usage_count + 1 "
                      "WHERE plugin_name = ?;"
                   << SUCCESS_VALUE << Identity;
    }
    catch (const sqlite::sqlite_exception& Exception)
    {
        std::cerr << "Failed to record outcome for plugin " << Identity << ": " << Exception.what() << std::endl;
    }
}

std::optional<PluginDescriptor> DiscoveryIndex::GetDescriptor(const std::string& Identity) const
{
    try
    {
        std::shared_lock<std::shared_mutex> Lock(m_DatabaseMutex);

        std::optional<PluginDescriptor> Descriptor;
        m_Database << "SELECT description, category, tags, capabilities, author, version, input_types, output_types, chain_priority, auto_chain "
                      "FROM plugin_metadata WHERE plugin_name = ?;"
                   << Identity >>
            [&](const std::string& Description,
                const std::string& Category,
                const std::string& Tags,
                const std::string& Capabilities,
                const std::string& Author,
                const std::string& Version,
                const std::string& InputTypes,
                const std::string& OutputTypes,
                const double       CHAIN_PRIORITY,
                const int          AUTO_CHAIN)
        {
            PluginDescriptor Found;
            Found.Identity          = Identity;
            Found.Description       = Description;
            Found.Category          = Category;
            Found.Tags              = ParseStrings(Tags);
            Found.Capabilities      = ParseStrings(Capabilities);
            Found.Author            = Author;
            Found.Version           = Version;
            const auto INPUT_TYPES  = ParseStrings(InputTypes);
            const auto OUTPUT_TYPES = ParseStrings(OutputTypes);
            Found.InputTypes        = { INPUT_TYPES.begin(), INPUT_TYPES.end() };
            Found.OutputTypes       = { OUTPUT_TYPES.begin(), OUTPUT_TYPES.end() };
            Found.ChainPriority     = CHAIN_PRIORITY;
            Found.AutoChainEligible = AUTO_CHAIN != 0;
            Descriptor              = std::move(Found);
        };

        if (Descriptor)
        {
            const auto COLLABORATORS     = ReadCollaborators(Identity);
            Descriptor->CollaboratesWith = { COLLABORATORS.begin(), COLLABORATORS.end() };
        }
        return Descriptor;
    }
    catch (const sqlite::sqlite_exception& Exception)
    {
        std::cerr << "Failed to read plugin " << Identity << ": " << Exception.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<PluginStatistics> DiscoveryIndex::GetStatistics(const std::string& Identity) const
{
    try
    {
        std::shared_lock<std::shared_mutex> Lock(m_DatabaseMutex);
        return ReadStatistics(Identity);
    }
    catch (const sqlite::sqlite_exception& Exception)
    {
        std::cerr << "Failed to read statistics of plugin " << Identity << ": " << Exception.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<PluginStatistics> DiscoveryIndex::ReadStatistics(const std::string& Identity) const
{
    std::optional<PluginStatistics> Statistics;
    m_Database << "SELECT usage_count, success_rate, avg_execution_time FROM plugin_metadata WHERE plugin_name = ?;" << Identity >>
        [&Statistics](const int USAGE_COUNT, const double SUCCESS_RATE, const double AVERAGE_EXECUTION_TIME) {
            Statistics = PluginStatistics { USAGE_COUNT, SUCCESS_RATE, AVERAGE_EXECUTION_TIME };
        };
    return Statistics;
}

std::vector<std::string> DiscoveryIndex::GetCollaborators(const std::string& Identity) const
{
    try
    {
        std::shared_lock<std::shared_mutex> Lock(m_DatabaseMutex);
        return ReadCollaborators(Identity);
    }
    catch (const sqlite::sqlite_exception& Exception)
    {
        std::cerr << "Failed to read collaborators of plugin " << Identity << ": " << Exception.what() << std::endl;
        return {};
    }
}

std::vector<std::string> DiscoveryIndex::ReadCollaborators(const std::string& Identity) const
{
    std::vector<std::string> Collaborators;
    m_Database << "SELECT plugin_b FROM plugin_relationships WHERE plugin_a = ? AND relationship_type = 'collaborates' ORDER BY plugin_b;" << Identity >>
        [&Collaborators](const std::string& Collaborator) { Collaborators.push_back(Collaborator); };
    return Collaborators;
}

std::vector<std::string> DiscoveryIndex::GetIndexedPlugins() const
{
    std::vector<std::string> Plugins;
    try
    {
        std::shared_lock<std::shared_mutex> Lock(m_DatabaseMutex);
        m_Database << "SELECT plugin_name FROM plugin_metadata ORDER BY plugin_name;" >> [&Plugins](const std::string& Identity) { Plugins.push_back(Identity); };
    }
    catch (const sqlite::sqlite_exception& Exception)
    {
        std::cerr << "Failed to list indexed plugins: " << Exception.what() << std::endl;
    }
    return Plugins;
}

std::string DiscoveryIndex::GetSuggestionsText(const std::string& Goal)
{
    const auto CANDIDATES = Query(Goal, Defaults::SUGGESTION_CANDIDATES);

    {
        std::lock_guard<std::mutex> Lock(m_GoalHistoryMutex);
        m_GoalHistory.push_back({ Goal, CurrentTimestamp() });
        while (m_GoalHistory.size() > Defaults::GOAL_HISTORY_SIZE)
        {
            m_GoalHistory.pop_front();
        }
    }

    std::stringstream Text;
    if (CANDIDATES.empty())
    {
        Text << "I couldn't find any plugins specifically for '" << Goal << "'. Would you like me to search for related capabilities?";
        return Text.str();
    }

    if (CANDIDATES.size() == 1)
    {
        Text << "I found 1 plugin that can help with '" << Goal << "': **" << CANDIDATES.front().Identity << "** - " << CANDIDATES.front().Summary
             << " Want to activate it?";
        return Text.str();
    }

    Text << "I found " << CANDIDATES.size() << " plugins that can help with '" << Goal << "':\n\n";
    const auto LISTED = std::min(CANDIDATES.size(), Defaults::SUGGESTIONS_LISTED);
    for (std::size_t Position = 0; Position < LISTED; ++Position)
    {
        const auto& Candidate = CANDIDATES[Position];
        if (Position > 0)
        {
            Text << "\n";
        }
        Text << Position + 1 << ". **" << Candidate.Identity << "** - " << Candidate.Summary << " (" << std::fixed << std::setprecision(1) << Candidate.Relevance
             << " relevance)";
    }

    if (CANDIDATES.size() > LISTED)
    {
        Text << "\n\n...and " << CANDIDATES.size() - LISTED << " more. Which one would you like to use?";
    }
    else
    {
        Text << "\n\nWhich one would you like to activate?";
    }
    return Text.str();
}

std::vector<GoalHistoryEntry> DiscoveryIndex::GetGoalHistory() const
{
    std::lock_guard<std::mutex> Lock(m_GoalHistoryMutex);
    return { m_GoalHistory.begin(), m_GoalHistory.end() };
}

std::vector<std::string> DiscoveryIndex::ExtractGoalFragments(const std::string& Text)
{
    static const std::regex GOAL_PATTERN(R"(\b(analyze|optimize|generate|test|debug|monitor|manage|create|process|validate|transform)\s+(\w+))");

    const auto TEXT_LOWER = ToLower(Text);

    std::set<std::string> Goals;
    for (auto Iter = std::sregex_iterator(TEXT_LOWER.begin(), TEXT_LOWER.end(), GOAL_PATTERN); Iter != std::sregex_iterator(); ++Iter)
    {
        const std::smatch& Match = *Iter;
        Goals.insert(Match[1].str() + " " + Match[2].str());
    }

    // Add common goals based on keywords
    for (const auto& [Keyword, RelatedGoals] : KEYWORD_GOALS)
    {
        if (TEXT_LOWER.find(Keyword) != std::string::npos)
        {
            Goals.insert(RelatedGoals.begin(), RelatedGoals.end());
        }
    }

    return { Goals.begin(), Goals.end() };
}

std::string DiscoveryIndex::GenerateSummary(const PluginDescriptor& Descriptor)
{
    std::vector<std::string> SummaryParts;

    if (!Descriptor.Category.empty() && !Descriptor.Description.empty())
    {
        SummaryParts.push_back("This is a " + Descriptor.Category + " plugin that " + ToLower(Descriptor.Description));
    }
    else if (!Descriptor.Category.empty())
    {
        SummaryParts.push_back("This is a " + Descriptor.Category + " plugin");
    }
    else if (!Descriptor.Description.empty())
    {
        SummaryParts.push_back("This plugin " + ToLower(Descriptor.Description));
    }

    if (!Descriptor.Capabilities.empty())
    {
        std::string CapabilityText;
        for (const auto& Capability : Descriptor.Capabilities)
        {
            CapabilityText += (CapabilityText.empty() ? "" : ", ") + Capability;
        }
        SummaryParts.push_back("It can " + CapabilityText);
    }

    if (SummaryParts.empty())
    {
        return "Plugin " + Descriptor.Identity + " provides extended functionality.";
    }

    std::string Summary;
    for (const auto& Part : SummaryParts)
    {
        Summary += (Summary.empty() ? "" : ". ") + Part;
    }
    return Summary + ".";
}

double DiscoveryIndex::GetFragmentRelevance(const std::string& Fragment)
{
    return std::min(1.0, static_cast<double>(SplitWords(Fragment).size()) / 3.0);
}
