#pragma once

#include "KeyedMutex.hpp"
#include "PluginDescriptor.hpp"

#include <cpprest/json.h>
#include <deque>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sqlite_modern_cpp.h>
#include <string>
#include <vector>

namespace MAESTRO
{
    /// @brief How a query candidate was reached
    enum class EMatchKind : uint8_t
    {
        /// @brief The goal matched one of the plugin's goal-pattern fragments
        Direct,

        /// @brief The goal only overlapped the plugin's description, capabilities or tags
        Fuzzy
    };

    /// @brief One ranked result of DiscoveryIndex::Query
    struct QueryCandidate final
    {
        std::string              Identity;
        std::string              Description;

        /// @brief The natural-language summary generated when the plugin was indexed
        std::string              Summary;
        std::string              Category;
        std::vector<std::string> Tags;
        double                   Relevance   = 0.0;
        double                   SuccessRate = 1.0;
        int                      UsageCount  = 0;
        EMatchKind               Match       = EMatchKind::Direct;

        web::json::value ToJson() const;
    };

    /// @brief Running usage statistics of an indexed plugin
    struct PluginStatistics final
    {
        int    UsageCount           = 0;
        double SuccessRate          = 1.0;
        double AverageExecutionTime = 0.0;
    };

    /// @brief A goal a user asked plugin suggestions for
    struct GoalHistoryEntry final
    {
        std::string Goal;
        std::string Timestamp;

        web::json::value ToJson() const;
    };

    /**
     * @brief The semantic discovery index. Persists plugin capability metadata in SQLite together with an inverted index from
     * goal-pattern fragments ("analyze performance", "process data", ...) to plugin identities, and turns free-text goals into
     * ranked, bounded lists of plugin identities.
     *
     * None of the public functions throw. Storage errors are logged and reported through the return value.
     *
     * Index and Remove rewrite their tables inside one transaction while holding the database lock exclusively, so a query never
     * sees a plugin halfway through re-indexing and a failed rewrite leaves the previous entry intact. Queries and outcome
     * recording share the lock; outcomes of the same plugin are serialized by a per-identity lock.
     */
    class DiscoveryIndex final
    {
    public:
        struct Defaults
        {
            /// @brief The database file used when none is specified. Nothing is persisted.
            constexpr static auto DATABASE_FILE = ":memory:";

            /// @brief Relevance assigned to a fuzzy match that overlaps every goal keyword. Direct matches of one word score 1/3.
            constexpr static double FUZZY_RELEVANCE_CAP = 0.5;

            /// @brief Words of this length or shorter are ignored when matching goal keywords
            constexpr static std::size_t MIN_KEYWORD_LENGTH = 2;

            /// @brief The number of goals GetGoalHistory remembers
            constexpr static std::size_t GOAL_HISTORY_SIZE = 10;

            /// @brief The number of candidates GetSuggestionsText considers and lists by name
            constexpr static int         SUGGESTION_CANDIDATES = 5;
            constexpr static std::size_t SUGGESTIONS_LISTED    = 3;
        };

        /// @brief  Open (and create if needed) the index database
        /// @param  DatabaseFile The SQLite database file
        /// @throws sqlite::sqlite_exception If the database cannot be opened or the schema cannot be created
        explicit DiscoveryIndex(const std::string& DatabaseFile = Defaults::DATABASE_FILE);

        /**
         * @brief Index (or re-index) a plugin. Goal-pattern fragments are derived from the description, a generated summary and the
         * tags. Re-indexing replaces the plugin's metadata, fragments and relationships but keeps its usage statistics.
         *
         * @param Descriptor The plugin to index
         * @return Whether the plugin was indexed
         */
        bool Index(const PluginDescriptor& Descriptor);

        /**
         * @brief Remove a plugin and all of its goal mappings and relationships from the index.
         *
         * @param Identity The plugin to remove
         * @return Whether the plugin was indexed before the call
         */
        bool Remove(const std::string& Identity);

        /**
         * @brief Rank plugins for a goal. Goal-pattern fragments containing the goal (or its first word) are direct matches, ranked by
         * relevance, success rate and usage count. Only when there are no direct matches are plugins matched on keyword overlap with their
         * description, capabilities and tags; such fuzzy matches never score above Defaults::FUZZY_RELEVANCE_CAP.
         *
         * @param Goal The free-text goal
         * @param LIMIT The maximum number of candidates to return
         * @param RestrictTo If not empty, only these identities are considered
         * @return The ranked candidates. Empty when nothing matches.
         */
        std::vector<QueryCandidate> Query(const std::string& Goal, const int LIMIT, const std::vector<std::string>& RestrictTo = {}) const;

        /**
         * @brief Record the outcome of an execution. Updates the usage count and the running averages of success rate and execution
         * time that break ties in future queries. Unknown identities are ignored.
         *
         * @param Identity The plugin that was executed
         * @param SUCCESS Whether the execution succeeded
         * @param EXECUTION_TIME The execution time in seconds
         */
        void RecordOutcome(const std::string& Identity, const bool SUCCESS, const double EXECUTION_TIME);

        /**
         * @brief Describe the plugins matching a goal in a sentence or two for the user, and remember the goal in the goal history.
         *
         * @param Goal The free-text goal
         * @return The best matching plugins with their summaries, or a message saying that nothing was found
         */
        std::string GetSuggestionsText(const std::string& Goal);

        /// @brief  The goals suggestions were asked for, oldest first. At most Defaults::GOAL_HISTORY_SIZE
        std::vector<GoalHistoryEntry> GetGoalHistory() const;

        std::optional<PluginDescriptor> GetDescriptor(const std::string& Identity) const;

        std::optional<PluginStatistics> GetStatistics(const std::string& Identity) const;

        /// @brief  Get the plugins that the given plugin declared it collaborates with
        std::vector<std::string> GetCollaborators(const std::string& Identity) const;

        std::vector<std::string> GetIndexedPlugins() const;

        /**
         * @brief Derive the goal-pattern fragments of a text: "<verb> <word>" for every action verb of the vocabulary followed by a word,
         * plus the related goals of known keywords ("data" gives "process data", "analyze data", "transform data").
         *
         * @param Text The text to derive the fragments from
         * @return The unique fragments, lowercase
         */
        static std::vector<std::string> ExtractGoalFragments(const std::string& Text);

        /// @brief  Generate the natural-language summary that is indexed alongside the description
        static std::string GenerateSummary(const PluginDescriptor& Descriptor);

        /// @brief  The relevance weight of a fragment. Longer fragments are more specific: min(1, words / 3)
        static double GetFragmentRelevance(const std::string& Fragment);

    protected:
        void CreateSchema();

        std::vector<QueryCandidate> QueryDirect(const std::string& Goal, const std::vector<std::string>& RestrictTo) const;

        std::vector<QueryCandidate> QueryFuzzy(const std::string& Goal, const std::vector<std::string>& RestrictTo) const;

        /// @brief The statement helpers below expect the caller to hold m_DatabaseMutex
        std::optional<PluginStatistics> ReadStatistics(const std::string& Identity) const;

        std::vector<std::string> ReadCollaborators(const std::string& Identity) const;

    private:
        mutable sqlite::database m_Database;

        /// @brief Exclusive for multi-statement rewrites, shared for everything else
        mutable std::shared_mutex m_DatabaseMutex;

        /// @brief Serializes read-modify-write updates of one plugin's statistics
        KeyedMutex m_PluginLocks;

        mutable std::mutex           m_GoalHistoryMutex;
        std::deque<GoalHistoryEntry> m_GoalHistory;
    };

} // namespace MAESTRO
