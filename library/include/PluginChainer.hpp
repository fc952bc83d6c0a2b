#pragma once

#include <atomic>
#include <cpprest/json.h>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "AdmissionGate.hpp"
#include "DiscoveryIndex.hpp"
#include "PluginChain.hpp"
#include "PluginRegistry.hpp"

namespace MAESTRO
{
    /**
     * @brief Builds plugin chains for goals and executes them. Candidates come from the discovery index, are filtered by the
     * admission gate and are ordered so that every plugin runs after the plugins producing its inputs. Each node's output is
     * merged into a shared context that the next nodes receive as input.
     */
    class PluginChainer final
    {
    public:
        struct Defaults
        {
            /// @brief Who built a chain when the caller doesn't say
            constexpr static auto CREATED_BY = "auto_chainer";

            /// @brief The creator recorded for chains built by SuggestChains
            constexpr static auto SUGGESTED_BY = "chain_suggester";

            /// @brief The command chains invoke their plugins with
            constexpr static auto AUTO_CHAIN_COMMAND = "auto_chain";

            constexpr static auto CHAIN_ID_PREFIX = "chain_";

            /// @brief The key non-object plugin outputs are stored under in the context
            constexpr static auto RESULT_KEY = "result";

            /// @brief The key non-object initial data is stored under in the context
            constexpr static auto INPUT_KEY = "input";

            constexpr static int         SUGGESTION_CANDIDATES           = 10;
            constexpr static std::size_t MAX_SUGGESTIONS                 = 5;
            constexpr static std::size_t MAX_PENDING_SUGGESTIONS         = 20;
            constexpr static std::size_t MIN_SUGGESTION_PLUGINS          = 2;
            constexpr static double      SUGGESTION_RELEVANCE_PER_PLUGIN = 0.1;
            constexpr static double      ESTIMATED_SECONDS_PER_PLUGIN    = 2.0;
        };

        PluginChainer(PluginRegistry& Registry, DiscoveryIndex& Index, AdmissionGate& Gate);

        /**
         * @brief Build and register a chain for a goal.
         *
         * The candidates are the indexed plugins matching the goal, restricted to the available plugins. Blocked candidates are
         * dropped (their higher-confidence alternatives from the pool are tried instead) and candidates admitted with a warning are
         * noted in the chain metadata. The plugin with the highest chain priority that needs no input (or is auto-chain eligible)
         * seeds the chain; the remaining candidates are added in ranked order as soon as one of their inputs is produced by an
         * earlier plugin. Candidates whose inputs are never produced are left out.
         *
         * @param Goal The free-text goal
         * @param AvailablePlugins The plugins that may be used. Empty means every registered plugin
         * @param InputData The input data of the chain. Used when the chain is run without initial data
         * @param MODE How the chain will be executed
         * @param USER_OVERRIDE Whether the user accepted the risk of high-risk plugins
         * @param CreatedBy Who built the chain
         * @return The chain, or nullptr if no plugin matches the goal
         */
        std::shared_ptr<PluginChain> BuildChain(const std::string&              Goal,
                                                const std::vector<std::string>& AvailablePlugins = {},
                                                const web::json::value&         InputData        = web::json::value::object(),
                                                const EChainExecutionMode       MODE             = EChainExecutionMode::Default,
                                                const bool                      USER_OVERRIDE    = false,
                                                const std::string&              CreatedBy        = Defaults::CREATED_BY);

        /**
         * @brief Run a chain. Runs of the same chain are serialized.
         *
         * Before each plugin runs it is evaluated by the admission gate again; a blocked plugin aborts the run. Every execution is
         * recorded with the admission gate and the discovery index whatever its outcome. In parallel mode the outputs of a level are
         * only merged into the context once every plugin of the level succeeded.
         *
         * @param Chain The chain to run
         * @param InitialData The initial context. Null uses the input data the chain was built with
         * @param USER_OVERRIDE Whether the user accepted the risk of high-risk plugins
         * @return The final context, or the error together with the context accumulated before the failure
         */
        ChainRunResult RunChain(PluginChain& Chain, const web::json::value& InitialData = web::json::value::null(), const bool USER_OVERRIDE = false);

        /// @brief  Run a registered chain
        /// @return The run result. A NotFound error if no chain has the id
        ChainRunResult RunChain(const std::string& ChainID, const web::json::value& InitialData = web::json::value::null(), const bool USER_OVERRIDE = false);

        /**
         * @brief Run one plugin outside of a chain, with the same admission checks and bookkeeping as a chain node.
         *
         * @return The plugin's output as the context, or the error
         */
        ChainRunResult ExecutePlugin(const std::string& Identity, const std::string& Command, const web::json::value& Input, const bool USER_OVERRIDE = false);

        /**
         * @brief Suggest chains for free-form user input. The best matching plugins are grouped by category and a chain is built for
         * every group of at least two plugins. The chains are registered but not run.
         *
         * Suggested chains that were never run are pending. Only the latest Defaults::MAX_PENDING_SUGGESTIONS of them are kept,
         * older ones are cleaned up as new suggestions are made. Running a suggested chain keeps it until CleanupChain.
         *
         * @param UserInput The user input
         * @param Context The input data of the suggested chains
         * @return At most Defaults::MAX_SUGGESTIONS suggestions, most relevant first
         */
        std::vector<ChainSuggestion> SuggestChains(const std::string& UserInput, const web::json::value& Context = web::json::value::object());

        std::optional<ChainStatus> GetChainStatus(const std::string& ChainID) const;

        std::shared_ptr<PluginChain> FindChain(const std::string& ChainID) const;

        /// @brief  Remove a chain from the registry
        /// @return Whether the chain existed
        bool CleanupChain(const std::string& ChainID);

        std::vector<std::string> GetChainIDs() const;

    protected:
        /// @brief The outcome of one plugin invocation. Nothing is committed to a chain context yet
        struct NodeOutcome
        {
            web::json::value          Output = web::json::value::object();
            std::optional<ChainError> Error;
            std::string               Warning;
        };

        /// @brief Resolve, admit and execute one plugin. Never throws for plugin failures
        NodeOutcome Invoke(const std::string& Identity, const std::string& Command, const web::json::value& Input, const bool USER_OVERRIDE) const;

        ChainRunResult RunSequential(PluginChain& Chain, web::json::value Context, const bool USER_OVERRIDE) const;

        ChainRunResult RunParallel(PluginChain& Chain, web::json::value Context, const bool USER_OVERRIDE) const;

        /// @brief Merge an output object into the context field by field
        static void MergeIntoContext(web::json::value& Context, const web::json::value& Output);

        /// @brief Remember a suggested chain as pending, cleaning up the oldest pending chains beyond the limit
        void AddPendingSuggestion(const std::string& ChainID);

    private:
        PluginRegistry& m_Registry;
        DiscoveryIndex& m_DiscoveryIndex;
        AdmissionGate&  m_AdmissionGate;

        std::atomic<uint64_t> m_ChainCounter { 0 };

        mutable std::mutex                                  m_ChainsMutex;
        std::map<std::string, std::shared_ptr<PluginChain>> m_Chains;

        /// @brief Suggested chains that were never run, oldest first
        std::deque<std::string> m_PendingSuggestions;
    };

} // namespace MAESTRO
