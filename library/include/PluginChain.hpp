#pragma once

#include <atomic>
#include <cpprest/json.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Confidence.hpp"

namespace MAESTRO
{
    /// @brief How the nodes of a chain are scheduled
    enum class EChainExecutionMode : uint8_t
    {
        /// @brief The nodes run one after the other in list order
        Sequential,

        /// @brief The nodes run level by level. The nodes of a level run concurrently
        Parallel,

        /// @brief Parallel if any node has dependencies, Sequential otherwise
        Adaptive,

        Default = Adaptive
    };

    std::string ExecutionModeToString(const EChainExecutionMode MODE);

    /// @brief  Parse an execution mode name (case-insensitive)
    /// @return The execution mode, or std::nullopt if the name is unknown
    std::optional<EChainExecutionMode> ExecutionModeFromString(const std::string& Name);

    /// @brief One plugin invocation of a chain. The plugin is resolved by identity from the registry each time the node runs
    struct ChainNode final
    {
        explicit ChainNode(const std::string& InPluginIdentity);

        std::string PluginIdentity;

        /// @brief The context the node received on its last run
        web::json::value Inputs = web::json::value::object();

        /// @brief The output of the node's last successful run
        web::json::value Outputs = web::json::value::object();

        /// @brief Identities of earlier nodes that must complete first
        std::vector<std::string> Dependencies;

        std::atomic<bool> Executed { false };

        web::json::value ToJson() const;
    };

    /// @brief An ordered, dependency-annotated set of plugin invocations produced for one goal
    struct PluginChain final
    {
        std::string                             ChainID;
        std::vector<std::unique_ptr<ChainNode>> Nodes;
        EChainExecutionMode                     ExecutionMode = EChainExecutionMode::Default;

        /// @brief The input data the chain was built with. Used when the chain is run without initial data
        web::json::value InputData = web::json::value::object();

        /// @brief goal, created_at, created_by, plugin_count, warnings and blocked candidates
        web::json::value Metadata = web::json::value::object();

        /// @brief Serializes runs of this chain
        std::mutex RunMutex;

        bool HasDependencies() const;

        /**
         * @brief Compute the execution level of every node: 0 without dependencies, otherwise one more than the highest level of
         * its dependencies.
         *
         * @return The identities of the nodes of each level, in list order
         */
        std::vector<std::vector<std::string>> CalculateLevels() const;

        ChainNode* FindNode(const std::string& PluginIdentity) const;

        std::vector<std::string> GetPluginIdentities() const;

        /// @brief  The number of nodes that were executed
        std::size_t GetExecutedCount() const;

        web::json::value ToJson() const;
    };

    enum class EChainErrorType : uint8_t
    {
        /// @brief The chain or one of its plugins does not exist
        NotFound,

        /// @brief The admission gate blocked one of the plugins
        Blocked,

        /// @brief A plugin threw while executing
        ExecutionFailure,

        /// @brief No chain could be built for the goal
        BuildFailure
    };

    std::string ChainErrorTypeToString(const EChainErrorType TYPE);

    /// @brief Why a chain run stopped
    struct ChainError final
    {
        EChainErrorType Type = EChainErrorType::ExecutionFailure;
        std::string     PluginIdentity;
        std::string     Message;

        /// @brief Set for Blocked errors
        std::optional<ERiskLevel> RiskLevel;
        std::optional<double>     Confidence;
        std::vector<std::string>  Alternatives;

        web::json::value ToJson() const;
    };

    /// @brief The outcome of PluginChainer::RunChain
    struct ChainRunResult final
    {
        /// @brief The accumulated context. Partial when the run failed
        web::json::value Context = web::json::value::object();

        std::optional<ChainError> Error;

        /// @brief Warnings of plugins that were admitted with a warning
        std::vector<std::string> Warnings;

        inline bool Succeeded() const
        {
            return !Error.has_value();
        }

        web::json::value ToJson() const;
    };

    /// @brief A snapshot of a chain's progress
    struct ChainStatus final
    {
        std::string         ChainID;
        std::size_t         TotalPlugins    = 0;
        std::size_t         ExecutedPlugins = 0;
        double              Progress        = 0.0;
        EChainExecutionMode ExecutionMode   = EChainExecutionMode::Default;
        web::json::value    Metadata        = web::json::value::object();

        web::json::value ToJson() const;
    };

    /// @brief A chain the chainer proposes for free-form user input. Suggested chains are built and registered but never run
    struct ChainSuggestion final
    {
        std::string              ChainID;
        std::string              Description;
        std::vector<std::string> Plugins;
        EChainExecutionMode      ExecutionMode  = EChainExecutionMode::Default;
        double                   RelevanceScore = 0.0;

        /// @brief Estimated execution time in seconds
        double EstimatedTime = 0.0;

        web::json::value ToJson() const;
    };

} // namespace MAESTRO
