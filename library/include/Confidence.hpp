#pragma once

#include <cpprest/json.h>
#include <optional>
#include <string>
#include <vector>

#include "PluginDescriptor.hpp"

namespace MAESTRO
{
    /// @brief How dangerous a plugin is judged to be by the static analyzer
    enum class ERiskLevel : uint8_t
    {
        Low,
        Medium,
        High,
        Critical
    };

    /// @brief  Convert a risk level to its lowercase name ("low", "medium", "high", "critical")
    std::string RiskLevelToString(const ERiskLevel RISK);

    /// @brief  Parse a risk level name (case-insensitive)
    /// @return The risk level, or std::nullopt if the name is unknown
    std::optional<ERiskLevel> RiskLevelFromString(const std::string& Name);

    /// @brief Whether a risk level blocks a plugin unless the user overrides it
    inline bool IsBlockingRisk(const ERiskLevel RISK)
    {
        return RISK == ERiskLevel::High || RISK == ERiskLevel::Critical;
    }

    enum class EAdmissionState : uint8_t
    {
        /// @brief No analysis report was received yet
        Unscored,

        /// @brief The static analyzer scored the plugin at least once
        Scored
    };

    enum class EAdmissionDecision : uint8_t
    {
        Allowed,
        Warned,
        Blocked
    };

    std::string AdmissionDecisionToString(const EAdmissionDecision DECISION);

    /// @brief Details of a failed execution
    struct ErrorInfo final
    {
        std::string Type;
        std::string Message;
    };

    /// @brief The output of a static analyzer for one plugin
    struct AnalysisReport final
    {
        double                   ConfidenceScore = 1.0;
        ERiskLevel               RiskLevel       = ERiskLevel::Low;
        std::vector<std::string> Recommendations;

        /**
         * @brief Build a report from its json form ({"confidence_score": 0.8, "risk_level": "low", "recommendations": []}).
         *
         * @param JReport The json object
         * @return The report. The confidence is clamped to [0, 1].
         * @throws std::invalid_argument If the confidence is missing or the risk level is unknown
         */
        static AnalysisReport FromJson(const web::json::value& JReport);
    };

    /// @brief Produces confidence reports for plugins. Implemented outside the engine.
    struct IStaticAnalyzer
    {
        virtual ~IStaticAnalyzer() = default;

        virtual AnalysisReport Analyze(const PluginDescriptor& Descriptor) = 0;
    };

    /// @brief Per-plugin trust/risk state owned by the admission gate
    struct ConfidenceRecord final
    {
        std::string     Identity;
        EAdmissionState State = EAdmissionState::Unscored;

        /// @brief The current confidence, from the analyzer and blended with runtime behavior once executions are recorded
        double ConfidenceScore = 1.0;

        /// @brief The analyzer's last confidence score
        double StaticConfidence = 1.0;

        ERiskLevel RiskLevel = ERiskLevel::Low;

        /// @brief Average execution time in seconds
        double AverageExecutionTime = 0.0;

        /// @brief Fraction of failed executions over the most recent window
        double ErrorFrequency = 0.0;

        double SuccessRate = 1.0;
        int    UsageCount  = 0;

        std::vector<std::string> Recommendations;
        std::optional<ErrorInfo> LastError;

        web::json::value ToJson() const;
    };

    /// @brief The verdict of AdmissionGate::Evaluate
    struct AdmissionResult final
    {
        EAdmissionDecision Decision = EAdmissionDecision::Allowed;
        ConfidenceRecord   Record;

        /// @brief The user-facing warning. Empty when the plugin is allowed without remarks.
        std::string Warning;

        web::json::value ToJson() const;
    };

    /// @brief An improvement recommendation derived from the runtime ledger
    struct Recommendation final
    {
        std::string Type;
        std::string Priority;
        std::string Message;

        web::json::value ToJson() const;
    };

} // namespace MAESTRO
