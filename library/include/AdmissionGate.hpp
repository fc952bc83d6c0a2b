#pragma once

#include <cpprest/json.h>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "Confidence.hpp"

namespace MAESTRO
{
    /**
     * @brief The admission gate. Owns the per-plugin confidence ledger and decides, on every execution attempt, whether a plugin
     * is allowed, allowed with a warning, or blocked.
     *
     * Each plugin's ledger entry has its own mutex, so recording executions of unrelated plugins never contends. None of the
     * functions throw.
     */
    class AdmissionGate final
    {
    public:
        struct Defaults
        {
            /// @brief Plugins below this confidence are always blocked. A user override never waives it.
            constexpr static double BLOCK_FLOOR = 0.3;

            /// @brief Plugins below this confidence are allowed with a warning
            constexpr static double WARN_BELOW = 0.6;

            constexpr static std::size_t MAX_ALTERNATIVES = 5;

            /// @brief The number of most recent executions the error frequency is computed over
            constexpr static std::size_t ERROR_WINDOW = 50;

            /// @brief Execution time (in seconds) at which the performance factor of the confidence reaches zero
            constexpr static double PERFORMANCE_HORIZON = 10.0;

            constexpr static double LOW_CONFIDENCE             = 0.5;
            constexpr static double MODERATE_CONFIDENCE        = 0.7;
            constexpr static double HIGH_CONFIDENCE            = 0.8;
            constexpr static double SLOW_EXECUTION_TIME        = 3.0;
            constexpr static double UNRELIABLE_ERROR_FREQUENCY = 0.2;
        };

        explicit AdmissionGate(const std::size_t ERROR_WINDOW = Defaults::ERROR_WINDOW);

        /**
         * @brief Store the static analyzer's report for a plugin. Moves the plugin from UNSCORED to SCORED (or re-scores it).
         *
         * @param Identity The plugin the report is for
         * @param Report The analysis report
         */
        void Score(const std::string& Identity, const AnalysisReport& Report);

        /**
         * @brief Decide whether an execution must be blocked.
         *
         * @param RISK The risk level of the plugin
         * @param CONFIDENCE The confidence of the plugin
         * @param USER_OVERRIDE Whether the user explicitly accepted the risk
         * @return true if the confidence is below the floor (regardless of the override) or the risk is HIGH/CRITICAL without override
         */
        static bool ShouldBlock(const ERiskLevel RISK, const double CONFIDENCE, const bool USER_OVERRIDE);

        /**
         * @brief Evaluate an execution attempt of a plugin against its current ledger entry. Plugins that were never scored are allowed.
         *
         * @param Identity The plugin
         * @param USER_OVERRIDE Whether the user explicitly accepted the risk
         * @return The decision together with a snapshot of the record and the warning text (if any)
         */
        AdmissionResult Evaluate(const std::string& Identity, const bool USER_OVERRIDE = false) const;

        /**
         * @brief Record the outcome of an execution and recompute the plugin's confidence as a blend of its static confidence,
         * success rate, performance and error frequency.
         *
         * @param Identity The plugin that was executed
         * @param EXECUTION_TIME The execution time in seconds
         * @param SUCCESS Whether the execution succeeded
         * @param Error The error of a failed execution
         */
        void RecordExecution(const std::string& Identity, const double EXECUTION_TIME, const bool SUCCESS, const std::optional<ErrorInfo>& Error = std::nullopt);

        /// @brief  Get other scored plugins with strictly higher confidence and a non-blocking risk level, best first
        std::vector<ConfidenceRecord> RecommendAlternatives(const std::string& Identity) const;

        /// @brief  Get improvement recommendations for a plugin derived from its runtime ledger
        std::vector<Recommendation> GetRecommendations(const std::string& Identity) const;

        /**
         * @brief Get the user-facing warning for a plugin.
         *
         * @return The warning text. Empty if the plugin deserves no warning.
         */
        static std::string GetConfidenceWarning(const std::string& Identity, const double CONFIDENCE, const ERiskLevel RISK);

        std::optional<ConfidenceRecord> GetRecord(const std::string& Identity) const;

        /// @brief  Dashboard data: totals, average confidence, confidence buckets, blocked count and every record
        web::json::value GetSummary() const;

        /// @brief  Drop a plugin's ledger entry (when the plugin is unregistered)
        void Forget(const std::string& Identity);

        inline std::size_t GetErrorWindow() const
        {
            return m_ErrorWindow;
        }

    private:
        struct Ledger
        {
            std::mutex       Mutex;
            ConfidenceRecord Record;

            /// @brief Outcomes of the most recent executions (true for failures), bounded by the error window
            std::deque<bool> RecentFailures;
        };

        std::shared_ptr<Ledger> FindLedger(const std::string& Identity) const;

        std::shared_ptr<Ledger> FindOrCreateLedger(const std::string& Identity);

        /// @brief Snapshot every record
        std::vector<ConfidenceRecord> GetRecords() const;

        /// @brief Blend the static confidence with the runtime behavior of a record
        static double BlendConfidence(const ConfidenceRecord& Record);

        const std::size_t m_ErrorWindow;

        mutable std::shared_mutex                                m_LedgersMutex;
        std::unordered_map<std::string, std::shared_ptr<Ledger>> m_Ledgers;
    };

} // namespace MAESTRO
