#include "AdmissionGate.hpp"
#include "Timestamp.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace MAESTRO;

namespace
{
    /// @brief Format a fraction as a percentage with one decimal ("45.0%")
    std::string FormatPercent(const double FRACTION)
    {
        std::stringstream PercentStream;
        PercentStream << std::fixed << std::setprecision(1) << FRACTION * 100.0 << "%";
        return PercentStream.str();
    }
} // namespace

AdmissionGate::AdmissionGate(const std::size_t ERROR_WINDOW)
    : m_ErrorWindow(std::max<std::size_t>(ERROR_WINDOW, 1))
{
}

void AdmissionGate::Score(const std::string& Identity, const AnalysisReport& Report)
{
    const auto LEDGER = FindOrCreateLedger(Identity);

    std::lock_guard<std::mutex> Lock(LEDGER->Mutex);

    auto& Record            = LEDGER->Record;
    Record.State            = EAdmissionState::Scored;
    Record.StaticConfidence = std::clamp(Report.ConfidenceScore, 0.0, 1.0);
    Record.RiskLevel        = Report.RiskLevel;
    Record.Recommendations  = Report.Recommendations;

    // Until the plugin runs, the analyzer is the only source of confidence
    Record.ConfidenceScore = Record.UsageCount > 0 ? BlendConfidence(Record) : Record.StaticConfidence;

    std::cout << "Scored plugin " << Identity << ": confidence " << FormatPercent(Record.ConfidenceScore) << ", risk "
              << RiskLevelToString(Record.RiskLevel) << std::endl;
}

bool AdmissionGate::ShouldBlock(const ERiskLevel RISK, const double CONFIDENCE, const bool USER_OVERRIDE)
{
    if (CONFIDENCE < Defaults::BLOCK_FLOOR)
    {
        return true;
    }

    return IsBlockingRisk(RISK) && !USER_OVERRIDE;
}

AdmissionResult AdmissionGate::Evaluate(const std::string& Identity, const bool USER_OVERRIDE) const
{
    AdmissionResult Result;

    if (const auto LEDGER = FindLedger(Identity))
    {
        std::lock_guard<std::mutex> Lock(LEDGER->Mutex);
        Result.Record = LEDGER->Record;
    }
    else
    {
        Result.Record.Identity = Identity;
    }

    if (Result.Record.State == EAdmissionState::Unscored)
    {
        Result.Decision = EAdmissionDecision::Allowed;
        return Result;
    }

    const auto& RECORD = Result.Record;
    if (ShouldBlock(RECORD.RiskLevel, RECORD.ConfidenceScore, USER_OVERRIDE))
    {
        Result.Decision = EAdmissionDecision::Blocked;
        Result.Warning  = GetConfidenceWarning(Identity, RECORD.ConfidenceScore, RECORD.RiskLevel);
        if (Result.Warning.empty())
        {
            Result.Warning = "Plugin '" + Identity + "' is blocked (confidence: " + FormatPercent(RECORD.ConfidenceScore) + ").";
        }
    }
    else if (RECORD.ConfidenceScore < Defaults::WARN_BELOW)
    {
        Result.Decision = EAdmissionDecision::Warned;
        Result.Warning  = GetConfidenceWarning(Identity, RECORD.ConfidenceScore, RECORD.RiskLevel);
    }
    else
    {
        Result.Decision = EAdmissionDecision::Allowed;
    }

    return Result;
}

void AdmissionGate::RecordExecution(const std::string& Identity, const double EXECUTION_TIME, const bool SUCCESS, const std::optional<ErrorInfo>& Error)
{
    const auto LEDGER = FindOrCreateLedger(Identity);

    std::lock_guard<std::mutex> Lock(LEDGER->Mutex);

    auto&        Record          = LEDGER->Record;
    const double PREVIOUS_USAGE  = static_cast<double>(Record.UsageCount);
    const double SAFE_TIME       = std::max(EXECUTION_TIME, 0.0);
    Record.UsageCount           += 1;
    Record.AverageExecutionTime  = (Record.AverageExecutionTime * PREVIOUS_USAGE + SAFE_TIME) / Record.UsageCount;
    Record.SuccessRate           = (Record.SuccessRate * PREVIOUS_USAGE + (SUCCESS ? 1.0 : 0.0)) / Record.UsageCount;

    auto& RecentFailures = LEDGER->RecentFailures;
    RecentFailures.push_back(!SUCCESS);
    while (RecentFailures.size() > m_ErrorWindow)
    {
        RecentFailures.pop_front();
    }
    Record.ErrorFrequency = static_cast<double>(std::count(RecentFailures.begin(), RecentFailures.end(), true)) / RecentFailures.size();

    if (!SUCCESS)
    {
        Record.LastError = Error.value_or(ErrorInfo { "ExecutionFailure", "Unknown error" });
    }

    Record.ConfidenceScore = BlendConfidence(Record);
}

std::vector<ConfidenceRecord> AdmissionGate::RecommendAlternatives(const std::string& Identity) const
{
    const auto CURRENT = GetRecord(Identity);
    if (!CURRENT)
    {
        return {};
    }

    std::vector<ConfidenceRecord> Alternatives;
    for (auto& Record : GetRecords())
    {
        if (Record.Identity == Identity || Record.State != EAdmissionState::Scored || IsBlockingRisk(Record.RiskLevel))
        {
            continue;
        }

        if (Record.ConfidenceScore > CURRENT->ConfidenceScore)
        {
            Alternatives.push_back(std::move(Record));
        }
    }

    std::sort(Alternatives.begin(),
              Alternatives.end(),
              [](const ConfidenceRecord& A, const ConfidenceRecord& B)
              {
                  if (A.ConfidenceScore != B.ConfidenceScore)
                  {
                      return A.ConfidenceScore > B.ConfidenceScore;
                  }
                  return A.Identity < B.Identity;
              });

    if (Alternatives.size() > Defaults::MAX_ALTERNATIVES)
    {
        Alternatives.resize(Defaults::MAX_ALTERNATIVES);
    }
    return Alternatives;
}

std::vector<Recommendation> AdmissionGate::GetRecommendations(const std::string& Identity) const
{
    const auto RECORD = GetRecord(Identity);
    if (!RECORD || (RECORD->State == EAdmissionState::Unscored && RECORD->UsageCount == 0))
    {
        return { { "NO_DATA", "LOW", "No confidence data available for this plugin" } };
    }

    std::vector<Recommendation> Recommendations;

    if (RECORD->ConfidenceScore < Defaults::LOW_CONFIDENCE)
    {
        Recommendations.push_back({ "LOW_CONFIDENCE", "HIGH", "Plugin has low confidence score (" + FormatPercent(RECORD->ConfidenceScore) + ")" });
    }

    if (RECORD->AverageExecutionTime > Defaults::SLOW_EXECUTION_TIME)
    {
        std::stringstream MessageStream;
        MessageStream << "Plugin is slow (avg: " << std::fixed << std::setprecision(2) << RECORD->AverageExecutionTime << "s)";
        Recommendations.push_back({ "PERFORMANCE", "MEDIUM", MessageStream.str() });
    }

    if (RECORD->ErrorFrequency > Defaults::UNRELIABLE_ERROR_FREQUENCY)
    {
        Recommendations.push_back({ "RELIABILITY", "HIGH", "Plugin fails frequently (" + FormatPercent(RECORD->ErrorFrequency) + " error rate)" });
    }

    if (IsBlockingRisk(RECORD->RiskLevel))
    {
        Recommendations.push_back({ "SAFETY", "CRITICAL", "Plugin has " + RiskLevelToString(RECORD->RiskLevel) + " safety risk" });
    }

    return Recommendations;
}

std::string AdmissionGate::GetConfidenceWarning(const std::string& Identity, const double CONFIDENCE, const ERiskLevel RISK)
{
    switch (RISK)
    {
        case ERiskLevel::Critical:
            return "Plugin '" + Identity + "' has critical safety issues. Execution blocked for your protection.";
        case ERiskLevel::High:
            return "Plugin '" + Identity + "' has high risk (confidence: " + FormatPercent(CONFIDENCE) + "). Proceed with caution.";
        default:
            break;
    }

    if (CONFIDENCE < Defaults::LOW_CONFIDENCE)
    {
        return "Plugin '" + Identity + "' has low confidence (" + FormatPercent(CONFIDENCE) + "). Consider alternatives or improvements.";
    }

    if (CONFIDENCE < Defaults::MODERATE_CONFIDENCE)
    {
        return "Plugin '" + Identity + "' has moderate confidence (" + FormatPercent(CONFIDENCE) + "). May need optimization.";
    }

    return {};
}

std::optional<ConfidenceRecord> AdmissionGate::GetRecord(const std::string& Identity) const
{
    const auto LEDGER = FindLedger(Identity);
    if (!LEDGER)
    {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> Lock(LEDGER->Mutex);
    return LEDGER->Record;
}

web::json::value AdmissionGate::GetSummary() const
{
    const auto RECORDS = GetRecords();

    double           ConfidenceSum   = 0.0;
    int              HighCount       = 0;
    int              MediumCount     = 0;
    int              LowCount        = 0;
    int              BlockedCount    = 0;
    web::json::value JPlugins        = web::json::value::array();
    for (const auto& Record : RECORDS)
    {
        ConfidenceSum += Record.ConfidenceScore;

        if (Record.ConfidenceScore >= Defaults::HIGH_CONFIDENCE)
        {
            ++HighCount;
        }
        else if (Record.ConfidenceScore >= Defaults::LOW_CONFIDENCE)
        {
            ++MediumCount;
        }
        else
        {
            ++LowCount;
        }

        if (IsBlockingRisk(Record.RiskLevel))
        {
            ++BlockedCount;
        }

        JPlugins[JPlugins.size()] = Record.ToJson();
    }

    web::json::value JSummary                = web::json::value::object();
    JSummary[U("total_plugins")]             = web::json::value::number(static_cast<uint64_t>(RECORDS.size()));
    JSummary[U("avg_confidence")]            = web::json::value::number(RECORDS.empty() ? 0.0 : ConfidenceSum / RECORDS.size());
    JSummary[U("high_confidence_count")]     = web::json::value::number(HighCount);
    JSummary[U("medium_confidence_count")]   = web::json::value::number(MediumCount);
    JSummary[U("low_confidence_count")]      = web::json::value::number(LowCount);
    JSummary[U("blocked_plugins")]           = web::json::value::number(BlockedCount);
    JSummary[U("plugins")]                   = JPlugins;
    JSummary[U("last_updated")]              = web::json::value::string(CurrentTimestamp());
    return JSummary;
}

void AdmissionGate::Forget(const std::string& Identity)
{
    std::unique_lock<std::shared_mutex> Lock(m_LedgersMutex);
    m_Ledgers.erase(Identity);
}

std::shared_ptr<AdmissionGate::Ledger> AdmissionGate::FindLedger(const std::string& Identity) const
{
    std::shared_lock<std::shared_mutex> Lock(m_LedgersMutex);

    const auto LEDGER = m_Ledgers.find(Identity);
    return LEDGER != m_Ledgers.end() ? LEDGER->second : nullptr;
}

std::shared_ptr<AdmissionGate::Ledger> AdmissionGate::FindOrCreateLedger(const std::string& Identity)
{
    if (auto Ledger = FindLedger(Identity))
    {
        return Ledger;
    }

    std::unique_lock<std::shared_mutex> Lock(m_LedgersMutex);

    auto& Slot = m_Ledgers[Identity];
    if (!Slot)
    {
        Slot                  = std::make_shared<AdmissionGate::Ledger>();
        Slot->Record.Identity = Identity;
    }
    return Slot;
}

std::vector<ConfidenceRecord> AdmissionGate::GetRecords() const
{
    std::vector<std::shared_ptr<Ledger>> Ledgers;
    {
        std::shared_lock<std::shared_mutex> Lock(m_LedgersMutex);
        Ledgers.reserve(m_Ledgers.size());
        for (const auto& [Identity, Ledger] : m_Ledgers)
        {
            Ledgers.push_back(Ledger);
        }
    }

    std::vector<ConfidenceRecord> Records;
    Records.reserve(Ledgers.size());
    for (const auto& Ledger : Ledgers)
    {
        std::lock_guard<std::mutex> Lock(Ledger->Mutex);
        Records.push_back(Ledger->Record);
    }

    std::sort(Records.begin(), Records.end(), [](const ConfidenceRecord& A, const ConfidenceRecord& B) { return A.Identity < B.Identity; });
    return Records;
}

double AdmissionGate::BlendConfidence(const ConfidenceRecord& Record)
{
    const double STATIC_CONFIDENCE = Record.State == EAdmissionState::Scored ? Record.StaticConfidence : 1.0;
    const double PERFORMANCE =
        Record.AverageExecutionTime <= 0.0
            ? 1.0
            : std::clamp((Defaults::PERFORMANCE_HORIZON - Record.AverageExecutionTime) / Defaults::PERFORMANCE_HORIZON, 0.0, 1.0);

    const double CONFIDENCE = 0.4 * STATIC_CONFIDENCE + 0.3 * Record.SuccessRate + 0.2 * PERFORMANCE + 0.1 * (1.0 - Record.ErrorFrequency);
    return std::clamp(CONFIDENCE, 0.0, 1.0);
}
