#include "Confidence.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace MAESTRO;

std::string MAESTRO::RiskLevelToString(const ERiskLevel RISK)
{
    switch (RISK)
    {
        case ERiskLevel::Low:
            return "low";
        case ERiskLevel::Medium:
            return "medium";
        case ERiskLevel::High:
            return "high";
        case ERiskLevel::Critical:
            return "critical";
    }
    return "unknown";
}

std::optional<ERiskLevel> MAESTRO::RiskLevelFromString(const std::string& Name)
{
    std::string NameLower = Name;
    std::transform(NameLower.begin(), NameLower.end(), NameLower.begin(), [](const unsigned char Character) { return static_cast<char>(std::tolower(Character)); });

    if (NameLower == "low")
    {
        return ERiskLevel::Low;
    }
    if (NameLower == "medium")
    {
        return ERiskLevel::Medium;
    }
    if (NameLower == "high")
    {
        return ERiskLevel::High;
    }
    if (NameLower == "critical")
    {
        return ERiskLevel::Critical;
    }
    return std::nullopt;
}

std::string MAESTRO::AdmissionDecisionToString(const EAdmissionDecision DECISION)
{
    switch (DECISION)
    {
        case EAdmissionDecision::Allowed:
            return "allowed";
        case EAdmissionDecision::Warned:
            return "warned";
        case EAdmissionDecision::Blocked:
            return "blocked";
    }
    return "unknown";
}

AnalysisReport AnalysisReport::FromJson(const web::json::value& JReport)
{
    if (!JReport.is_object() || !JReport.has_number_field(U("confidence_score")))
    {
        throw std::invalid_argument("An analysis report needs a numeric confidence_score");
    }

    AnalysisReport Report;
    Report.ConfidenceScore = std::clamp(JReport.at(U("confidence_score")).as_double(), 0.0, 1.0);

    if (JReport.has_string_field(U("risk_level")))
    {
        const auto RISK_NAME = JReport.at(U("risk_level")).as_string();
        const auto RISK      = RiskLevelFromString(RISK_NAME);
        if (!RISK)
        {
            throw std::invalid_argument("Unknown risk level: " + RISK_NAME);
        }
        Report.RiskLevel = *RISK;
    }

    if (JReport.has_array_field(U("recommendations")))
    {
        Report.Recommendations = StringsFromJson(JReport.at(U("recommendations")));
    }

    return Report;
}

web::json::value ConfidenceRecord::ToJson() const
{
    web::json::value JRecord              = web::json::value::object();
    JRecord[U("plugin_name")]             = web::json::value::string(Identity);
    JRecord[U("state")]                   = web::json::value::string(State == EAdmissionState::Scored ? U("scored") : U("unscored"));
    JRecord[U("confidence_score")]        = web::json::value::number(ConfidenceScore);
    JRecord[U("static_confidence")]       = web::json::value::number(StaticConfidence);
    JRecord[U("risk_level")]              = web::json::value::string(RiskLevelToString(RiskLevel));
    JRecord[U("average_execution_time")]  = web::json::value::number(AverageExecutionTime);
    JRecord[U("error_frequency")]         = web::json::value::number(ErrorFrequency);
    JRecord[U("success_rate")]            = web::json::value::number(SuccessRate);
    JRecord[U("usage_count")]             = web::json::value::number(UsageCount);
    JRecord[U("recommendations")]         = StringsToJson(Recommendations);

    if (LastError)
    {
        web::json::value JError = web::json::value::object();
        JError[U("type")]       = web::json::value::string(LastError->Type);
        JError[U("message")]    = web::json::value::string(LastError->Message);
        JRecord[U("last_error")] = JError;
    }
    else
    {
        JRecord[U("last_error")] = web::json::value::null();
    }

    return JRecord;
}

web::json::value AdmissionResult::ToJson() const
{
    web::json::value JResult            = web::json::value::object();
    JResult[U("decision")]              = web::json::value::string(AdmissionDecisionToString(Decision));
    JResult[U("confidence_score")]      = web::json::value::number(Record.ConfidenceScore);
    JResult[U("risk_level")]            = web::json::value::string(RiskLevelToString(Record.RiskLevel));
    JResult[U("warning")]               = Warning.empty() ? web::json::value::null() : web::json::value::string(Warning);
    return JResult;
}

web::json::value Recommendation::ToJson() const
{
    web::json::value JRecommendation    = web::json::value::object();
    JRecommendation[U("type")]          = web::json::value::string(Type);
    JRecommendation[U("priority")]      = web::json::value::string(Priority);
    JRecommendation[U("message")]       = web::json::value::string(Message);
    return JRecommendation;
}
