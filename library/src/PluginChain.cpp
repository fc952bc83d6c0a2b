#include "PluginChain.hpp"

#include <algorithm>
#include <cctype>

using namespace MAESTRO;

std::string MAESTRO::ExecutionModeToString(const EChainExecutionMode MODE)
{
    switch (MODE)
    {
        case EChainExecutionMode::Sequential:
            return "sequential";
        case EChainExecutionMode::Parallel:
            return "parallel";
        case EChainExecutionMode::Adaptive:
            return "adaptive";
    }
    return "unknown";
}

std::optional<EChainExecutionMode> MAESTRO::ExecutionModeFromString(const std::string& Name)
{
    std::string NameLower = Name;
    std::transform(NameLower.begin(), NameLower.end(), NameLower.begin(), [](const unsigned char Character) { return static_cast<char>(std::tolower(Character)); });

    if (NameLower == "sequential")
    {
        return EChainExecutionMode::Sequential;
    }
    if (NameLower == "parallel")
    {
        return EChainExecutionMode::Parallel;
    }
    if (NameLower == "adaptive")
    {
        return EChainExecutionMode::Adaptive;
    }
    return std::nullopt;
}

std::string MAESTRO::ChainErrorTypeToString(const EChainErrorType TYPE)
{
    switch (TYPE)
    {
        case EChainErrorType::NotFound:
            return "not_found";
        case EChainErrorType::Blocked:
            return "blocked";
        case EChainErrorType::ExecutionFailure:
            return "execution_failure";
        case EChainErrorType::BuildFailure:
            return "build_failure";
    }
    return "unknown";
}

ChainNode::ChainNode(const std::string& InPluginIdentity)
    : PluginIdentity(InPluginIdentity)
{
}

web::json::value ChainNode::ToJson() const
{
    web::json::value JNode        = web::json::value::object();
    JNode[U("plugin_name")]       = web::json::value::string(PluginIdentity);
    JNode[U("dependencies")]      = StringsToJson(Dependencies);
    JNode[U("executed")]          = web::json::value::boolean(Executed.load());
    JNode[U("outputs")]           = Outputs;
    return JNode;
}

bool PluginChain::HasDependencies() const
{
    return std::any_of(Nodes.begin(), Nodes.end(), [](const std::unique_ptr<ChainNode>& Node) { return !Node->Dependencies.empty(); });
}

std::vector<std::vector<std::string>> PluginChain::CalculateLevels() const
{
    // Dependencies only reference earlier nodes, so a single pass in list order sees every dependency's level first
    std::unordered_map<std::string, std::size_t> NodeLevels;
    std::vector<std::vector<std::string>>        Levels;

    for (const auto& Node : Nodes)
    {
        std::size_t Level = 0;
        for (const auto& Dependency : Node->Dependencies)
        {
            if (const auto DEPENDENCY_LEVEL = NodeLevels.find(Dependency); DEPENDENCY_LEVEL != NodeLevels.end())
            {
                Level = std::max(Level, DEPENDENCY_LEVEL->second + 1);
            }
        }

        NodeLevels[Node->PluginIdentity] = Level;
        if (Levels.size() <= Level)
        {
            Levels.resize(Level + 1);
        }
        Levels[Level].push_back(Node->PluginIdentity);
    }

    return Levels;
}

ChainNode* PluginChain::FindNode(const std::string& PluginIdentity) const
{
    const auto NODE = std::find_if(Nodes.begin(), Nodes.end(), [&PluginIdentity](const std::unique_ptr<ChainNode>& Node) { return Node->PluginIdentity == PluginIdentity; });
    return NODE != Nodes.end() ? NODE->get() : nullptr;
}

std::vector<std::string> PluginChain::GetPluginIdentities() const
{
    std::vector<std::string> Identities;
    Identities.reserve(Nodes.size());
    for (const auto& Node : Nodes)
    {
        Identities.push_back(Node->PluginIdentity);
    }
    return Identities;
}

std::size_t PluginChain::GetExecutedCount() const
{
    return static_cast<std::size_t>(std::count_if(Nodes.begin(), Nodes.end(), [](const std::unique_ptr<ChainNode>& Node) { return Node->Executed.load(); }));
}

web::json::value PluginChain::ToJson() const
{
    web::json::value JNodes = web::json::value::array();
    for (const auto& Node : Nodes)
    {
        JNodes[JNodes.size()] = Node->ToJson();
    }

    web::json::value JChain        = web::json::value::object();
    JChain[U("chain_id")]          = web::json::value::string(ChainID);
    JChain[U("execution_mode")]    = web::json::value::string(ExecutionModeToString(ExecutionMode));
    JChain[U("plugins")]           = JNodes;
    JChain[U("input_data")]        = InputData;
    JChain[U("metadata")]          = Metadata;
    return JChain;
}

web::json::value ChainError::ToJson() const
{
    web::json::value JError     = web::json::value::object();
    JError[U("type")]           = web::json::value::string(ChainErrorTypeToString(Type));
    JError[U("plugin_name")]    = web::json::value::string(PluginIdentity);
    JError[U("message")]        = web::json::value::string(Message);

    if (RiskLevel)
    {
        JError[U("risk_level")] = web::json::value::string(RiskLevelToString(*RiskLevel));
    }

    if (Confidence)
    {
        JError[U("confidence_score")] = web::json::value::number(*Confidence);
    }

    if (!Alternatives.empty())
    {
        JError[U("alternatives")] = StringsToJson(Alternatives);
    }

    return JError;
}

web::json::value ChainRunResult::ToJson() const
{
    web::json::value JResult    = web::json::value::object();
    JResult[U("success")]       = web::json::value::boolean(Succeeded());
    JResult[U("context")]       = Context;
    JResult[U("warnings")]      = StringsToJson(Warnings);
    JResult[U("error")]         = Error ? Error->ToJson() : web::json::value::null();
    return JResult;
}

web::json::value ChainStatus::ToJson() const
{
    web::json::value JStatus           = web::json::value::object();
    JStatus[U("chain_id")]             = web::json::value::string(ChainID);
    JStatus[U("total_plugins")]        = web::json::value::number(static_cast<uint64_t>(TotalPlugins));
    JStatus[U("executed_plugins")]     = web::json::value::number(static_cast<uint64_t>(ExecutedPlugins));
    JStatus[U("progress")]             = web::json::value::number(Progress);
    JStatus[U("execution_mode")]       = web::json::value::string(ExecutionModeToString(ExecutionMode));
    JStatus[U("metadata")]             = Metadata;
    return JStatus;
}

web::json::value ChainSuggestion::ToJson() const
{
    web::json::value JSuggestion          = web::json::value::object();
    JSuggestion[U("chain_id")]            = web::json::value::string(ChainID);
    JSuggestion[U("description")]         = web::json::value::string(Description);
    JSuggestion[U("plugins")]             = StringsToJson(Plugins);
    JSuggestion[U("execution_mode")]      = web::json::value::string(ExecutionModeToString(ExecutionMode));
    JSuggestion[U("relevance_score")]     = web::json::value::number(RelevanceScore);
    JSuggestion[U("estimated_time")]      = web::json::value::number(EstimatedTime);
    return JSuggestion;
}
