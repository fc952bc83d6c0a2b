#include "PluginChainer.hpp"
#include "Timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <pplx/pplxtasks.h>
#include <set>

using namespace MAESTRO;

namespace
{
    /**
     * @brief Records the outcome of one plugin execution with the admission gate and the discovery index when it goes out of scope.
     * An execution that was not marked as succeeded is recorded as a failure, so a plugin that throws is still accounted for.
     */
    class ScopedExecutionRecord final
    {
    public:
        ScopedExecutionRecord(AdmissionGate& Gate, DiscoveryIndex& Index, const std::string& Identity)
            : m_AdmissionGate(Gate),
              m_DiscoveryIndex(Index),
              m_Identity(Identity),
              m_StartTime(std::chrono::steady_clock::now())
        {
        }

        ~ScopedExecutionRecord()
        {
            const double ELAPSED_SECONDS = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_StartTime).count();
            m_AdmissionGate.RecordExecution(m_Identity, ELAPSED_SECONDS, m_Succeeded, m_Error);
            m_DiscoveryIndex.RecordOutcome(m_Identity, m_Succeeded, ELAPSED_SECONDS);
        }

        ScopedExecutionRecord(const ScopedExecutionRecord&)            = delete;
        ScopedExecutionRecord& operator=(const ScopedExecutionRecord&) = delete;

        void MarkSucceeded()
        {
            m_Succeeded = true;
        }

        void MarkFailed(ErrorInfo Error)
        {
            m_Succeeded = false;
            m_Error     = std::move(Error);
        }

    private:
        AdmissionGate&                        m_AdmissionGate;
        DiscoveryIndex&                       m_DiscoveryIndex;
        const std::string                     m_Identity;
        const std::chrono::steady_clock::time_point m_StartTime;
        bool                                  m_Succeeded = false;
        std::optional<ErrorInfo>              m_Error;
    };

    std::string ToLower(std::string Text)
    {
        std::transform(Text.begin(), Text.end(), Text.begin(), [](const unsigned char Character) { return static_cast<char>(std::tolower(Character)); });
        return Text;
    }

    bool Intersects(const std::set<std::string>& A, const std::set<std::string>& B)
    {
        return std::any_of(A.begin(), A.end(), [&B](const std::string& Type) { return B.count(Type) > 0; });
    }

    /// @brief A candidate admitted into the chain build
    struct ChainCandidate
    {
        std::string      Identity;
        PluginDescriptor Descriptor;
    };
} // namespace

PluginChainer::PluginChainer(PluginRegistry& Registry, DiscoveryIndex& Index, AdmissionGate& Gate)
    : m_Registry(Registry),
      m_DiscoveryIndex(Index),
      m_AdmissionGate(Gate)
{
}

std::shared_ptr<PluginChain> PluginChainer::BuildChain(const std::string&              Goal,
                                                       const std::vector<std::string>& AvailablePlugins,
                                                       const web::json::value&         InputData,
                                                       const EChainExecutionMode       MODE,
                                                       const bool                      USER_OVERRIDE,
                                                       const std::string&              CreatedBy)
{
    // The candidate pool is the available plugins that are actually registered
    std::vector<std::string> Pool;
    if (AvailablePlugins.empty())
    {
        Pool = m_Registry.GetIdentities();
    }
    else
    {
        for (const auto& Identity : AvailablePlugins)
        {
            if (m_Registry.Contains(Identity) && std::find(Pool.begin(), Pool.end(), Identity) == Pool.end())
            {
                Pool.push_back(Identity);
            }
        }
    }

    if (Pool.empty())
    {
        std::cerr << "Cannot build a chain for '" << Goal << "': no plugins available" << std::endl;
        return nullptr;
    }

    const auto CANDIDATES = m_DiscoveryIndex.Query(Goal, static_cast<int>(Pool.size()), Pool);
    if (CANDIDATES.empty())
    {
        std::cerr << "Cannot build a chain for '" << Goal << "': no plugins match the goal" << std::endl;
        return nullptr;
    }

    std::vector<std::string> Ranked;
    std::set<std::string>    Considered;
    for (const auto& Candidate : CANDIDATES)
    {
        Ranked.push_back(Candidate.Identity);
        Considered.insert(Candidate.Identity);
    }

    // Filter the candidates through the admission gate. Substitutes are appended to the ranking and filtered in turn
    web::json::value            JWarnings = web::json::value::array();
    web::json::value            JBlocked  = web::json::value::array();
    std::vector<ChainCandidate> Admitted;
    for (std::size_t Index = 0; Index < Ranked.size(); ++Index)
    {
        const auto IDENTITY  = Ranked[Index];
        const auto ADMISSION = m_AdmissionGate.Evaluate(IDENTITY, USER_OVERRIDE);

        if (ADMISSION.Decision == EAdmissionDecision::Blocked)
        {
            web::json::value JAlternatives = web::json::value::array();
            for (const auto& Alternative : m_AdmissionGate.RecommendAlternatives(IDENTITY))
            {
                JAlternatives[JAlternatives.size()] = web::json::value::string(Alternative.Identity);

                if (std::find(Pool.begin(), Pool.end(), Alternative.Identity) != Pool.end() && Considered.insert(Alternative.Identity).second)
                {
                    Ranked.push_back(Alternative.Identity);
                }
            }

            web::json::value JBlockedCandidate           = web::json::value::object();
            JBlockedCandidate[U("plugin_name")]          = web::json::value::string(IDENTITY);
            JBlockedCandidate[U("risk_level")]           = web::json::value::string(RiskLevelToString(ADMISSION.Record.RiskLevel));
            JBlockedCandidate[U("confidence_score")]     = web::json::value::number(ADMISSION.Record.ConfidenceScore);
            JBlockedCandidate[U("reason")]               = web::json::value::string(ADMISSION.Warning);
            JBlockedCandidate[U("alternatives")]         = JAlternatives;
            JBlocked[JBlocked.size()]                    = JBlockedCandidate;

            std::cout << "Blocked plugin " << IDENTITY << " from chain for '" << Goal << "': " << ADMISSION.Warning << std::endl;
            continue;
        }

        if (ADMISSION.Decision == EAdmissionDecision::Warned)
        {
            web::json::value JWarning            = web::json::value::object();
            JWarning[U("plugin_name")]           = web::json::value::string(IDENTITY);
            JWarning[U("warning")]               = web::json::value::string(ADMISSION.Warning);
            JWarning[U("confidence_score")]      = web::json::value::number(ADMISSION.Record.ConfidenceScore);
            JWarnings[JWarnings.size()]          = JWarning;
        }

        const auto PLUGIN = m_Registry.Find(IDENTITY);
        if (!PLUGIN)
        {
            continue;
        }

        auto Descriptor     = PLUGIN->GetDescriptor();
        Descriptor.Identity = IDENTITY;
        Admitted.push_back({ IDENTITY, std::move(Descriptor) });
    }

    auto Chain           = std::make_shared<PluginChain>();
    Chain->ExecutionMode = MODE;
    Chain->InputData     = InputData;

    std::set<std::string> AvailableOutputs;
    std::vector<PluginDescriptor> ChainedDescriptors;
    const auto AddNode = [&](ChainCandidate& Candidate)
    {
        auto Node = std::make_unique<ChainNode>(Candidate.Identity);

        // Depend on every earlier node producing one of this node's inputs
        for (const auto& Earlier : ChainedDescriptors)
        {
            if (Intersects(Candidate.Descriptor.InputTypes, Earlier.OutputTypes))
            {
                Node->Dependencies.push_back(Earlier.Identity);
            }
        }

        AvailableOutputs.insert(Candidate.Descriptor.OutputTypes.begin(), Candidate.Descriptor.OutputTypes.end());
        ChainedDescriptors.push_back(Candidate.Descriptor);
        Chain->Nodes.push_back(std::move(Node));
    };

    // Seed with the highest priority plugin that can start a chain. The earliest ranked one wins ties
    const auto SEED = std::max_element(Admitted.begin(),
                                       Admitted.end(),
                                       [](const ChainCandidate& A, const ChainCandidate& B)
                                       {
                                           const bool A_CAN_SEED = A.Descriptor.InputTypes.empty() || A.Descriptor.AutoChainEligible;
                                           const bool B_CAN_SEED = B.Descriptor.InputTypes.empty() || B.Descriptor.AutoChainEligible;
                                           if (A_CAN_SEED != B_CAN_SEED)
                                           {
                                               return !A_CAN_SEED;
                                           }
                                           return A.Descriptor.ChainPriority < B.Descriptor.ChainPriority;
                                       });

    std::vector<ChainCandidate> Remaining;
    if (SEED != Admitted.end() && (SEED->Descriptor.InputTypes.empty() || SEED->Descriptor.AutoChainEligible))
    {
        AddNode(*SEED);
        for (auto Iter = Admitted.begin(); Iter != Admitted.end(); ++Iter)
        {
            if (Iter != SEED)
            {
                Remaining.push_back(std::move(*Iter));
            }
        }
    }
    else
    {
        Remaining = std::move(Admitted);
    }

    // First fit in ranked order, one plugin per pass, until a pass adds nothing
    bool Added = true;
    while (Added && !Remaining.empty())
    {
        Added = false;
        for (auto Iter = Remaining.begin(); Iter != Remaining.end(); ++Iter)
        {
            if (Iter->Descriptor.InputTypes.empty() || Intersects(Iter->Descriptor.InputTypes, AvailableOutputs))
            {
                AddNode(*Iter);
                Remaining.erase(Iter);
                Added = true;
                break;
            }
        }
    }

    if (Chain->Nodes.empty())
    {
        std::cerr << "Cannot build a chain for '" << Goal << "': no candidate can start a chain" << std::endl;
        return nullptr;
    }

    web::json::value JDropped = web::json::value::array();
    for (const auto& Candidate : Remaining)
    {
        std::cout << "Plugin " << Candidate.Identity << " left out of chain for '" << Goal << "': its inputs are never produced" << std::endl;
        JDropped[JDropped.size()] = web::json::value::string(Candidate.Identity);
    }

    Chain->ChainID = Defaults::CHAIN_ID_PREFIX + std::to_string(++m_ChainCounter);

    Chain->Metadata[U("goal")]         = web::json::value::string(Goal);
    Chain->Metadata[U("created_at")]   = web::json::value::string(CurrentTimestamp());
    Chain->Metadata[U("created_by")]   = web::json::value::string(CreatedBy);
    Chain->Metadata[U("plugin_count")] = web::json::value::number(static_cast<uint64_t>(Chain->Nodes.size()));
    Chain->Metadata[U("warnings")]     = JWarnings;
    Chain->Metadata[U("blocked")]      = JBlocked;
    Chain->Metadata[U("dropped")]      = JDropped;

    {
        std::lock_guard<std::mutex> Lock(m_ChainsMutex);
        m_Chains[Chain->ChainID] = Chain;
    }

    std::cout << "Built " << Chain->ChainID << " for '" << Goal << "' with " << Chain->Nodes.size() << " plugins" << std::endl;
    return Chain;
}

ChainRunResult PluginChainer::RunChain(PluginChain& Chain, const web::json::value& InitialData, const bool USER_OVERRIDE)
{
    std::lock_guard<std::mutex> Lock(Chain.RunMutex);

    // A suggested chain that is run is no longer pending
    {
        std::lock_guard<std::mutex> ChainsLock(m_ChainsMutex);
        m_PendingSuggestions.erase(std::remove(m_PendingSuggestions.begin(), m_PendingSuggestions.end(), Chain.ChainID), m_PendingSuggestions.end());
    }

    web::json::value Context = InitialData.is_null() ? Chain.InputData : InitialData;
    if (Context.is_null())
    {
        Context = web::json::value::object();
    }
    else if (!Context.is_object())
    {
        web::json::value JWrapped            = web::json::value::object();
        JWrapped[U(Defaults::INPUT_KEY)]     = Context;
        Context                              = JWrapped;
    }

    for (const auto& Node : Chain.Nodes)
    {
        Node->Executed = false;
    }

    auto MODE = Chain.ExecutionMode;
    if (MODE == EChainExecutionMode::Adaptive)
    {
        MODE = Chain.HasDependencies() ? EChainExecutionMode::Parallel : EChainExecutionMode::Sequential;
    }

    std::cout << "Running " << Chain.ChainID << " (" << ExecutionModeToString(MODE) << ")" << std::endl;

    auto Result = MODE == EChainExecutionMode::Parallel ? RunParallel(Chain, std::move(Context), USER_OVERRIDE)
                                                         : RunSequential(Chain, std::move(Context), USER_OVERRIDE);

    if (Result.Error)
    {
        std::cerr << Chain.ChainID << " failed at " << Result.Error->PluginIdentity << ": " << Result.Error->Message << std::endl;
    }
    return Result;
}

ChainRunResult PluginChainer::RunChain(const std::string& ChainID, const web::json::value& InitialData, const bool USER_OVERRIDE)
{
    const auto CHAIN = FindChain(ChainID);
    if (!CHAIN)
    {
        ChainRunResult Result;
        Result.Error = ChainError { EChainErrorType::NotFound, "", "Chain not found: " + ChainID };
        return Result;
    }

    return RunChain(*CHAIN, InitialData, USER_OVERRIDE);
}

ChainRunResult PluginChainer::ExecutePlugin(const std::string& Identity, const std::string& Command, const web::json::value& Input, const bool USER_OVERRIDE)
{
    auto Outcome = Invoke(Identity, Command, Input.is_null() ? web::json::value::object() : Input, USER_OVERRIDE);

    ChainRunResult Result;
    Result.Error = std::move(Outcome.Error);
    if (!Outcome.Warning.empty())
    {
        Result.Warnings.push_back(std::move(Outcome.Warning));
    }
    if (!Result.Error)
    {
        Result.Context = std::move(Outcome.Output);
    }
    return Result;
}

ChainRunResult PluginChainer::RunSequential(PluginChain& Chain, web::json::value Context, const bool USER_OVERRIDE) const
{
    ChainRunResult Result;

    for (const auto& Node : Chain.Nodes)
    {
        Node->Inputs = Context;

        auto Outcome = Invoke(Node->PluginIdentity, Defaults::AUTO_CHAIN_COMMAND, Node->Inputs, USER_OVERRIDE);
        if (!Outcome.Warning.empty())
        {
            Result.Warnings.push_back(std::move(Outcome.Warning));
        }

        if (Outcome.Error)
        {
            Result.Error   = std::move(Outcome.Error);
            Result.Context = std::move(Context);
            return Result;
        }

        Node->Outputs = std::move(Outcome.Output);
        MergeIntoContext(Context, Node->Outputs);
        Node->Executed = true;
    }

    Result.Context = std::move(Context);
    return Result;
}

ChainRunResult PluginChainer::RunParallel(PluginChain& Chain, web::json::value Context, const bool USER_OVERRIDE) const
{
    ChainRunResult Result;

    for (const auto& Level : Chain.CalculateLevels())
    {
        std::vector<ChainNode*>               LevelNodes;
        std::vector<pplx::task<NodeOutcome>> Tasks;
        for (const auto& Identity : Level)
        {
            auto* pNode   = Chain.FindNode(Identity);
            pNode->Inputs = Context;
            LevelNodes.push_back(pNode);

            Tasks.push_back(pplx::create_task([this, pNode, USER_OVERRIDE]()
                                              { return Invoke(pNode->PluginIdentity, Defaults::AUTO_CHAIN_COMMAND, pNode->Inputs, USER_OVERRIDE); }));
        }

        // Join the level. The outcomes are in the order of the tasks
        auto Outcomes = pplx::when_all(Tasks.begin(), Tasks.end()).get();

        for (auto& Outcome : Outcomes)
        {
            if (!Outcome.Warning.empty())
            {
                Result.Warnings.push_back(std::move(Outcome.Warning));
            }
        }

        // Nothing of a failed level is committed
        const auto FAILED = std::find_if(Outcomes.begin(), Outcomes.end(), [](const NodeOutcome& Outcome) { return Outcome.Error.has_value(); });
        if (FAILED != Outcomes.end())
        {
            Result.Error   = std::move(FAILED->Error);
            Result.Context = std::move(Context);
            return Result;
        }

        for (std::size_t Index = 0; Index < LevelNodes.size(); ++Index)
        {
            LevelNodes[Index]->Outputs = std::move(Outcomes[Index].Output);
            MergeIntoContext(Context, LevelNodes[Index]->Outputs);
            LevelNodes[Index]->Executed = true;
        }
    }

    Result.Context = std::move(Context);
    return Result;
}

PluginChainer::NodeOutcome PluginChainer::Invoke(const std::string& Identity, const std::string& Command, const web::json::value& Input, const bool USER_OVERRIDE) const
{
    NodeOutcome Outcome;

    // Plugins may have been unregistered since the chain was built
    const auto PLUGIN = m_Registry.Find(Identity);
    if (!PLUGIN)
    {
        Outcome.Error = ChainError { EChainErrorType::NotFound, Identity, "Plugin not found: " + Identity };
        return Outcome;
    }

    const auto ADMISSION = m_AdmissionGate.Evaluate(Identity, USER_OVERRIDE);
    if (ADMISSION.Decision == EAdmissionDecision::Blocked)
    {
        ChainError Error { EChainErrorType::Blocked, Identity, ADMISSION.Warning };
        Error.RiskLevel  = ADMISSION.Record.RiskLevel;
        Error.Confidence = ADMISSION.Record.ConfidenceScore;
        for (const auto& Alternative : m_AdmissionGate.RecommendAlternatives(Identity))
        {
            Error.Alternatives.push_back(Alternative.Identity);
        }

        std::cout << "Execution of " << Identity << " blocked: " << ADMISSION.Warning << std::endl;
        Outcome.Error = std::move(Error);
        return Outcome;
    }

    if (ADMISSION.Decision == EAdmissionDecision::Warned)
    {
        std::cout << "Warning: " << ADMISSION.Warning << std::endl;
        Outcome.Warning = ADMISSION.Warning;
    }

    ScopedExecutionRecord Record(m_AdmissionGate, m_DiscoveryIndex, Identity);
    try
    {
        auto Output = PLUGIN->Execute(Command, Input);
        if (Output.is_object())
        {
            Outcome.Output = std::move(Output);
        }
        else
        {
            Outcome.Output                            = web::json::value::object();
            Outcome.Output[U(Defaults::RESULT_KEY)]   = std::move(Output);
        }
        Record.MarkSucceeded();
    }
    catch (const web::json::json_exception& Exception)
    {
        Record.MarkFailed({ "json_exception", Exception.what() });
        Outcome.Error = ChainError { EChainErrorType::ExecutionFailure, Identity, std::string("Invalid json: ") + Exception.what() };
    }
    catch (const std::exception& Exception)
    {
        Record.MarkFailed({ "exception", Exception.what() });
        Outcome.Error = ChainError { EChainErrorType::ExecutionFailure, Identity, Exception.what() };
    }

    return Outcome;
}

std::vector<ChainSuggestion> PluginChainer::SuggestChains(const std::string& UserInput, const web::json::value& Context)
{
    const auto CANDIDATES = m_DiscoveryIndex.Query(UserInput, Defaults::SUGGESTION_CANDIDATES, m_Registry.GetIdentities());

    // Group the candidates by category, keeping their ranked order
    std::map<std::string, std::vector<std::string>> CategoryGroups;
    for (const auto& Candidate : CANDIDATES)
    {
        CategoryGroups[Candidate.Category].push_back(Candidate.Identity);
    }

    std::vector<ChainSuggestion> Suggestions;
    for (const auto& [Category, Plugins] : CategoryGroups)
    {
        if (Plugins.size() < Defaults::MIN_SUGGESTION_PLUGINS)
        {
            continue;
        }

        const auto CHAIN = BuildChain("Process: " + UserInput, Plugins, Context, EChainExecutionMode::Adaptive, false, Defaults::SUGGESTED_BY);
        if (!CHAIN)
        {
            continue;
        }

        ChainSuggestion Suggestion;
        Suggestion.ChainID        = CHAIN->ChainID;
        Suggestion.Description    = "Use " + Category + " plugins to " + ToLower(UserInput);
        Suggestion.Plugins        = CHAIN->GetPluginIdentities();
        Suggestion.ExecutionMode  = CHAIN->ExecutionMode;
        Suggestion.RelevanceScore = static_cast<double>(Plugins.size()) * Defaults::SUGGESTION_RELEVANCE_PER_PLUGIN;
        Suggestion.EstimatedTime  = static_cast<double>(CHAIN->Nodes.size()) * Defaults::ESTIMATED_SECONDS_PER_PLUGIN;
        Suggestions.push_back(std::move(Suggestion));
    }

    std::stable_sort(Suggestions.begin(),
                     Suggestions.end(),
                     [](const ChainSuggestion& A, const ChainSuggestion& B) { return A.RelevanceScore > B.RelevanceScore; });

    if (Suggestions.size() > Defaults::MAX_SUGGESTIONS)
    {
        for (auto Iter = Suggestions.begin() + Defaults::MAX_SUGGESTIONS; Iter != Suggestions.end(); ++Iter)
        {
            CleanupChain(Iter->ChainID);
        }
        Suggestions.resize(Defaults::MAX_SUGGESTIONS);
    }

    for (const auto& Suggestion : Suggestions)
    {
        AddPendingSuggestion(Suggestion.ChainID);
    }
    return Suggestions;
}

void PluginChainer::AddPendingSuggestion(const std::string& ChainID)
{
    std::lock_guard<std::mutex> Lock(m_ChainsMutex);

    m_PendingSuggestions.push_back(ChainID);
    while (m_PendingSuggestions.size() > Defaults::MAX_PENDING_SUGGESTIONS)
    {
        m_Chains.erase(m_PendingSuggestions.front());
        m_PendingSuggestions.pop_front();
    }
}

std::optional<ChainStatus> PluginChainer::GetChainStatus(const std::string& ChainID) const
{
    const auto CHAIN = FindChain(ChainID);
    if (!CHAIN)
    {
        return std::nullopt;
    }

    ChainStatus Status;
    Status.ChainID         = CHAIN->ChainID;
    Status.TotalPlugins    = CHAIN->Nodes.size();
    Status.ExecutedPlugins = CHAIN->GetExecutedCount();
    Status.Progress        = Status.TotalPlugins > 0 ? static_cast<double>(Status.ExecutedPlugins) / Status.TotalPlugins : 0.0;
    Status.ExecutionMode   = CHAIN->ExecutionMode;
    Status.Metadata        = CHAIN->Metadata;
    return Status;
}

std::shared_ptr<PluginChain> PluginChainer::FindChain(const std::string& ChainID) const
{
    std::lock_guard<std::mutex> Lock(m_ChainsMutex);

    const auto CHAIN = m_Chains.find(ChainID);
    return CHAIN != m_Chains.end() ? CHAIN->second : nullptr;
}

bool PluginChainer::CleanupChain(const std::string& ChainID)
{
    std::lock_guard<std::mutex> Lock(m_ChainsMutex);
    m_PendingSuggestions.erase(std::remove(m_PendingSuggestions.begin(), m_PendingSuggestions.end(), ChainID), m_PendingSuggestions.end());
    return m_Chains.erase(ChainID) > 0;
}

std::vector<std::string> PluginChainer::GetChainIDs() const
{
    std::lock_guard<std::mutex> Lock(m_ChainsMutex);

    std::vector<std::string> ChainIDs;
    for (const auto& [ChainID, Chain] : m_Chains)
    {
        ChainIDs.push_back(ChainID);
    }
    return ChainIDs;
}

void PluginChainer::MergeIntoContext(web::json::value& Context, const web::json::value& Output)
{
    for (const auto& Field : Output.as_object())
    {
        Context[Field.first] = Field.second;
    }
}
