#include "MaestroWebServer.hpp"

#include <functional>
#include <iostream>
#include <stdexcept>

using namespace MAESTRO;

namespace
{
    /// @brief Not part of web::http::status_codes
    constexpr web::http::status_code UNPROCESSABLE_ENTITY = 422;

    constexpr int DEFAULT_QUERY_LIMIT = 5;

    std::string GetString(const web::json::value& Body, const std::string& Key, const std::string& Default = "")
    {
        if (!Body.is_object() || !Body.has_field(Key) || Body.at(Key).is_null())
        {
            return Default;
        }
        if (!Body.at(Key).is_string())
        {
            throw std::invalid_argument("'" + Key + "' must be a string");
        }
        return Body.at(Key).as_string();
    }

    bool GetBool(const web::json::value& Body, const std::string& Key, const bool DEFAULT = false)
    {
        if (!Body.is_object() || !Body.has_field(Key) || Body.at(Key).is_null())
        {
            return DEFAULT;
        }
        if (!Body.at(Key).is_boolean())
        {
            throw std::invalid_argument("'" + Key + "' must be a boolean");
        }
        return Body.at(Key).as_bool();
    }

    int GetInteger(const web::json::value& Body, const std::string& Key, const int DEFAULT)
    {
        if (!Body.is_object() || !Body.has_field(Key) || Body.at(Key).is_null())
        {
            return DEFAULT;
        }
        if (!Body.at(Key).is_integer())
        {
            throw std::invalid_argument("'" + Key + "' must be an integer");
        }
        return Body.at(Key).as_integer();
    }

    std::vector<std::string> GetStrings(const web::json::value& Body, const std::string& Key)
    {
        if (!Body.is_object() || !Body.has_field(Key) || Body.at(Key).is_null())
        {
            return {};
        }
        if (!Body.at(Key).is_array())
        {
            throw std::invalid_argument("'" + Key + "' must be an array of strings");
        }
        return StringsFromJson(Body.at(Key));
    }

    web::json::value GetValue(const web::json::value& Body, const std::string& Key, const web::json::value& Default)
    {
        if (!Body.is_object() || !Body.has_field(Key))
        {
            return Default;
        }
        return Body.at(Key);
    }

    web::json::value RecordOrNull(const std::optional<ConfidenceRecord>& Record)
    {
        return Record ? Record->ToJson() : web::json::value::null();
    }
} // namespace

MaestroWebServer::MaestroWebServer(Maestro& InMaestro)
    : m_Maestro(InMaestro)
{
}

bool MaestroWebServer::Start(const uint16_t PORT)
{
    // Create a listener
    m_Listener = web::http::experimental::listener::http_listener(U("http://0.0.0.0:") + std::to_string(PORT));

    // Handle requests
    m_Listener.support(web::http::methods::GET, std::bind(&MaestroWebServer::HandleRequest, this, std::placeholders::_1));
    m_Listener.support(web::http::methods::POST, std::bind(&MaestroWebServer::HandleRequest, this, std::placeholders::_1));
    m_Listener.support(web::http::methods::DEL, std::bind(&MaestroWebServer::HandleRequest, this, std::placeholders::_1));

    // Start the listener
    try
    {
        m_Listener.open().wait();
    }
    catch (const std::exception& Exception)
    {
        std::cerr << "Failed to open http listener on port " << PORT << ": " << Exception.what() << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> Lock(m_Mutex);
        m_IsRunning = true;
    }

    std::cout << "Maestro listening on port " << PORT << std::endl;
    return true;
}

void MaestroWebServer::Stop()
{
    {
        std::lock_guard<std::mutex> Lock(m_Mutex);
        m_IsRunning = false;
    }
    m_ConditionVariable.notify_all();
}

void MaestroWebServer::Wait()
{
    // Aquire the lock
    std::unique_lock<std::mutex> Lock(m_Mutex);

    // Wait for the condition variable
    m_ConditionVariable.wait(Lock, [this] { return !m_IsRunning; });

    // Close the listener
    if (m_Listener.close().wait() != pplx::task_status::completed)
    {
        std::cout << __FUNCTION__ << ":" << __LINE__ << ": Failed to close http listener!" << std::endl;
    }
}

void MaestroWebServer::HandleRequest(const web::http::http_request& Request)
{
    const auto METHOD = Request.method();
    const auto PATH   = web::uri::decode(Request.request_uri().path());

    if (METHOD != web::http::methods::POST)
    {
        const auto RESPONSE = Dispatch(METHOD, PATH, web::json::value::null());
        // ReSharper disable once CppExpressionWithoutSideEffects
        Request.reply(RESPONSE.Status, RESPONSE.Body);
        return;
    }

    // Extract the body, ignoring the content type
    Request.extract_json(true).then(
        [this, Request, METHOD, PATH](const pplx::task<web::json::value>& ExtractJsonTask)
        {
            Response Result;
            try
            {
                Result = Dispatch(METHOD, PATH, ExtractJsonTask.get());
            }
            catch (const web::http::http_exception& Exception)
            {
                Result = MakeErrorResponse(web::http::status_codes::BadRequest, std::string("Malformed request body: ") + Exception.what());
            }
            catch (const web::json::json_exception& Exception)
            {
                Result = MakeErrorResponse(web::http::status_codes::BadRequest, std::string("Malformed json body: ") + Exception.what());
            }

            // ReSharper disable once CppExpressionWithoutSideEffects
            Request.reply(Result.Status, Result.Body);
        });
}

MaestroWebServer::Response MaestroWebServer::Dispatch(const web::http::method& Method, const std::string& Path, const web::json::value& Body)
{
    const auto SEGMENTS = web::uri::split_path(Path);
    if (SEGMENTS.empty())
    {
        return MakeErrorResponse(web::http::status_codes::NotFound, "The requested endpoint was not found.");
    }

    try
    {
        const auto& RESOURCE = SEGMENTS.front();
        if (RESOURCE == "plugins")
        {
            return HandlePluginsEndpoint(Method, SEGMENTS, Body);
        }
        if (RESOURCE == "chains")
        {
            return HandleChainsEndpoint(Method, SEGMENTS, Body);
        }
        if (SEGMENTS.size() == 1 && RESOURCE == "query")
        {
            return Method == web::http::methods::POST ? HandleQueryEndpoint(Body)
                                                      : MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use POST /query");
        }
        if (SEGMENTS.size() == 1 && RESOURCE == "discover")
        {
            return Method == web::http::methods::POST ? HandleDiscoverEndpoint(Body)
                                                      : MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use POST /discover");
        }
        if (SEGMENTS.size() == 1 && RESOURCE == "goals")
        {
            return Method == web::http::methods::GET ? HandleGoalsEndpoint()
                                                     : MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use GET /goals");
        }
        if (SEGMENTS.size() == 1 && RESOURCE == "suggestions")
        {
            return Method == web::http::methods::POST ? HandleSuggestionsEndpoint(Body)
                                                      : MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use POST /suggestions");
        }
        if (SEGMENTS.size() == 1 && RESOURCE == "confidence")
        {
            return Method == web::http::methods::GET ? Response { web::http::status_codes::OK, m_Maestro.GetAdmissionGate().GetSummary() }
                                                     : MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use GET /confidence");
        }
    }
    catch (const std::invalid_argument& Exception)
    {
        return MakeErrorResponse(web::http::status_codes::BadRequest, Exception.what());
    }
    catch (const web::json::json_exception& Exception)
    {
        return MakeErrorResponse(web::http::status_codes::BadRequest, Exception.what());
    }
    catch (const std::exception& Exception)
    {
        std::cerr << "Failed to handle " << Method << " " << Path << ": " << Exception.what() << std::endl;
        return MakeErrorResponse(web::http::status_codes::InternalError, Exception.what());
    }

    return MakeErrorResponse(web::http::status_codes::NotFound, "The requested endpoint was not found.");
}

MaestroWebServer::Response
MaestroWebServer::HandlePluginsEndpoint(const web::http::method& Method, const std::vector<std::string>& Segments, const web::json::value& Body)
{
    auto& Registry = m_Maestro.GetRegistry();
    auto& Gate     = m_Maestro.GetAdmissionGate();

    // GET /plugins
    if (Segments.size() == 1)
    {
        if (Method != web::http::methods::GET)
        {
            return MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use GET /plugins");
        }

        web::json::value JPlugins = web::json::value::array();
        for (const auto& Identity : Registry.GetIdentities())
        {
            if (const auto PLUGIN = Registry.Find(Identity))
            {
                auto Descriptor               = PLUGIN->GetDescriptor();
                Descriptor.Identity           = Identity;
                auto JPlugin                  = Descriptor.ToJson();
                JPlugin[U("confidence")]      = RecordOrNull(Gate.GetRecord(Identity));
                JPlugins[JPlugins.size()]     = JPlugin;
            }
        }

        web::json::value JResponse  = web::json::value::object();
        JResponse[U("plugins")]     = JPlugins;
        return { web::http::status_codes::OK, JResponse };
    }

    const auto& IDENTITY = Segments[1];
    const auto  PLUGIN   = Registry.Find(IDENTITY);
    if (!PLUGIN)
    {
        return MakeErrorResponse(web::http::status_codes::NotFound, "Plugin not found: " + IDENTITY);
    }

    // GET /plugins/{id}
    if (Segments.size() == 2)
    {
        if (Method != web::http::methods::GET)
        {
            return MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use GET /plugins/{id}");
        }

        auto Descriptor          = PLUGIN->GetDescriptor();
        Descriptor.Identity      = IDENTITY;
        auto JPlugin             = Descriptor.ToJson();
        JPlugin[U("confidence")] = RecordOrNull(Gate.GetRecord(IDENTITY));
        JPlugin[U("admission")]  = Gate.Evaluate(IDENTITY).ToJson();

        if (const auto STATISTICS = m_Maestro.GetDiscoveryIndex().GetStatistics(IDENTITY))
        {
            web::json::value JStatistics                = web::json::value::object();
            JStatistics[U("usage_count")]               = web::json::value::number(STATISTICS->UsageCount);
            JStatistics[U("success_rate")]              = web::json::value::number(STATISTICS->SuccessRate);
            JStatistics[U("average_execution_time")]    = web::json::value::number(STATISTICS->AverageExecutionTime);
            JPlugin[U("statistics")]                    = JStatistics;
        }
        return { web::http::status_codes::OK, JPlugin };
    }

    if (Segments.size() != 3)
    {
        return MakeErrorResponse(web::http::status_codes::NotFound, "The requested endpoint was not found.");
    }

    const auto& ACTION = Segments[2];
    if (ACTION == "score")
    {
        if (Method != web::http::methods::POST)
        {
            return MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use POST /plugins/{id}/score");
        }

        if (!m_Maestro.ScorePlugin(IDENTITY, AnalysisReport::FromJson(Body)))
        {
            return MakeErrorResponse(web::http::status_codes::NotFound, "Plugin not found: " + IDENTITY);
        }
        return { web::http::status_codes::OK, RecordOrNull(Gate.GetRecord(IDENTITY)) };
    }

    if (ACTION == "alternatives" || ACTION == "recommendations")
    {
        if (Method != web::http::methods::GET)
        {
            return MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use GET /plugins/{id}/" + ACTION);
        }

        web::json::value JItems = web::json::value::array();
        if (ACTION == "alternatives")
        {
            for (const auto& Alternative : Gate.RecommendAlternatives(IDENTITY))
            {
                JItems[JItems.size()] = Alternative.ToJson();
            }
        }
        else
        {
            for (const auto& Recommendation : Gate.GetRecommendations(IDENTITY))
            {
                JItems[JItems.size()] = Recommendation.ToJson();
            }
        }

        web::json::value JResponse  = web::json::value::object();
        JResponse[U("plugin_name")] = web::json::value::string(IDENTITY);
        JResponse[ACTION]           = JItems;
        return { web::http::status_codes::OK, JResponse };
    }

    if (ACTION == "execute")
    {
        if (Method != web::http::methods::POST)
        {
            return MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use POST /plugins/{id}/execute");
        }

        const auto COMMAND = GetString(Body, "command", PluginChainer::Defaults::AUTO_CHAIN_COMMAND);
        const auto INPUT   = GetValue(Body, "input", web::json::value::object());
        return MakeRunResponse(m_Maestro.ExecutePlugin(IDENTITY, COMMAND, INPUT, GetBool(Body, "user_override")));
    }

    return MakeErrorResponse(web::http::status_codes::NotFound, "The requested endpoint was not found.");
}

MaestroWebServer::Response MaestroWebServer::HandleQueryEndpoint(const web::json::value& Body)
{
    const auto GOAL = GetString(Body, "goal");
    if (GOAL.empty())
    {
        return MakeErrorResponse(web::http::status_codes::BadRequest, "'goal' is required");
    }

    const auto CANDIDATES = m_Maestro.GetDiscoveryIndex().Query(GOAL, GetInteger(Body, "limit", DEFAULT_QUERY_LIMIT), GetStrings(Body, "plugins"));

    web::json::value JCandidates = web::json::value::array();
    for (const auto& Candidate : CANDIDATES)
    {
        JCandidates[JCandidates.size()] = Candidate.ToJson();
    }

    web::json::value JResponse  = web::json::value::object();
    JResponse[U("goal")]        = web::json::value::string(GOAL);
    JResponse[U("candidates")]  = JCandidates;
    return { web::http::status_codes::OK, JResponse };
}

MaestroWebServer::Response MaestroWebServer::HandleDiscoverEndpoint(const web::json::value& Body)
{
    const auto GOAL = GetString(Body, "goal");
    if (GOAL.empty())
    {
        return MakeErrorResponse(web::http::status_codes::BadRequest, "'goal' is required");
    }

    web::json::value JResponse         = web::json::value::object();
    JResponse[U("goal")]               = web::json::value::string(GOAL);
    JResponse[U("suggestions_text")]   = web::json::value::string(m_Maestro.GetDiscoveryIndex().GetSuggestionsText(GOAL));
    return { web::http::status_codes::OK, JResponse };
}

MaestroWebServer::Response MaestroWebServer::HandleGoalsEndpoint()
{
    web::json::value JGoals = web::json::value::array();
    for (const auto& Entry : m_Maestro.GetDiscoveryIndex().GetGoalHistory())
    {
        JGoals[JGoals.size()] = Entry.ToJson();
    }

    web::json::value JResponse = web::json::value::object();
    JResponse[U("goals")]      = JGoals;
    return { web::http::status_codes::OK, JResponse };
}

MaestroWebServer::Response
MaestroWebServer::HandleChainsEndpoint(const web::http::method& Method, const std::vector<std::string>& Segments, const web::json::value& Body)
{
    auto& Chainer = m_Maestro.GetChainer();

    // POST /chains
    if (Segments.size() == 1)
    {
        if (Method != web::http::methods::POST)
        {
            return MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use POST /chains");
        }

        const auto GOAL = GetString(Body, "goal");
        if (GOAL.empty())
        {
            return MakeErrorResponse(web::http::status_codes::BadRequest, "'goal' is required");
        }

        auto MODE = m_Maestro.GetSettings().ExecutionMode;
        if (const auto MODE_NAME = GetString(Body, "execution_mode"); !MODE_NAME.empty())
        {
            const auto PARSED_MODE = ExecutionModeFromString(MODE_NAME);
            if (!PARSED_MODE)
            {
                return MakeErrorResponse(web::http::status_codes::BadRequest, "Unknown execution mode: " + MODE_NAME);
            }
            MODE = *PARSED_MODE;
        }

        const auto CHAIN = Chainer.BuildChain(GOAL,
                                              GetStrings(Body, "plugins"),
                                              GetValue(Body, "input_data", web::json::value::object()),
                                              MODE,
                                              GetBool(Body, "user_override"),
                                              GetString(Body, "created_by", PluginChainer::Defaults::CREATED_BY));
        if (!CHAIN)
        {
            ChainError Error { EChainErrorType::BuildFailure, "", "No chain could be built for the goal: " + GOAL };

            web::json::value JResponse  = web::json::value::object();
            JResponse[U("error")]       = Error.ToJson();
            return { UNPROCESSABLE_ENTITY, JResponse };
        }

        return { web::http::status_codes::Created, CHAIN->ToJson() };
    }

    const auto& CHAIN_ID = Segments[1];

    if (Segments.size() == 2)
    {
        // GET /chains/{id}
        if (Method == web::http::methods::GET)
        {
            const auto STATUS = Chainer.GetChainStatus(CHAIN_ID);
            return STATUS ? Response { web::http::status_codes::OK, STATUS->ToJson() }
                          : MakeErrorResponse(web::http::status_codes::NotFound, "Chain not found: " + CHAIN_ID);
        }

        // DELETE /chains/{id}
        if (Method == web::http::methods::DEL)
        {
            if (!Chainer.CleanupChain(CHAIN_ID))
            {
                return MakeErrorResponse(web::http::status_codes::NotFound, "Chain not found: " + CHAIN_ID);
            }

            web::json::value JResponse  = web::json::value::object();
            JResponse[U("chain_id")]    = web::json::value::string(CHAIN_ID);
            JResponse[U("removed")]     = web::json::value::boolean(true);
            return { web::http::status_codes::OK, JResponse };
        }

        return MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use GET or DELETE /chains/{id}");
    }

    // POST /chains/{id}/run
    if (Segments.size() == 3 && Segments[2] == "run")
    {
        if (Method != web::http::methods::POST)
        {
            return MakeErrorResponse(web::http::status_codes::MethodNotAllowed, "Use POST /chains/{id}/run");
        }

        return MakeRunResponse(Chainer.RunChain(CHAIN_ID, GetValue(Body, "input_data", web::json::value::null()), GetBool(Body, "user_override")));
    }

    return MakeErrorResponse(web::http::status_codes::NotFound, "The requested endpoint was not found.");
}

MaestroWebServer::Response MaestroWebServer::HandleSuggestionsEndpoint(const web::json::value& Body)
{
    const auto INPUT = GetString(Body, "input");
    if (INPUT.empty())
    {
        return MakeErrorResponse(web::http::status_codes::BadRequest, "'input' is required");
    }

    web::json::value JSuggestions = web::json::value::array();
    for (const auto& Suggestion : m_Maestro.GetChainer().SuggestChains(INPUT, GetValue(Body, "context", web::json::value::object())))
    {
        JSuggestions[JSuggestions.size()] = Suggestion.ToJson();
    }

    web::json::value JResponse  = web::json::value::object();
    JResponse[U("suggestions")] = JSuggestions;
    return { web::http::status_codes::OK, JResponse };
}

MaestroWebServer::Response MaestroWebServer::MakeRunResponse(const ChainRunResult& Result)
{
    if (Result.Succeeded())
    {
        return { web::http::status_codes::OK, Result.ToJson() };
    }

    switch (Result.Error->Type)
    {
        case EChainErrorType::NotFound:
            return { web::http::status_codes::NotFound, Result.ToJson() };
        case EChainErrorType::Blocked:
            return { web::http::status_codes::Forbidden, Result.ToJson() };
        case EChainErrorType::BuildFailure:
            return { UNPROCESSABLE_ENTITY, Result.ToJson() };
        case EChainErrorType::ExecutionFailure:
            break;
    }
    return { web::http::status_codes::InternalError, Result.ToJson() };
}

MaestroWebServer::Response MaestroWebServer::MakeErrorResponse(const web::http::status_code STATUS, const std::string& Message)
{
    auto JResponse          = web::json::value::object();
    JResponse[U("message")] = web::json::value::string(Message);
    return { STATUS, JResponse };
}
