#pragma once

#include <condition_variable>
#include <cpprest/http_listener.h>
#include <cpprest/json.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "Maestro.hpp"

namespace MAESTRO
{
    /**
     * @class MaestroWebServer
     * @brief The MaestroWebServer class exposes a Maestro instance over HTTP. Every endpoint takes and returns json.
     *
     *   GET    /plugins                          List the registered plugins
     *   GET    /plugins/{id}                     A plugin's descriptor, statistics, confidence record and admission verdict
     *   POST   /plugins/{id}/score               Push a static analysis report
     *   GET    /plugins/{id}/alternatives        Higher-confidence alternatives
     *   GET    /plugins/{id}/recommendations     Improvement recommendations
     *   POST   /plugins/{id}/execute             Execute a single plugin
     *   POST   /query                            Rank plugins for a goal
     *   POST   /discover                         Describe the plugins for a goal in prose, and remember the goal
     *   GET    /goals                            The goals recently asked for
     *   POST   /chains                           Build a chain for a goal
     *   GET    /chains/{id}                      A chain's status
     *   POST   /chains/{id}/run                  Run a chain
     *   DELETE /chains/{id}                      Remove a chain
     *   POST   /suggestions                      Suggest chains for user input
     *   GET    /confidence                       The confidence dashboard
     */
    class MaestroWebServer final
    {
    public:
        /// @brief A response of the API
        struct Response
        {
            web::http::status_code Status = web::http::status_codes::OK;
            web::json::value       Body   = web::json::value::object();
        };

        explicit MaestroWebServer(Maestro& InMaestro);

        /**
         * @brief Start listening.
         *
         * @param PORT The port to listen on
         * @return Whether the listener was opened
         */
        bool Start(const uint16_t PORT);

        /// @brief  Stop the web server. Wait returns once the listener is closed
        void Stop();

        /// @brief  Block until Stop is called, then close the listener
        void Wait();

        /**
         * @brief Route a request to its endpoint.
         *
         * @param Method The http method
         * @param Path The request path
         * @param Body The json body. Null when the request has none
         * @return The response
         */
        Response Dispatch(const web::http::method& Method, const std::string& Path, const web::json::value& Body);

    protected:
        void HandleRequest(const web::http::http_request& Request);

        Response HandlePluginsEndpoint(const web::http::method& Method, const std::vector<std::string>& Segments, const web::json::value& Body);

        Response HandleQueryEndpoint(const web::json::value& Body);

        Response HandleDiscoverEndpoint(const web::json::value& Body);

        Response HandleGoalsEndpoint();

        Response HandleChainsEndpoint(const web::http::method& Method, const std::vector<std::string>& Segments, const web::json::value& Body);

        Response HandleSuggestionsEndpoint(const web::json::value& Body);

        /// @brief Map a run result to a response. Failed runs carry the partial context alongside the error
        static Response MakeRunResponse(const ChainRunResult& Result);

        static Response MakeErrorResponse(const web::http::status_code STATUS, const std::string& Message);

    private:
        Maestro& m_Maestro;

        web::http::experimental::listener::http_listener m_Listener;

        bool                    m_IsRunning = false;
        std::mutex              m_Mutex;
        std::condition_variable m_ConditionVariable;
    };

} // namespace MAESTRO
