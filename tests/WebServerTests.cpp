#include <catch2/catch.hpp>

#include "FakePlugin.hpp"
#include "MaestroWebServer.hpp"

using namespace MAESTRO;
using namespace MAESTRO::Testing;

namespace
{
    MaestroSettings MakeSettings()
    {
        MaestroSettings Settings;
        Settings.DatabaseFile = DiscoveryIndex::Defaults::DATABASE_FILE;
        return Settings;
    }

    /// @brief A Maestro instance with a small chain of fake plugins behind a web server that is never started
    struct WebServerFixture
    {
        Maestro          Engine { MakeSettings() };
        MaestroWebServer Server { Engine };

        WebServerFixture()
        {
            REQUIRE(Engine.RegisterPlugin(MakeFakePlugin("Collector", "Collect and process data from sources", {}, { "data" }, 1.0)));
            REQUIRE(Engine.RegisterPlugin(MakeFakePlugin("Analyzer", "Process data into a report", { "data" }, { "report" }, 0.5)));
            REQUIRE(Engine.RegisterPlugin(MakeFakePlugin("Crasher", "Crash while it tries to monitor servers", {}, {}, 0.0, Failing("crashed"))));
        }

        MaestroWebServer::Response Post(const std::string& Path, const std::string& Body)
        {
            return Server.Dispatch(web::http::methods::POST, Path, web::json::value::parse(Body));
        }

        MaestroWebServer::Response Get(const std::string& Path)
        {
            return Server.Dispatch(web::http::methods::GET, Path, web::json::value::null());
        }
    };
} // namespace

TEST_CASE_METHOD(WebServerFixture, "Plugins are listed and described", "[webserver]")
{
    const auto LIST = Get("/plugins");
    REQUIRE(LIST.Status == 200);
    REQUIRE(LIST.Body.at(U("plugins")).size() == 3);

    const auto PLUGIN = Get("/plugins/Analyzer");
    REQUIRE(PLUGIN.Status == 200);
    REQUIRE(PLUGIN.Body.at(U("statistics")).at(U("usage_count")).as_integer() == 0);
    REQUIRE(PLUGIN.Body.at(U("admission")).at(U("decision")).as_string() == "allowed");

    REQUIRE(Get("/plugins/Missing").Status == 404);
    REQUIRE(Get("/nowhere").Status == 404);
    REQUIRE(Server.Dispatch(web::http::methods::DEL, "/plugins", web::json::value::null()).Status == 405);
}

TEST_CASE_METHOD(WebServerFixture, "Queries rank plugins for a goal", "[webserver]")
{
    const auto RESPONSE = Post("/query", R"({"goal": "process data", "limit": 1})");
    REQUIRE(RESPONSE.Status == 200);
    REQUIRE(RESPONSE.Body.at(U("candidates")).size() == 1);
    REQUIRE(RESPONSE.Body.at(U("candidates")).at(0).at(U("plugin_name")).as_string() == "Analyzer");

    REQUIRE(Post("/query", R"({"limit": 1})").Status == 400);
    REQUIRE(Post("/query", R"({"goal": "process data", "limit": "many"})").Status == 400);
    REQUIRE(Get("/query").Status == 405);
}

TEST_CASE_METHOD(WebServerFixture, "Discovery answers in prose and remembers the goals", "[webserver]")
{
    REQUIRE(Get("/goals").Body.at(U("goals")).size() == 0);

    const auto RESPONSE = Post("/discover", R"({"goal": "process data"})");
    REQUIRE(RESPONSE.Status == 200);
    REQUIRE(RESPONSE.Body.at(U("goal")).as_string() == "process data");
    REQUIRE_THAT(RESPONSE.Body.at(U("suggestions_text")).as_string(), Catch::StartsWith("I found 2 plugins that can help with 'process data'"));

    REQUIRE(Post("/discover", R"({"goal": "fold laundry"})").Status == 200);
    REQUIRE(Post("/discover", "{}").Status == 400);
    REQUIRE(Get("/discover").Status == 405);
    REQUIRE(Post("/goals", "{}").Status == 405);

    const auto GOALS = Get("/goals");
    REQUIRE(GOALS.Status == 200);
    REQUIRE(GOALS.Body.at(U("goals")).size() == 2);
    REQUIRE(GOALS.Body.at(U("goals")).at(0).at(U("goal")).as_string() == "process data");
    REQUIRE(GOALS.Body.at(U("goals")).at(1).at(U("goal")).as_string() == "fold laundry");
}

TEST_CASE_METHOD(WebServerFixture, "Chains are created, run, inspected and removed", "[webserver]")
{
    const auto CREATED = Post("/chains", R"({"goal": "process data", "plugins": ["Collector", "Analyzer"], "execution_mode": "sequential"})");
    REQUIRE(CREATED.Status == 201);

    const auto CHAIN_ID = CREATED.Body.at(U("chain_id")).as_string();
    REQUIRE(CREATED.Body.at(U("plugins")).size() == 2);
    REQUIRE(CREATED.Body.at(U("execution_mode")).as_string() == "sequential");

    const auto RUN = Post("/chains/" + CHAIN_ID + "/run", R"({"input_data": {"source": "test"}})");
    REQUIRE(RUN.Status == 200);
    REQUIRE(RUN.Body.at(U("success")).as_bool());
    REQUIRE(RUN.Body.at(U("context")).at(U("source")).as_string() == "test");
    REQUIRE(RUN.Body.at(U("context")).at(U("Analyzer")).as_bool());

    const auto STATUS = Get("/chains/" + CHAIN_ID);
    REQUIRE(STATUS.Status == 200);
    REQUIRE(STATUS.Body.at(U("progress")).as_double() == Approx(1.0));

    REQUIRE(Server.Dispatch(web::http::methods::DEL, "/chains/" + CHAIN_ID, web::json::value::null()).Status == 200);
    REQUIRE(Get("/chains/" + CHAIN_ID).Status == 404);
    REQUIRE(Post("/chains/" + CHAIN_ID + "/run", "{}").Status == 404);
}

TEST_CASE_METHOD(WebServerFixture, "Chain creation reports invalid requests", "[webserver]")
{
    REQUIRE(Post("/chains", R"({"goal": "xyz_unmatched_goal"})").Status == 422);
    REQUIRE(Post("/chains", R"({"goal": "process data", "execution_mode": "someday"})").Status == 400);
    REQUIRE(Post("/chains", R"({"plugins": ["Collector"]})").Status == 400);
    REQUIRE(Post("/chains", R"({"goal": "process data", "user_override": "yes"})").Status == 400);
}

TEST_CASE_METHOD(WebServerFixture, "Execution outcomes map to status codes", "[webserver]")
{
    SECTION("success")
    {
        const auto RESPONSE = Post("/plugins/Collector/execute", R"({"command": "collect", "input": {}})");
        REQUIRE(RESPONSE.Status == 200);
        REQUIRE(RESPONSE.Body.at(U("context")).at(U("Collector")).as_bool());
    }

    SECTION("failure")
    {
        const auto RESPONSE = Post("/plugins/Crasher/execute", "{}");
        REQUIRE(RESPONSE.Status == 500);
        REQUIRE(RESPONSE.Body.at(U("error")).at(U("message")).as_string() == "crashed");
    }

    SECTION("blocked")
    {
        REQUIRE(Post("/plugins/Collector/score", R"({"confidence_score": 0.9, "risk_level": "critical"})").Status == 200);

        const auto RESPONSE = Post("/plugins/Collector/execute", "{}");
        REQUIRE(RESPONSE.Status == 403);
        REQUIRE(RESPONSE.Body.at(U("error")).at(U("type")).as_string() == "blocked");

        REQUIRE(Post("/plugins/Collector/execute", R"({"user_override": true})").Status == 200);
    }

    SECTION("not found")
    {
        REQUIRE(Post("/plugins/Missing/execute", "{}").Status == 404);
    }

    SECTION("malformed report")
    {
        REQUIRE(Post("/plugins/Collector/score", R"({"risk_level": "low"})").Status == 400);
    }
}

TEST_CASE_METHOD(WebServerFixture, "Confidence data is exposed", "[webserver]")
{
    REQUIRE(Post("/plugins/Analyzer/score", R"({"confidence_score": 0.5})").Status == 200);
    REQUIRE(Post("/plugins/Collector/score", R"({"confidence_score": 0.95})").Status == 200);

    const auto ALTERNATIVES = Get("/plugins/Analyzer/alternatives");
    REQUIRE(ALTERNATIVES.Status == 200);
    REQUIRE(ALTERNATIVES.Body.at(U("alternatives")).at(0).at(U("plugin_name")).as_string() == "Collector");

    const auto RECOMMENDATIONS = Get("/plugins/Crasher/recommendations");
    REQUIRE(RECOMMENDATIONS.Body.at(U("recommendations")).at(0).at(U("type")).as_string() == "NO_DATA");

    const auto SUMMARY = Get("/confidence");
    REQUIRE(SUMMARY.Status == 200);
    REQUIRE(SUMMARY.Body.at(U("total_plugins")).as_integer() == 2);
}

TEST_CASE_METHOD(WebServerFixture, "Suggestions need user input", "[webserver]")
{
    REQUIRE(Post("/suggestions", "{}").Status == 400);

    const auto RESPONSE = Post("/suggestions", R"({"input": "process data"})");
    REQUIRE(RESPONSE.Status == 200);
    REQUIRE(RESPONSE.Body.at(U("suggestions")).size() == 1);
}
