#include <catch2/catch.hpp>

#include "PluginChain.hpp"

using namespace MAESTRO;

namespace
{
    void AddNode(PluginChain& Chain, const std::string& Identity, const std::vector<std::string>& Dependencies = {})
    {
        auto pNode          = std::make_unique<ChainNode>(Identity);
        pNode->Dependencies = Dependencies;
        Chain.Nodes.push_back(std::move(pNode));
    }
} // namespace

TEST_CASE("Execution modes convert to and from their names", "[chain]")
{
    REQUIRE(ExecutionModeToString(EChainExecutionMode::Sequential) == "sequential");
    REQUIRE(ExecutionModeToString(EChainExecutionMode::Parallel) == "parallel");
    REQUIRE(ExecutionModeToString(EChainExecutionMode::Default) == "adaptive");

    REQUIRE(ExecutionModeFromString("Parallel") == EChainExecutionMode::Parallel);
    REQUIRE(ExecutionModeFromString("SEQUENTIAL") == EChainExecutionMode::Sequential);
    REQUIRE_FALSE(ExecutionModeFromString("eventually"));

    REQUIRE(ChainErrorTypeToString(EChainErrorType::Blocked) == "blocked");
    REQUIRE(ChainErrorTypeToString(EChainErrorType::NotFound) == "not_found");
}

TEST_CASE("Levels follow the dependencies", "[chain]")
{
    PluginChain Chain;

    SECTION("nodes without dependencies share the first level")
    {
        AddNode(Chain, "A");
        AddNode(Chain, "B");
        REQUIRE_FALSE(Chain.HasDependencies());
        REQUIRE(Chain.CalculateLevels() == std::vector<std::vector<std::string>> { { "A", "B" } });
    }

    SECTION("a node is one level above its deepest dependency")
    {
        AddNode(Chain, "Collector");
        AddNode(Chain, "Cleaner", { "Collector" });
        AddNode(Chain, "Sampler", { "Collector" });
        AddNode(Chain, "Reporter", { "Collector", "Cleaner" });

        REQUIRE(Chain.HasDependencies());

        const std::vector<std::vector<std::string>> EXPECTED = { { "Collector" }, { "Cleaner", "Sampler" }, { "Reporter" } };
        REQUIRE(Chain.CalculateLevels() == EXPECTED);
    }
}

TEST_CASE("Chains report their nodes and progress", "[chain]")
{
    PluginChain Chain;
    Chain.ChainID = "chain_1";
    AddNode(Chain, "A");
    AddNode(Chain, "B", { "A" });

    REQUIRE(Chain.GetPluginIdentities() == std::vector<std::string> { "A", "B" });
    REQUIRE(Chain.FindNode("B")->Dependencies == std::vector<std::string> { "A" });
    REQUIRE(Chain.FindNode("C") == nullptr);

    REQUIRE(Chain.GetExecutedCount() == 0);
    Chain.FindNode("A")->Executed = true;
    REQUIRE(Chain.GetExecutedCount() == 1);

    const auto JCHAIN = Chain.ToJson();
    REQUIRE(JCHAIN.at(U("chain_id")).as_string() == "chain_1");
    REQUIRE(JCHAIN.at(U("plugins")).size() == 2);
    REQUIRE(JCHAIN.at(U("plugins")).at(0).at(U("executed")).as_bool());
    REQUIRE_FALSE(JCHAIN.at(U("plugins")).at(1).at(U("executed")).as_bool());
}

TEST_CASE("Run results serialize their outcome", "[chain]")
{
    ChainRunResult Result;
    Result.Context[U("value")] = web::json::value::number(1);
    REQUIRE(Result.Succeeded());
    REQUIRE(Result.ToJson().at(U("success")).as_bool());

    ChainError Error;
    Error.Type           = EChainErrorType::Blocked;
    Error.PluginIdentity = "Risky";
    Error.RiskLevel      = ERiskLevel::High;
    Error.Alternatives   = { "Safe" };
    Result.Error         = Error;

    const auto JRESULT = Result.ToJson();
    REQUIRE_FALSE(Result.Succeeded());
    REQUIRE_FALSE(JRESULT.at(U("success")).as_bool());
    REQUIRE(JRESULT.at(U("error")).at(U("type")).as_string() == "blocked");
    REQUIRE(JRESULT.at(U("error")).at(U("plugin_name")).as_string() == "Risky");
    REQUIRE(JRESULT.at(U("context")).at(U("value")).as_integer() == 1);
}
