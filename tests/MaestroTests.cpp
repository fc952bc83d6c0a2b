#include <catch2/catch.hpp>

#include "FakePlugin.hpp"
#include "Maestro.hpp"

using namespace MAESTRO;
using namespace MAESTRO::Testing;

namespace
{
    MaestroSettings MakeSettings()
    {
        MaestroSettings Settings;
        Settings.DatabaseFile    = DiscoveryIndex::Defaults::DATABASE_FILE;
        Settings.PluginDirectory = MAESTRO_TEST_PLUGIN_DIR;
        return Settings;
    }

    /// @brief Scores every plugin with a fixed report
    class FixedAnalyzer final : public IStaticAnalyzer
    {
    public:
        explicit FixedAnalyzer(AnalysisReport InReport)
            : m_Report(std::move(InReport))
        {
        }

        AnalysisReport Analyze(const PluginDescriptor& Descriptor) override
        {
            ++m_AnalyzedCount;
            return m_Report;
        }

        int GetAnalyzedCount() const
        {
            return m_AnalyzedCount;
        }

    private:
        AnalysisReport m_Report;
        int            m_AnalyzedCount = 0;
    };

    class ThrowingLoadPlugin final : public IPlugin
    {
    public:
        void Load(const Maestro& InMaestro) override
        {
            throw std::runtime_error("missing configuration");
        }

        void Unload() override
        {
        }

        std::string_view GetName() const override
        {
            return "Broken";
        }

        std::string_view GetDescription() const override
        {
            return "Process data badly";
        }

        std::string_view GetCategory() const override
        {
            return "general";
        }

        std::string_view GetAuthor() const override
        {
            return "";
        }

        std::string_view GetVersion() const override
        {
            return "1.0.0";
        }

        PluginDescriptor GetDescriptor() const override
        {
            return MakeDescriptor("Broken", "Process data badly", {}, {});
        }

        web::json::value Execute(const std::string& Command, const web::json::value& Input) override
        {
            return web::json::value::object();
        }
    };
} // namespace

TEST_CASE("The sample plugins chain from collection to a report", "[maestro]")
{
    Maestro Engine(MakeSettings());
    REQUIRE(Engine.LoadPlugins() == 3);
    REQUIRE(Engine.GetRegistry().GetIdentities() == std::vector<std::string> { "DataAnalyzer", "DataCollector", "ReportWriter" });
    REQUIRE(Engine.GetDiscoveryIndex().GetIndexedPlugins().size() == 3);

    const auto CHAIN = Engine.GetChainer().BuildChain("process data");
    REQUIRE(CHAIN);
    REQUIRE(CHAIN->GetPluginIdentities() == std::vector<std::string> { "DataCollector", "DataAnalyzer", "ReportWriter" });

    web::json::value JInput = web::json::value::object();
    JInput[U("values")]     = web::json::value::parse("[2, 4, 6]");

    const auto RESULT = Engine.GetChainer().RunChain(*CHAIN, JInput);
    REQUIRE(RESULT.Succeeded());
    REQUIRE(RESULT.Context.at(U("statistics")).at(U("mean")).as_double() == Approx(4.0));
    REQUIRE_THAT(RESULT.Context.at(U("document")).as_string(), Catch::StartsWith("# Data Report"));

    // Every plugin of the chain was accounted for
    for (const auto& Identity : CHAIN->GetPluginIdentities())
    {
        REQUIRE(Engine.GetAdmissionGate().GetRecord(Identity)->UsageCount == 1);
        REQUIRE(Engine.GetDiscoveryIndex().GetStatistics(Identity)->UsageCount == 1);
    }
}

TEST_CASE("Registered plugins are loaded, indexed and unregistered consistently", "[maestro]")
{
    Maestro Engine(MakeSettings());

    const auto PLUGIN = MakeFakePlugin("Alpha", "Process data records", {}, { "data" });
    REQUIRE(Engine.RegisterPlugin(PLUGIN));
    REQUIRE_FALSE(Engine.RegisterPlugin(PLUGIN));
    REQUIRE(PLUGIN->GetLoadCount() == 1);
    REQUIRE(Engine.GetDiscoveryIndex().Query("process data", 5).size() == 1);

    REQUIRE(Engine.ExecutePlugin("Alpha", "auto_chain", web::json::value::object()).Succeeded());
    REQUIRE(Engine.GetAdmissionGate().GetRecord("Alpha"));

    REQUIRE(Engine.UnregisterPlugin("Alpha"));
    REQUIRE_FALSE(Engine.UnregisterPlugin("Alpha"));
    REQUIRE(PLUGIN->GetUnloadCount() == 1);
    REQUIRE(Engine.GetDiscoveryIndex().Query("process data", 5).empty());
    REQUIRE_FALSE(Engine.GetAdmissionGate().GetRecord("Alpha"));
}

TEST_CASE("A plugin that fails to load is not registered", "[maestro]")
{
    Maestro Engine(MakeSettings());
    REQUIRE_FALSE(Engine.RegisterPlugin(std::make_shared<ThrowingLoadPlugin>()));
    REQUIRE_FALSE(Engine.GetRegistry().Contains("Broken"));
    REQUIRE(Engine.GetDiscoveryIndex().GetIndexedPlugins().empty());
}

TEST_CASE("The static analyzer scores plugins as they are registered", "[maestro]")
{
    Maestro Engine(MakeSettings());

    AnalysisReport Report;
    Report.ConfidenceScore = 0.2;

    auto  Analyzer  = std::make_unique<FixedAnalyzer>(Report);
    auto* pAnalyzer = Analyzer.get();
    Engine.SetStaticAnalyzer(std::move(Analyzer));

    REQUIRE(Engine.RegisterPlugin(MakeFakePlugin("Alpha", "Process data records", {}, { "data" })));
    REQUIRE(pAnalyzer->GetAnalyzedCount() == 1);

    const auto RECORD = Engine.GetAdmissionGate().GetRecord("Alpha");
    REQUIRE(RECORD);
    REQUIRE(RECORD->State == EAdmissionState::Scored);
    REQUIRE(Engine.ExecutePlugin("Alpha", "auto_chain", web::json::value::object()).Error->Type == EChainErrorType::Blocked);

    Report.ConfidenceScore = 0.9;
    REQUIRE(Engine.ScorePlugin("Alpha", Report));
    REQUIRE_FALSE(Engine.ScorePlugin("Missing", Report));
    REQUIRE(Engine.ExecutePlugin("Alpha", "auto_chain", web::json::value::object()).Succeeded());
}
