#include <catch2/catch.hpp>

#include <algorithm>
#include <fstream>

#include "FakePlugin.hpp"
#include "Maestro.hpp"

using namespace MAESTRO;
using namespace MAESTRO::Testing;

TEST_CASE("Plugins are registered once under their name", "[registry]")
{
    PluginRegistry Registry;

    const auto PLUGIN = MakeFakePlugin("Alpha", "Process data records", {}, { "data" });
    REQUIRE(Registry.Register(PLUGIN));
    REQUIRE_FALSE(Registry.Register(MakeFakePlugin("Alpha", "Another plugin", {}, {})));
    REQUIRE_FALSE(Registry.Register(nullptr));
    REQUIRE_FALSE(Registry.Register(MakeFakePlugin("", "Nameless", {}, {})));

    REQUIRE(Registry.GetCount() == 1);
    REQUIRE(Registry.Contains("Alpha"));
    REQUIRE(Registry.Find("Alpha") == PLUGIN);
    REQUIRE(Registry.Find("Beta") == nullptr);
}

TEST_CASE("Unregistering hands the plugin back", "[registry]")
{
    PluginRegistry Registry;
    REQUIRE(Registry.Register(MakeFakePlugin("Beta", "Second", {}, {})));
    REQUIRE(Registry.Register(MakeFakePlugin("Alpha", "First", {}, {})));
    REQUIRE(Registry.GetIdentities() == std::vector<std::string> { "Alpha", "Beta" });

    const auto PLUGIN = Registry.Unregister("Alpha");
    REQUIRE(PLUGIN);
    REQUIRE(PLUGIN->GetName() == "Alpha");
    REQUIRE_FALSE(Registry.Contains("Alpha"));
    REQUIRE(Registry.Unregister("Alpha") == nullptr);
    REQUIRE(Registry.GetIdentities() == std::vector<std::string> { "Beta" });
}

TEST_CASE("Shared library plugins are found and loaded", "[registry]")
{
    MaestroSettings Settings;
    Settings.DatabaseFile = DiscoveryIndex::Defaults::DATABASE_FILE;
    Maestro Engine(Settings);

    const auto MODULES = PluginRegistry::FindModules(MAESTRO_TEST_PLUGIN_DIR);
    REQUIRE(MODULES.size() == 3);
    REQUIRE(std::is_sorted(MODULES.begin(), MODULES.end()));

    const auto COLLECTOR_PATH = std::find_if(MODULES.begin(), MODULES.end(), [](const std::string& Path) { return Path.find("DataCollector") != std::string::npos; });
    REQUIRE(COLLECTOR_PATH != MODULES.end());

    const auto COLLECTOR = PluginRegistry::LoadModule(*COLLECTOR_PATH, Engine);
    REQUIRE(COLLECTOR);
    REQUIRE(COLLECTOR->GetName() == "DataCollector");
    REQUIRE(COLLECTOR->GetDescriptor().OutputTypes.count("data") == 1);

    web::json::value JInput = web::json::value::object();
    JInput[U("values")]     = web::json::value::parse("[1, 2, 3]");

    const auto OUTPUT = COLLECTOR->Execute("collect", JInput);
    REQUIRE(OUTPUT.at(U("record_count")).as_integer() == 3);
    REQUIRE_THROWS_AS(COLLECTOR->Execute("shred", JInput), std::invalid_argument);
}

TEST_CASE("Paths that are not plugins are rejected", "[registry]")
{
    MaestroSettings Settings;
    Settings.DatabaseFile = DiscoveryIndex::Defaults::DATABASE_FILE;
    Maestro Engine(Settings);

    REQUIRE(PluginRegistry::LoadModule("/nonexistent/libMissing.so", Engine) == nullptr);
    REQUIRE(PluginRegistry::FindModules("/nonexistent/plugins").empty());
}

TEST_CASE("A plugin module owns one library at a time", "[registry]")
{
    MaestroSettings Settings;
    Settings.DatabaseFile = DiscoveryIndex::Defaults::DATABASE_FILE;
    Maestro Engine(Settings);

    const auto MODULES = PluginRegistry::FindModules(MAESTRO_TEST_PLUGIN_DIR);
    REQUIRE(MODULES.size() == 3);

    PluginModule Module;
    REQUIRE_FALSE(Module.IsLoaded());

    SECTION("loading again from the same path keeps the plugin")
    {
        REQUIRE(Module.Load(MODULES[0], Engine));
        const auto* pPlugin = Module.GetPlugin();
        REQUIRE(pPlugin);

        REQUIRE(Module.Load(MODULES[0], Engine));
        REQUIRE(Module.GetPlugin() == pPlugin);

        REQUIRE_FALSE(Module.Load(MODULES[1], Engine));
        REQUIRE(Module.GetPlugin() == pPlugin);
    }

    SECTION("unloading releases the plugin and can be repeated")
    {
        REQUIRE(Module.Load(MODULES[0], Engine));
        Module.Unload();
        REQUIRE_FALSE(Module.IsLoaded());
        REQUIRE(Module.GetPlugin() == nullptr);
        Module.Unload();

        REQUIRE(Module.Load(MODULES[1], Engine));
        REQUIRE(Module.IsLoaded());
    }

    SECTION("a file that is not a shared library is rejected")
    {
        TemporaryDatabase NotALibrary;
        {
            std::ofstream Stream(NotALibrary.GetPath());
            Stream << "not an elf file";
        }

        REQUIRE_FALSE(Module.Load(NotALibrary.GetPath(), Engine));
        REQUIRE_FALSE(Module.IsLoaded());
    }
}
