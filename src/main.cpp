#include "MaestroWebServer.hpp"

#include <filesystem>
#include <iostream>

using namespace MAESTRO;

int
main(int argc, char* argv[])
{
    // An explicit settings file can be passed as the only argument
    const auto SETTINGS = MaestroSettings::Load(argc > 1 ? argv[1] : MaestroSettings::Defaults::SETTINGS_FILE);

    std::unique_ptr<Maestro> pMaestro;
    try
    {
        pMaestro = std::make_unique<Maestro>(SETTINGS);
    }
    catch (const sqlite::sqlite_exception& Exception)
    {
        std::cerr << "Failed to open the discovery index " << SETTINGS.DatabaseFile << ": " << Exception.what() << std::endl;
        return 1;
    }
    catch (const std::filesystem::filesystem_error& Exception)
    {
        std::cerr << "Failed to create the directory of " << SETTINGS.DatabaseFile << ": " << Exception.what() << std::endl;
        return 1;
    }

    std::cout << "Loaded " << pMaestro->LoadPlugins() << " plugins from " << SETTINGS.PluginDirectory << std::endl;

    MaestroWebServer WebServer(*pMaestro);
    if (!WebServer.Start(SETTINGS.Port))
    {
        return 1;
    }

    // Wait for the web server to stop via a call to WebServer.Stop()
    WebServer.Wait();

    return 0;
}
