#include "PluginRegistry.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <mutex>

using namespace MAESTRO;

bool PluginRegistry::Register(std::shared_ptr<IPlugin> Plugin)
{
    if (!Plugin || Plugin->GetName().empty())
    {
        std::cerr << "Cannot register a plugin without a name" << std::endl;
        return false;
    }

    const std::string IDENTITY(Plugin->GetName());

    std::unique_lock<std::shared_mutex> Lock(m_Mutex);
    if (!m_Plugins.emplace(IDENTITY, std::move(Plugin)).second)
    {
        std::cerr << "Plugin already registered: " << IDENTITY << std::endl;
        return false;
    }
    return true;
}

std::shared_ptr<IPlugin> PluginRegistry::Unregister(const std::string& Identity)
{
    std::unique_lock<std::shared_mutex> Lock(m_Mutex);

    const auto PLUGIN_ITER = m_Plugins.find(Identity);
    if (PLUGIN_ITER == m_Plugins.end())
    {
        return nullptr;
    }

    auto Plugin = std::move(PLUGIN_ITER->second);
    m_Plugins.erase(PLUGIN_ITER);
    return Plugin;
}

std::shared_ptr<IPlugin> PluginRegistry::Find(const std::string& Identity) const
{
    std::shared_lock<std::shared_mutex> Lock(m_Mutex);

    const auto PLUGIN_ITER = m_Plugins.find(Identity);
    return PLUGIN_ITER != m_Plugins.end() ? PLUGIN_ITER->second : nullptr;
}

bool PluginRegistry::Contains(const std::string& Identity) const
{
    std::shared_lock<std::shared_mutex> Lock(m_Mutex);
    return m_Plugins.count(Identity) > 0;
}

std::vector<std::string> PluginRegistry::GetIdentities() const
{
    std::shared_lock<std::shared_mutex> Lock(m_Mutex);

    std::vector<std::string> Identities;
    Identities.reserve(m_Plugins.size());
    for (const auto& [Identity, Plugin] : m_Plugins)
    {
        Identities.push_back(Identity);
    }
    return Identities;
}

std::size_t PluginRegistry::GetCount() const
{
    std::shared_lock<std::shared_mutex> Lock(m_Mutex);
    return m_Plugins.size();
}

std::shared_ptr<IPlugin> PluginRegistry::LoadModule(const std::string& InPath, const Maestro& InMaestro)
{
    auto Module = std::make_shared<PluginModule>();
    if (!Module->Load(InPath, InMaestro))
    {
        return nullptr;
    }

    // The plugin shares ownership of its module, the library stays open while the plugin is in use
    return std::shared_ptr<IPlugin>(Module, Module->GetPlugin());
}

std::vector<std::string> PluginRegistry::FindModules(const std::string& Directory)
{
    std::vector<std::string> Modules;

    std::error_code ErrorCode;
    if (!std::filesystem::is_directory(Directory, ErrorCode))
    {
        std::cerr << "Plugin directory not found: " << Directory << std::endl;
        return Modules;
    }

    std::cout << "Searching for plugins in: " << Directory << std::endl;

    for (const auto& Entry : std::filesystem::directory_iterator(Directory, ErrorCode))
    {
        if (Entry.is_regular_file() && Entry.path().extension() == ".so")
        {
            std::cout << "Plugin Module: " << Entry.path().filename() << std::endl;
            Modules.push_back(Entry.path().string());
        }
    }

    std::sort(Modules.begin(), Modules.end());
    return Modules;
}
