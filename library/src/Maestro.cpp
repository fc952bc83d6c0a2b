#include "Maestro.hpp"

#include <iostream>

using namespace MAESTRO;

Maestro::Maestro(const MaestroSettings& Settings)
    : m_Settings(Settings),
      m_DiscoveryIndex(Settings.DatabaseFile),
      m_AdmissionGate(Settings.ErrorWindow),
      m_Chainer(m_Registry, m_DiscoveryIndex, m_AdmissionGate)
{
}

Maestro::~Maestro()
{
    for (const auto& Identity : m_Registry.GetIdentities())
    {
        if (const auto PLUGIN = m_Registry.Unregister(Identity))
        {
            PLUGIN->Unload();
        }
    }
}

bool Maestro::RegisterPlugin(std::shared_ptr<IPlugin> Plugin)
{
    if (!Plugin)
    {
        return false;
    }

    const std::string IDENTITY(Plugin->GetName());
    if (!m_Registry.Register(Plugin))
    {
        return false;
    }

    try
    {
        Plugin->Load(*this);
    }
    catch (const std::exception& Exception)
    {
        std::cerr << "Failed to load plugin " << IDENTITY << ": " << Exception.what() << std::endl;
        m_Registry.Unregister(IDENTITY);
        return false;
    }

    auto Descriptor     = Plugin->GetDescriptor();
    Descriptor.Identity = IDENTITY;
    if (!m_DiscoveryIndex.Index(Descriptor))
    {
        std::cerr << "Plugin " << IDENTITY << " is registered but cannot be discovered" << std::endl;
    }

    {
        std::lock_guard<std::mutex> Lock(m_StaticAnalyzerMutex);
        if (m_StaticAnalyzer)
        {
            try
            {
                m_AdmissionGate.Score(IDENTITY, m_StaticAnalyzer->Analyze(Descriptor));
            }
            catch (const std::exception& Exception)
            {
                std::cerr << "Failed to analyze plugin " << IDENTITY << ": " << Exception.what() << std::endl;
            }
        }
    }

    std::cout << "Registered plugin " << IDENTITY << " (" << Descriptor.Category << ", " << Descriptor.Version << ")" << std::endl;
    return true;
}

std::size_t Maestro::LoadPlugins(const std::string& Directory)
{
    std::size_t Count = 0;
    for (const auto& Path : PluginRegistry::FindModules(Directory))
    {
        if (auto Plugin = PluginRegistry::LoadModule(Path, *this))
        {
            Count += RegisterPlugin(std::move(Plugin)) ? 1 : 0;
        }
    }
    return Count;
}

std::size_t Maestro::LoadPlugins()
{
    return LoadPlugins(m_Settings.PluginDirectory);
}

bool Maestro::UnregisterPlugin(const std::string& Identity)
{
    const auto PLUGIN = m_Registry.Unregister(Identity);
    if (!PLUGIN)
    {
        return false;
    }

    PLUGIN->Unload();
    m_DiscoveryIndex.Remove(Identity);
    m_AdmissionGate.Forget(Identity);

    std::cout << "Unregistered plugin " << Identity << std::endl;
    return true;
}

void Maestro::SetStaticAnalyzer(std::unique_ptr<IStaticAnalyzer> StaticAnalyzer)
{
    std::lock_guard<std::mutex> Lock(m_StaticAnalyzerMutex);
    m_StaticAnalyzer = std::move(StaticAnalyzer);
}

bool Maestro::ScorePlugin(const std::string& Identity, const AnalysisReport& Report)
{
    if (!m_Registry.Contains(Identity))
    {
        return false;
    }

    m_AdmissionGate.Score(Identity, Report);
    return true;
}

ChainRunResult Maestro::ExecutePlugin(const std::string& Identity, const std::string& Command, const web::json::value& Input, const bool USER_OVERRIDE)
{
    return m_Chainer.ExecutePlugin(Identity, Command, Input, USER_OVERRIDE);
}
