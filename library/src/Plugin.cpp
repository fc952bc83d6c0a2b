#include "Plugin.hpp"

#include <dlfcn.h>
#include <filesystem>
#include <iostream>

using namespace MAESTRO;

namespace
{
    using CreatePluginFunc = IPlugin* (*) ();

    void ReportLoadFailure(const std::string& Path, const std::string& Reason)
    {
        std::cerr << "Failed to load plugin module " << Path << ": " << Reason << std::endl;
    }

    /// @brief The last dlopen/dlsym error, or a fallback when the loader didn't set one
    std::string GetLoaderError()
    {
        const char* pError = dlerror();
        return pError ? pError : "unknown loader error";
    }
} // namespace

PluginModule::PluginModule()
    : m_Handle(nullptr, nullptr),
      m_Plugin(nullptr)
{
}

PluginModule::~PluginModule()
{
    if (m_Handle)
    {
        Unload(/*INNER_UNLOAD=*/m_IsInnerLoaded);
    }
}

bool PluginModule::Load(const std::string& InPath, const Maestro& InMaestro, const bool INNER_LOAD)
{
    if (IsLoaded())
    {
        std::cerr << "Plugin module already loaded from " << m_Path << ", not loading " << InPath << std::endl;
        return m_Path == InPath;
    }

    std::error_code ErrorCode;
    if (!std::filesystem::is_regular_file(InPath, ErrorCode))
    {
        ReportLoadFailure(InPath, "no such file");
        return false;
    }

    std::unique_ptr<void, void (*)(void*)> Handle(dlopen(InPath.c_str(), RTLD_LAZY), reinterpret_cast<void (*)(void*)>(dlclose));
    if (!Handle)
    {
        ReportLoadFailure(InPath, GetLoaderError());
        return false;
    }

    // Clear any stale error so a null symbol can be told apart from a failed lookup
    dlerror();
    const auto CREATE_PLUGIN = reinterpret_cast<CreatePluginFunc>(dlsym(Handle.get(), "CreatePlugin"));
    if (!CREATE_PLUGIN)
    {
        ReportLoadFailure(InPath, "missing CreatePlugin (" + GetLoaderError() + "). Was it declared with DECLARE_MAESTRO_PLUGIN?");
        return false;
    }

    std::unique_ptr<IPlugin> Plugin(CREATE_PLUGIN());
    if (!Plugin)
    {
        ReportLoadFailure(InPath, "CreatePlugin returned null");
        return false;
    }

    if (INNER_LOAD)
    {
        // On a throw the plugin is destroyed before its library closes
        Plugin->Load(InMaestro);
    }

    m_Handle        = std::move(Handle);
    m_Plugin        = std::move(Plugin);
    m_Path          = InPath;
    m_IsInnerLoaded = INNER_LOAD;
    return true;
}

void PluginModule::Unload(const bool INNER_UNLOAD)
{
    if (!m_Handle)
    {
        return;
    }

    if (m_Plugin && INNER_UNLOAD)
    {
        m_Plugin->Unload();
        m_IsInnerLoaded = false;
    }

    // The plugin object lives in the shared library, destroy it before the library is closed
    m_Plugin.reset();
    m_Handle.reset();
    m_Path.clear();
}
