#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "Plugin.hpp"

namespace MAESTRO
{
    /**
     * @brief Maps plugin identities to live plugin instances. Plugins can be created in-process or loaded from shared libraries;
     * a plugin loaded from a shared library keeps its library open for as long as anyone holds the plugin.
     */
    class PluginRegistry final
    {
    public:
        /**
         * @brief Register a plugin under its name.
         *
         * @param Plugin The plugin
         * @return false if the plugin is null, has no name or a plugin with the same name is already registered
         */
        bool Register(std::shared_ptr<IPlugin> Plugin);

        /**
         * @brief Unregister a plugin.
         *
         * @param Identity The name of the plugin
         * @return The plugin that was registered, or nullptr
         */
        std::shared_ptr<IPlugin> Unregister(const std::string& Identity);

        std::shared_ptr<IPlugin> Find(const std::string& Identity) const;

        bool Contains(const std::string& Identity) const;

        /// @brief  Get the names of all registered plugins, sorted
        std::vector<std::string> GetIdentities() const;

        std::size_t GetCount() const;

        /**
         * @brief Load a plugin from a shared library. The plugin is not registered and its Load function is not called.
         *
         * @param InPath The path of the shared library
         * @param InMaestro The Maestro instance loading the plugin
         * @return The plugin, or nullptr if the library is not a plugin
         */
        static std::shared_ptr<IPlugin> LoadModule(const std::string& InPath, const class Maestro& InMaestro);

        /// @brief  Get the shared libraries in a directory, sorted by path
        static std::vector<std::string> FindModules(const std::string& Directory);

    private:
        mutable std::shared_mutex                       m_Mutex;
        std::map<std::string, std::shared_ptr<IPlugin>> m_Plugins;
    };

} // namespace MAESTRO
