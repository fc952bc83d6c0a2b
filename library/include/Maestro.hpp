#pragma once

#include <cpprest/json.h>
#include <memory>
#include <mutex>
#include <string>

#include "AdmissionGate.hpp"
#include "DiscoveryIndex.hpp"
#include "Plugin.hpp"
#include "PluginChainer.hpp"
#include "PluginRegistry.hpp"
#include "Settings.hpp"

namespace MAESTRO
{
    /**
     * @brief The plugin orchestration engine. Owns the plugin registry, the discovery index, the admission gate and the chainer,
     * and keeps them consistent as plugins come and go.
     */
    class Maestro final
    {
    public:
        explicit Maestro(const MaestroSettings& Settings = MaestroSettings());
        ~Maestro();

        Maestro(const Maestro&)            = delete;
        Maestro& operator=(const Maestro&) = delete;

        /**
         * @brief Register a plugin. The plugin is loaded, indexed for discovery and, if a static analyzer is set, scored.
         *
         * @param Plugin The plugin
         * @return false if the plugin could not be registered (no name, duplicate name, or Load threw)
         */
        bool RegisterPlugin(std::shared_ptr<IPlugin> Plugin);

        /**
         * @brief Load and register every shared-library plugin of a directory.
         *
         * @param Directory The plugin directory
         * @return The number of plugins registered
         */
        std::size_t LoadPlugins(const std::string& Directory);

        /// @brief  Load and register the plugins of the configured plugin directory
        std::size_t LoadPlugins();

        /// @brief  Unload a plugin and remove it from the index and the admission ledger
        /// @return Whether the plugin was registered
        bool UnregisterPlugin(const std::string& Identity);

        /// @brief  Set the analyzer that scores plugins when they are registered
        void SetStaticAnalyzer(std::unique_ptr<IStaticAnalyzer> StaticAnalyzer);

        /**
         * @brief Store an analysis report for a registered plugin.
         *
         * @return false if the plugin is not registered
         */
        bool ScorePlugin(const std::string& Identity, const AnalysisReport& Report);

        /// @brief  Execute one plugin with admission checks and outcome bookkeeping
        ChainRunResult ExecutePlugin(const std::string& Identity, const std::string& Command, const web::json::value& Input, const bool USER_OVERRIDE = false);

        inline const MaestroSettings& GetSettings() const
        {
            return m_Settings;
        }

        inline PluginRegistry& GetRegistry()
        {
            return m_Registry;
        }

        inline DiscoveryIndex& GetDiscoveryIndex()
        {
            return m_DiscoveryIndex;
        }

        inline AdmissionGate& GetAdmissionGate()
        {
            return m_AdmissionGate;
        }

        inline PluginChainer& GetChainer()
        {
            return m_Chainer;
        }

    private:
        MaestroSettings m_Settings;
        PluginRegistry  m_Registry;
        DiscoveryIndex  m_DiscoveryIndex;
        AdmissionGate   m_AdmissionGate;
        PluginChainer   m_Chainer;

        std::mutex                       m_StaticAnalyzerMutex;
        std::unique_ptr<IStaticAnalyzer> m_StaticAnalyzer;
    };

} // namespace MAESTRO
