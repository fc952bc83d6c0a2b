#pragma once

#include <cpprest/json.h>
#include <cstdint>
#include <string>

#include "PluginChain.hpp"

namespace MAESTRO
{
    /// @brief The configuration of a Maestro instance
    struct MaestroSettings final
    {
        struct Defaults
        {
            /// @brief The discovery index database
            constexpr static auto DATABASE_FILE = "data/maestro_index.db";

            /// @brief The directory shared-library plugins are loaded from
            constexpr static auto PLUGIN_DIRECTORY = "plugins";

            constexpr static uint16_t PORT = 5000;

            /// @brief The number of most recent executions a plugin's error frequency is computed over
            constexpr static std::size_t ERROR_WINDOW = 50;

            constexpr static auto EXECUTION_MODE = EChainExecutionMode::Default;

            /// @brief The settings file read by Load
            constexpr static auto SETTINGS_FILE = ".maestro.json";
        };

        std::string         DatabaseFile    = Defaults::DATABASE_FILE;
        std::string         PluginDirectory = Defaults::PLUGIN_DIRECTORY;
        uint16_t            Port            = Defaults::PORT;
        std::size_t         ErrorWindow     = Defaults::ERROR_WINDOW;
        EChainExecutionMode ExecutionMode   = Defaults::EXECUTION_MODE;

        /**
         * @brief Load the settings. The defaults are overridden by the settings file (if it exists), which is overridden by the
         * environment (MAESTRO_DATABASE_FILE, MAESTRO_PLUGIN_DIR, MAESTRO_PORT, MAESTRO_ERROR_WINDOW, MAESTRO_EXECUTION_MODE).
         * Invalid values are reported and ignored.
         *
         * @param SettingsFile The json settings file
         * @return The settings
         */
        static MaestroSettings Load(const std::string& SettingsFile = Defaults::SETTINGS_FILE);

        /**
         * @brief Apply the fields of a json object (database_file, plugin_directory, port, error_window, execution_mode).
         *
         * @param JSettings The json object
         * @return false if any present field was invalid. Valid fields are applied regardless
         */
        bool ApplyJson(const web::json::value& JSettings);

        /// @brief  Apply the MAESTRO_* environment variables
        /// @return false if any set variable was invalid. Valid variables are applied regardless
        bool ApplyEnvironment();

        web::json::value ToJson() const;
    };

} // namespace MAESTRO
