#include "Settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

using namespace MAESTRO;

namespace
{
    /// @brief Parse an unsigned integer in [MINIMUM, MAXIMUM]. The whole text must be a number
    bool ParseUnsigned(const std::string& Text, const uint64_t MINIMUM, const uint64_t MAXIMUM, uint64_t& OutValue)
    {
        if (Text.empty() || Text.find_first_not_of("0123456789") != std::string::npos)
        {
            return false;
        }

        try
        {
            const auto VALUE = std::stoull(Text);
            if (VALUE < MINIMUM || VALUE > MAXIMUM)
            {
                return false;
            }
            OutValue = VALUE;
            return true;
        }
        catch (const std::out_of_range&)
        {
            return false;
        }
    }

    bool ApplyPort(const uint64_t VALUE, MaestroSettings& Settings)
    {
        if (VALUE == 0 || VALUE > std::numeric_limits<uint16_t>::max())
        {
            std::cerr << "Invalid port: " << VALUE << std::endl;
            return false;
        }
        Settings.Port = static_cast<uint16_t>(VALUE);
        return true;
    }

    bool ApplyErrorWindow(const uint64_t VALUE, MaestroSettings& Settings)
    {
        if (VALUE == 0)
        {
            std::cerr << "Invalid error window: " << VALUE << std::endl;
            return false;
        }
        Settings.ErrorWindow = static_cast<std::size_t>(VALUE);
        return true;
    }

    bool ApplyExecutionMode(const std::string& Name, MaestroSettings& Settings)
    {
        const auto MODE = ExecutionModeFromString(Name);
        if (!MODE)
        {
            std::cerr << "Invalid execution mode: " << Name << std::endl;
            return false;
        }
        Settings.ExecutionMode = *MODE;
        return true;
    }
} // namespace

MaestroSettings MaestroSettings::Load(const std::string& SettingsFile)
{
    MaestroSettings Settings;

    if (std::filesystem::exists(SettingsFile))
    {
        std::ifstream     File(SettingsFile);
        std::stringstream FileContents;
        FileContents << File.rdbuf();

        try
        {
            Settings.ApplyJson(web::json::value::parse(FileContents.str()));
        }
        catch (const web::json::json_exception& Exception)
        {
            std::cerr << "Failed to parse settings file " << SettingsFile << ": " << Exception.what() << std::endl;
        }
    }

    Settings.ApplyEnvironment();
    return Settings;
}

bool MaestroSettings::ApplyJson(const web::json::value& JSettings)
{
    if (!JSettings.is_object())
    {
        std::cerr << "Settings must be a json object" << std::endl;
        return false;
    }

    bool IsValid = true;

    if (JSettings.has_field(U("database_file")))
    {
        if (JSettings.at(U("database_file")).is_string())
        {
            DatabaseFile = JSettings.at(U("database_file")).as_string();
        }
        else
        {
            std::cerr << "Invalid database_file setting" << std::endl;
            IsValid = false;
        }
    }

    if (JSettings.has_field(U("plugin_directory")))
    {
        if (JSettings.at(U("plugin_directory")).is_string())
        {
            PluginDirectory = JSettings.at(U("plugin_directory")).as_string();
        }
        else
        {
            std::cerr << "Invalid plugin_directory setting" << std::endl;
            IsValid = false;
        }
    }

    if (JSettings.has_field(U("port")))
    {
        const auto& JPort = JSettings.at(U("port"));
        IsValid           = (JPort.is_integer() && JPort.as_number().is_uint64() && ApplyPort(JPort.as_number().to_uint64(), *this)) && IsValid;
    }

    if (JSettings.has_field(U("error_window")))
    {
        const auto& JErrorWindow = JSettings.at(U("error_window"));
        IsValid = (JErrorWindow.is_integer() && JErrorWindow.as_number().is_uint64() && ApplyErrorWindow(JErrorWindow.as_number().to_uint64(), *this)) && IsValid;
    }

    if (JSettings.has_field(U("execution_mode")))
    {
        const auto& JExecutionMode = JSettings.at(U("execution_mode"));
        IsValid                    = (JExecutionMode.is_string() && ApplyExecutionMode(JExecutionMode.as_string(), *this)) && IsValid;
    }

    return IsValid;
}

bool MaestroSettings::ApplyEnvironment()
{
    bool IsValid = true;

    if (const char* pDATABASE_FILE = std::getenv("MAESTRO_DATABASE_FILE"))
    {
        DatabaseFile = pDATABASE_FILE;
    }

    if (const char* pPLUGIN_DIR = std::getenv("MAESTRO_PLUGIN_DIR"))
    {
        PluginDirectory = pPLUGIN_DIR;
    }

    if (const char* pPORT = std::getenv("MAESTRO_PORT"))
    {
        uint64_t Port = 0;
        if (!ParseUnsigned(pPORT, 1, std::numeric_limits<uint16_t>::max(), Port) || !ApplyPort(Port, *this))
        {
            std::cerr << "Ignoring MAESTRO_PORT=" << pPORT << std::endl;
            IsValid = false;
        }
    }

    if (const char* pERROR_WINDOW = std::getenv("MAESTRO_ERROR_WINDOW"))
    {
        uint64_t ErrorWindow = 0;
        if (!ParseUnsigned(pERROR_WINDOW, 1, std::numeric_limits<uint32_t>::max(), ErrorWindow) || !ApplyErrorWindow(ErrorWindow, *this))
        {
            std::cerr << "Ignoring MAESTRO_ERROR_WINDOW=" << pERROR_WINDOW << std::endl;
            IsValid = false;
        }
    }

    if (const char* pEXECUTION_MODE = std::getenv("MAESTRO_EXECUTION_MODE"))
    {
        IsValid = ApplyExecutionMode(pEXECUTION_MODE, *this) && IsValid;
    }

    return IsValid;
}

web::json::value MaestroSettings::ToJson() const
{
    web::json::value JSettings            = web::json::value::object();
    JSettings[U("database_file")]         = web::json::value::string(DatabaseFile);
    JSettings[U("plugin_directory")]      = web::json::value::string(PluginDirectory);
    JSettings[U("port")]                  = web::json::value::number(static_cast<uint32_t>(Port));
    JSettings[U("error_window")]          = web::json::value::number(static_cast<uint64_t>(ErrorWindow));
    JSettings[U("execution_mode")]        = web::json::value::string(ExecutionModeToString(ExecutionMode));
    return JSettings;
}
