#include "DataCollectorPlugin.hpp"

#include <stdexcept>

using namespace MAESTRO;

namespace
{
    /// @brief Collected when the input carries no values
    const std::vector<double> SAMPLE_VALUES = { 4.0, 8.0, 15.0, 16.0, 23.0, 42.0 };
} // namespace

void DataCollectorPlugin::Load(const Maestro& InMaestro)
{
}

void DataCollectorPlugin::Unload()
{
}

PluginDescriptor DataCollectorPlugin::GetDescriptor() const
{
    PluginDescriptor Descriptor;
    Descriptor.Identity      = std::string(GetName());
    Descriptor.Description   = std::string(GetDescription());
    Descriptor.Category      = std::string(GetCategory());
    Descriptor.Author        = std::string(GetAuthor());
    Descriptor.Version       = std::string(GetVersion());
    Descriptor.Tags          = { "data", "collection" };
    Descriptor.Capabilities  = { "collect records", "create data" };
    Descriptor.OutputTypes   = { "data", "data/json" };
    Descriptor.ChainPriority = 1.0;
    return Descriptor;
}

web::json::value DataCollectorPlugin::Execute(const std::string& Command, const web::json::value& Input)
{
    if (Command != "auto_chain" && Command != "collect")
    {
        throw std::invalid_argument("Unknown command: " + Command);
    }

    web::json::value JRecords = web::json::value::array();
    if (Input.has_array_field(U("values")))
    {
        for (const auto& JValue : Input.at(U("values")).as_array())
        {
            if (JValue.is_number())
            {
                JRecords[JRecords.size()] = JValue;
            }
        }
    }
    else
    {
        for (const auto VALUE : SAMPLE_VALUES)
        {
            JRecords[JRecords.size()] = web::json::value::number(VALUE);
        }
    }

    web::json::value JOutput    = web::json::value::object();
    JOutput[U("record_count")]  = web::json::value::number(static_cast<uint64_t>(JRecords.size()));
    JOutput[U("records")]       = JRecords;
    return JOutput;
}
