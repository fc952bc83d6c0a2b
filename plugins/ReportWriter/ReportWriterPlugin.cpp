#include "ReportWriterPlugin.hpp"

#include <sstream>
#include <stdexcept>

using namespace MAESTRO;

void ReportWriterPlugin::Load(const Maestro& InMaestro)
{
}

void ReportWriterPlugin::Unload()
{
}

PluginDescriptor ReportWriterPlugin::GetDescriptor() const
{
    PluginDescriptor Descriptor;
    Descriptor.Identity     = std::string(GetName());
    Descriptor.Description  = std::string(GetDescription());
    Descriptor.Category     = std::string(GetCategory());
    Descriptor.Author       = std::string(GetAuthor());
    Descriptor.Version      = std::string(GetVersion());
    Descriptor.Tags         = { "report", "document" };
    Descriptor.Capabilities = { "write summaries" };
    Descriptor.InputTypes   = { "report" };
    Descriptor.OutputTypes  = { "document" };
    return Descriptor;
}

web::json::value ReportWriterPlugin::Execute(const std::string& Command, const web::json::value& Input)
{
    if (Command != "auto_chain" && Command != "write")
    {
        throw std::invalid_argument("Unknown command: " + Command);
    }

    if (!Input.has_object_field(U("statistics")))
    {
        throw std::runtime_error("No statistics to report");
    }

    const auto& JStatistics = Input.at(U("statistics"));

    std::stringstream Document;
    Document << "# Data Report\n\n";
    for (const auto& Field : JStatistics.as_object())
    {
        Document << "- " << Field.first << ": " << Field.second.serialize() << "\n";
    }

    web::json::value JOutput = web::json::value::object();
    JOutput[U("document")]   = web::json::value::string(Document.str());
    return JOutput;
}
