#include "DataAnalyzerPlugin.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

using namespace MAESTRO;

void DataAnalyzerPlugin::Load(const Maestro& InMaestro)
{
}

void DataAnalyzerPlugin::Unload()
{
}

PluginDescriptor DataAnalyzerPlugin::GetDescriptor() const
{
    PluginDescriptor Descriptor;
    Descriptor.Identity         = std::string(GetName());
    Descriptor.Description      = std::string(GetDescription());
    Descriptor.Category         = std::string(GetCategory());
    Descriptor.Author           = std::string(GetAuthor());
    Descriptor.Version          = std::string(GetVersion());
    Descriptor.Tags             = { "data", "statistics" };
    Descriptor.Capabilities     = { "compute mean", "compute range" };
    Descriptor.InputTypes       = { "data" };
    Descriptor.OutputTypes      = { "report" };
    Descriptor.CollaboratesWith = { "DataCollector", "ReportWriter" };
    Descriptor.ChainPriority    = 0.5;
    return Descriptor;
}

web::json::value DataAnalyzerPlugin::Execute(const std::string& Command, const web::json::value& Input)
{
    if (Command != "auto_chain" && Command != "analyze")
    {
        throw std::invalid_argument("Unknown command: " + Command);
    }

    if (!Input.has_array_field(U("records")) || Input.at(U("records")).size() == 0)
    {
        throw std::runtime_error("No records to analyze");
    }

    double Sum     = 0.0;
    double Minimum = std::numeric_limits<double>::max();
    double Maximum = std::numeric_limits<double>::lowest();
    for (const auto& JRecord : Input.at(U("records")).as_array())
    {
        const auto VALUE = JRecord.as_double();
        Sum             += VALUE;
        Minimum          = std::min(Minimum, VALUE);
        Maximum          = std::max(Maximum, VALUE);
    }

    const auto COUNT = Input.at(U("records")).size();

    web::json::value JStatistics  = web::json::value::object();
    JStatistics[U("count")]       = web::json::value::number(static_cast<uint64_t>(COUNT));
    JStatistics[U("sum")]         = web::json::value::number(Sum);
    JStatistics[U("mean")]        = web::json::value::number(Sum / COUNT);
    JStatistics[U("min")]         = web::json::value::number(Minimum);
    JStatistics[U("max")]         = web::json::value::number(Maximum);

    web::json::value JOutput  = web::json::value::object();
    JOutput[U("statistics")]  = JStatistics;
    return JOutput;
}
