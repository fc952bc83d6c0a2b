#include "PluginDescriptor.hpp"

using namespace MAESTRO;

std::vector<std::string> MAESTRO::StringsFromJson(const web::json::value& JArray)
{
    std::vector<std::string> Strings;
    if (!JArray.is_array())
    {
        return Strings;
    }

    for (const auto& JString : JArray.as_array())
    {
        if (JString.is_string())
        {
            Strings.push_back(JString.as_string());
        }
    }
    return Strings;
}

web::json::value PluginDescriptor::ToJson() const
{
    web::json::value JDescriptor            = web::json::value::object();
    JDescriptor[U("identity")]              = web::json::value::string(Identity);
    JDescriptor[U("description")]           = web::json::value::string(Description);
    JDescriptor[U("category")]              = web::json::value::string(Category);
    JDescriptor[U("tags")]                  = StringsToJson(Tags);
    JDescriptor[U("capabilities")]          = StringsToJson(Capabilities);
    JDescriptor[U("author")]                = web::json::value::string(Author);
    JDescriptor[U("version")]               = web::json::value::string(Version);
    JDescriptor[U("input_types")]           = StringsToJson(InputTypes);
    JDescriptor[U("output_types")]          = StringsToJson(OutputTypes);
    JDescriptor[U("collaborates_with")]     = StringsToJson(CollaboratesWith);
    JDescriptor[U("chain_priority")]        = web::json::value::number(ChainPriority);
    JDescriptor[U("auto_chain_eligible")]   = web::json::value::boolean(AutoChainEligible);
    return JDescriptor;
}

PluginDescriptor PluginDescriptor::FromJson(const web::json::value& JDescriptor)
{
    PluginDescriptor Descriptor;

    if (JDescriptor.has_field(U("identity")))
    {
        Descriptor.Identity = JDescriptor.at(U("identity")).as_string();
    }
    if (JDescriptor.has_field(U("description")))
    {
        Descriptor.Description = JDescriptor.at(U("description")).as_string();
    }
    if (JDescriptor.has_field(U("category")))
    {
        Descriptor.Category = JDescriptor.at(U("category")).as_string();
    }
    if (JDescriptor.has_field(U("author")))
    {
        Descriptor.Author = JDescriptor.at(U("author")).as_string();
    }
    if (JDescriptor.has_field(U("version")))
    {
        Descriptor.Version = JDescriptor.at(U("version")).as_string();
    }
    if (JDescriptor.has_field(U("chain_priority")))
    {
        Descriptor.ChainPriority = JDescriptor.at(U("chain_priority")).as_double();
    }
    if (JDescriptor.has_field(U("auto_chain_eligible")))
    {
        Descriptor.AutoChainEligible = JDescriptor.at(U("auto_chain_eligible")).as_bool();
    }

    if (JDescriptor.has_field(U("tags")))
    {
        Descriptor.Tags = StringsFromJson(JDescriptor.at(U("tags")));
    }
    if (JDescriptor.has_field(U("capabilities")))
    {
        Descriptor.Capabilities = StringsFromJson(JDescriptor.at(U("capabilities")));
    }
    if (JDescriptor.has_field(U("input_types")))
    {
        const auto INPUT_TYPES = StringsFromJson(JDescriptor.at(U("input_types")));
        Descriptor.InputTypes  = { INPUT_TYPES.begin(), INPUT_TYPES.end() };
    }
    if (JDescriptor.has_field(U("output_types")))
    {
        const auto OUTPUT_TYPES = StringsFromJson(JDescriptor.at(U("output_types")));
        Descriptor.OutputTypes  = { OUTPUT_TYPES.begin(), OUTPUT_TYPES.end() };
    }
    if (JDescriptor.has_field(U("collaborates_with")))
    {
        const auto COLLABORATORS    = StringsFromJson(JDescriptor.at(U("collaborates_with")));
        Descriptor.CollaboratesWith = { COLLABORATORS.begin(), COLLABORATORS.end() };
    }

    return Descriptor;
}
