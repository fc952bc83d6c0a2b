#pragma once

#include <cpprest/json.h>
#include <set>
#include <string>
#include <vector>

namespace MAESTRO
{
    /// @brief Static metadata for one capability provider. Created when a plugin registers and immutable thereafter.
    struct PluginDescriptor final
    {
        struct Defaults
        {
            constexpr static auto CATEGORY = "general";
            constexpr static auto VERSION  = "1.0.0";
        };

        /// @brief The unique identity of the plugin (the name the plugin provides)
        std::string Identity;

        /// @brief Free text describing what the plugin does. Goal-pattern fragments are derived from it
        std::string Description;

        /// @brief The category used to group plugins when suggesting chains
        std::string Category = Defaults::CATEGORY;

        std::vector<std::string> Tags;
        std::vector<std::string> Capabilities;
        std::string              Author;
        std::string              Version = Defaults::VERSION;

        /// @brief Capability-type tags the plugin consumes. Empty means no preconditions
        std::set<std::string> InputTypes;

        /// @brief Capability-type tags the plugin produces
        std::set<std::string> OutputTypes;

        /// @brief Identities of plugins this plugin is known to compose with
        std::set<std::string> CollaboratesWith;

        /// @brief Tie-break weight. Higher runs earlier when otherwise unconstrained
        double ChainPriority = 0.0;

        /// @brief Whether the plugin may seed a chain even though it declares inputs
        bool AutoChainEligible = false;

        web::json::value ToJson() const;

        /**
         * @brief Build a descriptor from its json form. Missing fields keep their defaults.
         *
         * @param JDescriptor The json object
         * @return The descriptor
         * @throws web::json::json_exception If a present field has the wrong type
         */
        static PluginDescriptor FromJson(const web::json::value& JDescriptor);
    };

    /// @brief Convert a list of strings to a json array
    template <typename Container>
    web::json::value StringsToJson(const Container& Strings)
    {
        web::json::value JArray = web::json::value::array();
        for (const auto& String : Strings)
        {
            JArray[JArray.size()] = web::json::value::string(String);
        }
        return JArray;
    }

    /// @brief Convert a json array of strings to a vector. Non-string elements are skipped
    std::vector<std::string> StringsFromJson(const web::json::value& JArray);

} // namespace MAESTRO
