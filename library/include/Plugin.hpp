#pragma once

#include <cpprest/json.h>
#include <memory>
#include <string>
#include <string_view>

#include "PluginDescriptor.hpp"

namespace MAESTRO
{
    struct IPlugin
    {
        virtual ~IPlugin() = default;

        /**
         * @brief Load the plugin. This is called when the plugin is registered with Maestro.
         *
         * @param InMaestro The Maestro instance that is loading the plugin.
         */
        virtual void Load(const class Maestro& InMaestro) = 0;

        /**
         * @brief Unload the plugin. This is called when the plugin is unregistered from Maestro.
         */
        virtual void Unload() = 0;

        /**
         * @brief Get the name of the plugin. The name is the identity of the plugin and must be unique.
         *
         * @return std::string_view The name of the plugin.
         */
        virtual std::string_view GetName() const = 0;

        /**
         * @brief Get the description of the plugin.
         *
         * @return std::string_view The description of the plugin.
         */
        virtual std::string_view GetDescription() const = 0;

        /**
         * @brief Get the category of the plugin. Plugins of the same category are grouped together when suggesting chains.
         *
         * @return std::string_view The category of the plugin.
         */
        virtual std::string_view GetCategory() const = 0;

        virtual std::string_view GetAuthor() const = 0;

        virtual std::string_view GetVersion() const = 0;

        /**
         * @brief Get the full capability metadata of the plugin. The descriptor is what Maestro indexes for discovery and what
         * the chainer uses to order plugins: the input and output capability types decide which plugins can feed which.
         * The identity of the descriptor must match GetName().
         *
         * @return PluginDescriptor The capability metadata of the plugin.
         */
        virtual PluginDescriptor GetDescriptor() const = 0;

        /**
         * @brief Execute a command. Chains always use the "auto_chain" command and pass the accumulated chain context as input.
         *
         * @param Command The command to execute
         * @param Input A json object with the input data
         * @return web::json::value The output. Objects are merged into the chain context field by field, anything else is stored under "result".
         * @throws std::exception When the command fails
         */
        virtual web::json::value Execute(const std::string& Command, const web::json::value& Input) = 0;
    };

    struct PluginModule
    {
         PluginModule();
        ~PluginModule();

        /**
         * @brief Load the plugin from the specified path.
         *
         * @param InPath The path to the plugin.
         * @param InMaestro The Maestro instance that is loading the plugin.
         * @param INNER_LOAD Whether to call Load on the plugin after it is created.
         * @return true If the plugin was loaded successfully, or was already loaded from the same path.
         * @return false If the plugin failed to load. The reason is reported on std::cerr.
         * @throws std::exception Whatever the plugin's Load throws. The module is left unloaded.
         */
        bool Load(const std::string& InPath, const Maestro& InMaestro, const bool INNER_LOAD = false);

        /**
         * @brief Unload the plugin.
         *
         * @param INNER_UNLOAD Whether to call Unload on the plugin before it is destroyed.
         */
        void Unload(const bool INNER_UNLOAD = false);

        inline IPlugin* GetPlugin() const
        {
            return m_Plugin.get();
        }

        inline bool IsLoaded() const
        {
            return m_Handle && m_Plugin;
        }

    protected:
        std::unique_ptr<void, void (*)(void*)> m_Handle;
        std::unique_ptr<IPlugin>               m_Plugin;
        std::string                            m_Path;
        bool                                   m_IsInnerLoaded = false;
    };

} // namespace MAESTRO

#define DECLARE_MAESTRO_PLUGIN(Class, Name, Description, Category, Author, Version)                    \
    class Class final : public MAESTRO::IPlugin                                                        \
    {                                                                                                  \
    public:                                                                                            \
        ~                         Class() override = default;                                          \
        void                      Load(const MAESTRO::Maestro& InMaestro) override;                    \
        void                      Unload() override;                                                   \
        std::string_view          GetName() const override                                             \
        {                                                                                              \
            return Name;                                                                               \
        }                                                                                              \
        std::string_view GetDescription() const override                                               \
        {                                                                                              \
            return Description;                                                                        \
        }                                                                                              \
        std::string_view GetCategory() const override                                                  \
        {                                                                                              \
            return Category;                                                                           \
        }                                                                                              \
        std::string_view GetAuthor() const override                                                    \
        {                                                                                              \
            return Author;                                                                             \
        }                                                                                              \
        std::string_view GetVersion() const override                                                   \
        {                                                                                              \
            return Version;                                                                            \
        }                                                                                              \
        MAESTRO::PluginDescriptor GetDescriptor() const override;                                      \
        web::json::value          Execute(const std::string& Command, const web::json::value& Input) override; \
    };                                                                                                 \
    extern "C" MAESTRO::IPlugin* CreatePlugin()                                                        \
    {                                                                                                  \
        return new Class();                                                                            \
    }                                                                                                  \
    extern "C" const char* GetPluginName()                                                             \
    {                                                                                                  \
        return Name;                                                                                   \
    }
