#pragma once

#include "Plugin.hpp"

namespace MAESTRO
{
    DECLARE_MAESTRO_PLUGIN(DataCollectorPlugin,
                           "DataCollector",
                           "Collects numeric records to process data for analysis",
                           "data",
                           "Maestro",
                           "1.0.0")
} // namespace MAESTRO
