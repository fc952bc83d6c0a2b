#pragma once

#include "Plugin.hpp"

namespace MAESTRO
{
    DECLARE_MAESTRO_PLUGIN(DataAnalyzerPlugin,
                           "DataAnalyzer",
                           "Analyze data records and process data into summary statistics",
                           "data",
                           "Maestro",
                           "1.0.0")
} // namespace MAESTRO
