#pragma once

#include "Plugin.hpp"

namespace MAESTRO
{
    DECLARE_MAESTRO_PLUGIN(ReportWriterPlugin,
                           "ReportWriter",
                           "Generate report documents from processed data statistics",
                           "data",
                           "Maestro",
                           "1.0.0")
} // namespace MAESTRO
