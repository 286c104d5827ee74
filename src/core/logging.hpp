#pragma once

#include <string>

/// Install the default spdlog logger: colour console sink, plus a rotating
/// file sink when file is non-empty. Unknown levels fall back to "info".
void init_logging(const std::string& level, const std::string& file = "");
