#pragma once

#include "RunConfig.hpp"

#include <string>
#include <vector>

namespace trafficscenario
{
    struct ConfigParseResult
    {
        bool ok = false;
        RunConfig config{};
        std::vector<std::string> errors;
    };

    std::string runConfigToJson(const RunConfig &config);
    // Missing keys keep their defaults; present keys must be valid.
    ConfigParseResult runConfigFromJson(const std::string &json_text);
} // namespace trafficscenario
