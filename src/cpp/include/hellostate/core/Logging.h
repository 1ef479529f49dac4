#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace hellostate::core
{
    constexpr const char* LOGGER_NAME = "hellostate";

    // Shared module logger. Created on first call with a colored stdout sink at
    // info level, then adjusted by SPDLOG_LEVEL through apply_level_spec.
    // A logger already registered under LOGGER_NAME is reused as is.
    std::shared_ptr<spdlog::logger> logger();

    // Applies an SPDLOG_LEVEL style spec ("debug", "warn,hellostate=trace") to
    // `target` only. A "name=level" entry for target's name wins over a bare
    // level; entries for other loggers and unknown level names are ignored.
    // Returns true when the level changed.
    bool apply_level_spec(spdlog::logger& target, const std::string& spec);
}
