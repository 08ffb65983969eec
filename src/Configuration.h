/**
 * @file Configuration.h
 * @author Hayden McAfee (hayden@outlook.com)
 * @date 2020-10-24
 * @copyright Copyright (c) 2020 Hayden McAfee
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>

class Configuration
{
public:
    /* Public methods */
    void Load();

    /* Configuration values */
    spdlog::level::level_enum GetLogLevel();
    uint32_t GetDemoProviderCount();
    uint32_t GetDemoChangeCount();

private:
    /* Backing stores */
    spdlog::level::level_enum logLevel = spdlog::level::info;
    uint32_t demoProviderCount = 3;
    uint32_t demoChangeCount = 10;

    /* Private methods */
    spdlog::level::level_enum parseLogLevel(const std::string& variableName, std::string value);
    uint32_t parsePositiveInteger(const std::string& variableName, const std::string& value);
};
