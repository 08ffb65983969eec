/**
 * @file Configuration.cpp
 * @author Hayden McAfee (hayden@outlook.com)
 * @date 2020-10-25
 * @copyright Copyright (c) 2020 Hayden McAfee
 */

#include "Configuration.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

#pragma region Public methods
void Configuration::Load()
{
    // COMPOSITE_ENDPOINTS_LOG_LEVEL -> LogLevel
    if (char* varVal = std::getenv("COMPOSITE_ENDPOINTS_LOG_LEVEL"))
    {
        logLevel = parseLogLevel("COMPOSITE_ENDPOINTS_LOG_LEVEL", std::string(varVal));
    }

    // COMPOSITE_ENDPOINTS_DEMO_PROVIDERS -> DemoProviderCount
    if (char* varVal = std::getenv("COMPOSITE_ENDPOINTS_DEMO_PROVIDERS"))
    {
        demoProviderCount =
            parsePositiveInteger("COMPOSITE_ENDPOINTS_DEMO_PROVIDERS", std::string(varVal));
    }
    else
    {
        spdlog::warn(
            "Using default demo provider count of {}. Set COMPOSITE_ENDPOINTS_DEMO_PROVIDERS "
            "to change it.",
            demoProviderCount);
    }

    // COMPOSITE_ENDPOINTS_DEMO_CHANGES -> DemoChangeCount
    if (char* varVal = std::getenv("COMPOSITE_ENDPOINTS_DEMO_CHANGES"))
    {
        demoChangeCount =
            parsePositiveInteger("COMPOSITE_ENDPOINTS_DEMO_CHANGES", std::string(varVal));
    }
}

spdlog::level::level_enum Configuration::GetLogLevel()
{
    return logLevel;
}

uint32_t Configuration::GetDemoProviderCount()
{
    return demoProviderCount;
}

uint32_t Configuration::GetDemoChangeCount()
{
    return demoChangeCount;
}
#pragma endregion

#pragma region Private methods
spdlog::level::level_enum Configuration::parseLogLevel(
    const std::string& variableName,
    std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return std::tolower(c); });

    // spdlog maps anything it doesn't recognize to "off", so catch typos here
    spdlog::level::level_enum level = spdlog::level::from_str(value);
    if ((level == spdlog::level::off) && (value != "off"))
    {
        std::stringstream errStr;
        errStr << "Invalid value '" << value << "' for " << variableName
            << ", expected one of trace, debug, info, warn, error, critical, off";
        throw std::runtime_error(errStr.str());
    }
    return level;
}

uint32_t Configuration::parsePositiveInteger(
    const std::string& variableName,
    const std::string& value)
{
    std::stringstream errStr;
    errStr << "Invalid value '" << value << "' for " << variableName
        << ", expected a positive integer";

    if (value.empty() ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); }))
    {
        throw std::runtime_error(errStr.str());
    }

    unsigned long long parsed;
    try
    {
        parsed = std::stoull(value);
    }
    catch (const std::out_of_range&)
    {
        throw std::runtime_error(errStr.str());
    }
    if ((parsed == 0) || (parsed > std::numeric_limits<uint32_t>::max()))
    {
        throw std::runtime_error(errStr.str());
    }
    return static_cast<uint32_t>(parsed);
}
#pragma endregion
