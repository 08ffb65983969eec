/**
 * @file Endpoint.cpp
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#include "Endpoint.h"

#include <iterator>

namespace
{
    std::vector<std::string> formatValues(
        const std::vector<std::pair<std::string, std::optional<std::string>>>& values)
    {
        std::vector<std::string> returnVal;
        for (const auto& [key, value] : values)
        {
            if (value)
            {
                returnVal.push_back(fmt::format("{} = \"{}\"", key, value.value()));
            }
            else
            {
                returnVal.push_back(fmt::format("{} = null", key));
            }
        }
        return returnVal;
    }
}

fmt::format_context::iterator fmt::formatter<Endpoint>::format(
    const Endpoint& endpoint,
    fmt::format_context& ctx) const
{
    if (!endpoint.RoutePattern)
    {
        return fmt::formatter<std::string_view>::format(
            fmt::format("Non-RouteEndpoint. DisplayName:{}", endpoint.DisplayName),
            ctx);
    }

    std::string pattern = endpoint.RoutePattern.value();
    if (pattern.empty())
    {
        pattern = "\"\"";
    }

    fmt::memory_buffer out;
    fmt::format_to(
        std::back_inserter(out),
        "{}, Defaults: new {{ {} }}, Route Name: {}",
        pattern,
        fmt::join(formatValues(endpoint.Defaults), ", "),
        endpoint.RouteName.value_or(""));
    if (!endpoint.RequiredValues.empty())
    {
        fmt::format_to(
            std::back_inserter(out),
            ", Required Values: new {{ {} }}",
            fmt::join(formatValues(endpoint.RequiredValues), ", "));
    }
    fmt::format_to(std::back_inserter(out), ", Order: {}", endpoint.Order);
    if (!endpoint.HttpMethods.empty())
    {
        fmt::format_to(
            std::back_inserter(out),
            ", Http Methods: {}",
            fmt::join(endpoint.HttpMethods, ", "));
    }
    fmt::format_to(std::back_inserter(out), ", Display Name: {}", endpoint.DisplayName);

    return fmt::formatter<std::string_view>::format(fmt::to_string(out), ctx);
}
