/**
 * @file Endpoint.h
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#pragma once

#include <fmt/format.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief
 *  Describes a routable endpoint. Endpoints without a RoutePattern are plain endpoints
 *  that can't be matched against a request path.
 */
struct Endpoint
{
    std::string DisplayName;
    std::optional<std::string> RoutePattern;
    std::optional<std::string> RouteName;
    int Order = 0;
    std::vector<std::string> HttpMethods;
    // Route values keep the order they were declared in
    std::vector<std::pair<std::string, std::optional<std::string>>> Defaults;
    std::vector<std::pair<std::string, std::optional<std::string>>> RequiredValues;

    bool operator==(const Endpoint& other) const = default;
};

/**
 * @brief Formats an Endpoint as a single human-readable line for diagnostics
 */
template <>
struct fmt::formatter<Endpoint> : fmt::formatter<std::string_view>
{
    fmt::format_context::iterator format(const Endpoint& endpoint, fmt::format_context& ctx) const;
};
