/**
 * @file pch.h
 * @author Hayden McAfee (hayden@outlook.com)
 * @date 2021-02-28
 * @copyright Copyright (c) 2021 Hayden McAfee
 * @brief Pre-compiled header for composite-endpoint-source
 */

#include <fmt/core.h>
#include <spdlog/spdlog.h>