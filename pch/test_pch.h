/**
 * @file test_pch.h
 * @author Hayden McAfee (hayden@outlook.com)
 * @date 2021-02-28
 * @copyright Copyright (c) 2021 Hayden McAfee
 * @brief Pre-compiled header for composite-endpoint-source-test
 */

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#define CATCH_CONFIG_ALL_PARTS
#include <catch2/catch.hpp>