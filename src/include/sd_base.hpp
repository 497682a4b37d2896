#pragma once
/**
 * @file sd_base.hpp
 * @brief Layer 1: basic utilities with no lifecycle of their own.
 *
 * Pulls in the platform layer, fmt, the formatting helpers, panic/debug support, the scope
 * guard, `Result<T, E>` and the ModuleDef builder used by every service module.
 */
#include "sd_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
#include "utils/result.hpp"
