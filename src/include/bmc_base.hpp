#pragma once
/**
 * @file bmc_base.hpp
 * @brief Layer 1: Basic modules built on bmc_platform.
 *
 * Provides format_tools, debug_info and scope_guard. Also includes module_def for
 * lifecycle module registration.
 * Include this when you need formatting, debug utilities, or basic RAII guards.
 */
#include "bmc_platform.hpp"

// Standard library support required by format_tools, debug_info, and guards
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
