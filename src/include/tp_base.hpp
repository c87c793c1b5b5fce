#pragma once
/**
 * @file tp_base.hpp
 * @brief Layer 1: Basic modules built on tp_platform.
 *
 * Provides format_tools (time stamps, hex text, wrapping), debug_info (panic, stack
 * traces, debug messages), Result<T, E>, and module_def for lifecycle registration.
 */
#include "tp_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/result.hpp"
#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/module_def.hpp"
