#pragma once
/**
 * @file rlh_base.hpp
 * @brief Layer 1: Basic modules built on rlh_platform.
 *
 * Provides format_tools, debug_info, and the foundational guards: scope_guard and the
 * thread-local dispatch context stack. Also provides the bus error taxonomy and the
 * ExclusivityCell, the leaf of the reentrancy machinery.
 * Include this when you need formatting, debug utilities, RAII guards or cells.
 */
#include "rlh_platform.hpp"

#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/dispatch_context.hpp"
#include "utils/bus_error.hpp"
#include "utils/exclusivity_cell.hpp"
