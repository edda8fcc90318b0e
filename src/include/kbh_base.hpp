#pragma once
/**
 * @file kbh_base.hpp
 * @brief Layer 1: Basic modules built on kbh_platform.
 *
 * Provides format_tools, identifier generation, the error taxonomy and scope_guard.
 * Include this when you need formatting, ids, kanbanhub exceptions, or RAII guards.
 */
#include "kbh_platform.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/errors.hpp"
#include "utils/scope_guard.hpp"
#include "utils/uid_utils.hpp"
