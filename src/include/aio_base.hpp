#pragma once
/**
 * @file aio_base.hpp
 * @brief Layer 1: Basic modules with no runtime services.
 *
 * Provides format_tools, little-endian field access, the Result<T, E> error
 * type and the scope guard. Include this when you need formatting, byte
 * order helpers or basic RAII guards.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "aiomerge_export.h"

#include "utils/byte_order.hpp"
#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
