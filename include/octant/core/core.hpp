#pragma once

/// @file core.hpp
/// @brief Main include file for octant_core module

#include "fwd.hpp"
#include "error.hpp"
#include "id.hpp"
#include "log.hpp"

/// @namespace octant_core
/// @brief Shared infrastructure for octant
///
/// - **Error Handling**: Error kinds and Result<T>
/// - **Identifiers**: Generational entity IDs
/// - **Logging**: spdlog-backed named loggers
