#pragma once
/**
 * @file aio_service.hpp
 * @brief Layer 2: Service modules built on aio_base.
 *
 * Provides the asynchronous Logger, whole-file I/O with atomic replacement
 * and the layered MergeJob configuration.
 * Include this when you need logging, file loading/writing or job files.
 */
#include "aio_base.hpp"

#include "utils/file_io.hpp"
#include "utils/logger.hpp"
#include "utils/merge_config.hpp"
