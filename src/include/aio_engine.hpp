#pragma once
/**
 * @file aio_engine.hpp
 * @brief Layer 3: The AIO merge engine.
 *
 * Header detection, layout planning, CRC32 checksums, header building,
 * assembly, layout reports and image inspection, plus the MergeEngine
 * pipeline that ties them together.
 */
#include "aio_service.hpp"

#include "engine/assembler.hpp"
#include "engine/crc32.hpp"
#include "engine/format.hpp"
#include "engine/header_builder.hpp"
#include "engine/header_codec.hpp"
#include "engine/header_detector.hpp"
#include "engine/image_inspector.hpp"
#include "engine/layout_planner.hpp"
#include "engine/layout_report.hpp"
#include "engine/merge_engine.hpp"
#include "engine/merge_error.hpp"
#include "engine/merge_types.hpp"
