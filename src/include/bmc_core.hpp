#pragma once
/**
 * @file bmc_core.hpp
 * @brief Layer 3: The bmap-driven copy engine, built on bmc_service.
 *
 * Provides the block-map parser, range planning and batch splitting, the reader/writer
 * pipeline, image and destination I/O, block-device tuning and the CopyEngine that
 * orchestrates a copy run.
 */
#include "bmc_service.hpp"

#include "bmap/errors.hpp"
#include "bmap/metadata.hpp"
#include "bmap/parser.hpp"
#include "bmap/range_planner.hpp"
#include "bmap/batch_splitter.hpp"
#include "bmap/bounded_channel.hpp"
#include "bmap/image_io.hpp"
#include "bmap/pipeline.hpp"
#include "bmap/progress.hpp"
#include "bmap/device_tuner.hpp"
#include "bmap/copy_engine.hpp"
