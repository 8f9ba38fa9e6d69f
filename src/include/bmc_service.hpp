#pragma once
/**
 * @file bmc_service.hpp
 * @brief Layer 2: Service modules built on bmc_base.
 *
 * Provides lifecycle management, logging and cryptographic utilities.
 * Include this when you need application lifecycle, Logger or CryptoUtils.
 */
#include "bmc_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
