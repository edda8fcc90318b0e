#pragma once
/**
 * @file kbh_service.hpp
 * @brief Layer 2: Service modules built on kbh_base.
 *
 * Provides logging, configuration and retry backoff strategies.
 */
#include "kbh_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"
#include "utils/service_config.hpp"
