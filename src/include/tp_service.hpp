#pragma once
/**
 * @file tp_service.hpp
 * @brief Layer 2: Service modules built on tp_base.
 *
 * Provides lifecycle management, the asynchronous Logger and the layered run
 * configuration.
 */
#include "tp_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/run_config.hpp"
