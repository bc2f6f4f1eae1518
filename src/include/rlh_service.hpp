#pragma once
/**
 * @file rlh_service.hpp
 * @brief Layer 2: Service modules built on rlh_base.
 *
 * Provides logging (Logger and its sinks) and JSON configuration of the bus (BusConfig).
 * Include this when you need the Logger or need to load a configuration file.
 */
#include "rlh_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/sink.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/bus_options.hpp"
#include "utils/bus_config.hpp"
