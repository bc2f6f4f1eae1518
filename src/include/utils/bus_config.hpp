#pragma once

/**
 * @file bus_config.hpp
 * @brief BusConfig: JSON configuration of logging and bus policies.
 *
 * ## JSON format
 * @code{.json}
 * {
 *   "logging": { "level": "info", "file": "", "use_flock": false },
 *   "bus": {
 *     "dedup_policy": "per_instance",    // or "per_kind"
 *     "on_wiring_error": "throw",        // or "panic"
 *     "feed_capacity": 0,                // 0 = unbounded
 *     "graph_export": ""                 // DOT file written by GraphExporter::write_configured
 *   }
 * }
 * @endcode
 *
 * Every key is optional; missing keys keep the built-in defaults.
 *
 * ## Loading (priority low -> high)
 *  1. Built-in defaults
 *  2. `RELAYHUB_CONFIG_FILE` env var, when set, names the JSON file to load
 *  3. `RELAYHUB_LOG_LEVEL` / `RELAYHUB_ON_WIRING_ERROR` env var overrides
 *
 * Invalid values throw std::runtime_error naming the offending key.
 */

#include "utils/bus_error.hpp"
#include "utils/bus_options.hpp"
#include "utils/logger.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace relayhub
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

struct RELAYHUB_UTILS_EXPORT BusConfig
{
    // logging
    utils::Logger::Level log_level = utils::Logger::Level::L_INFO;
    std::string log_file;      ///< empty = console
    bool log_use_flock = false;

    // bus
    bus::DedupPolicy dedup_policy = bus::DedupPolicy::PerInstance;
    bus::FailurePolicy failure_policy = bus::FailurePolicy::Throw;
    size_t feed_capacity = 0;
    std::string graph_export_path; ///< empty = no automatic DOT export

    /// @throws std::runtime_error on invalid values.
    static BusConfig from_json(const nlohmann::json &j);

    /// @throws std::runtime_error if the file cannot be read, is not JSON, or is invalid.
    static BusConfig load_file(const std::filesystem::path &path);

    /**
     * @brief Defaults, then `RELAYHUB_CONFIG_FILE` (if set), then env var overrides.
     */
    static BusConfig load();

    /// @brief Applies `RELAYHUB_LOG_LEVEL` and `RELAYHUB_ON_WIRING_ERROR` if set.
    void apply_env_overrides();

    [[nodiscard]] nlohmann::json to_json() const;

    [[nodiscard]] bus::RegistryOptions registry_options() const noexcept;

    /**
     * @brief Configures the process: Logger level and sink, bus failure policy.
     * @return false if the log file could not be opened (the console stays active).
     */
    bool apply() const;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace relayhub
