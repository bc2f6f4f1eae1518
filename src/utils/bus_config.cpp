/**
 * @file bus_config.cpp
 * @brief BusConfig JSON parsing, environment overrides and application to the process.
 */
#include "rlh_service.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace relayhub
{

// ============================================================================
// Parsing helpers (anonymous namespace)
// ============================================================================

namespace
{

utils::Logger::Level parse_log_level(const std::string &s, const std::string &key)
{
    if (auto lvl = utils::parse_level(s))
        return *lvl;
    throw std::runtime_error("Bus config: invalid '" + key + "' = '" + s +
                             "' (must be 'trace', 'debug', 'info', 'warn', 'error', or 'system')");
}

bus::DedupPolicy parse_dedup(const std::string &s)
{
    const auto token = format_tools::normalize_token(s);
    if (token == "per_instance")
        return bus::DedupPolicy::PerInstance;
    if (token == "per_kind")
        return bus::DedupPolicy::PerKind;
    throw std::runtime_error("Bus config: invalid 'bus.dedup_policy' = '" + s +
                             "' (must be 'per_instance' or 'per_kind')");
}

bus::FailurePolicy parse_on_wiring_error(const std::string &s, const std::string &key)
{
    const auto token = format_tools::normalize_token(s);
    if (token == "throw")
        return bus::FailurePolicy::Throw;
    if (token == "panic")
        return bus::FailurePolicy::Panic;
    throw std::runtime_error("Bus config: invalid '" + key + "' = '" + s +
                             "' (must be 'throw' or 'panic')");
}

size_t parse_capacity(const nlohmann::json &v)
{
    if (!v.is_number_integer())
        throw std::runtime_error("Bus config: 'bus.feed_capacity' must be a non-negative integer");
    const auto n = v.get<int64_t>();
    if (n < 0)
        throw std::runtime_error("Bus config: invalid 'bus.feed_capacity' = " + std::to_string(n) +
                                 " (must be >= 0)");
    return static_cast<size_t>(n);
}

} // anonymous namespace

// ============================================================================
// BusConfig
// ============================================================================

BusConfig BusConfig::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::runtime_error("Bus config: top-level value must be a JSON object");

    BusConfig cfg;
    try
    {
        if (j.contains("logging"))
        {
            const auto &l = j["logging"];
            if (!l.is_object())
                throw std::runtime_error("Bus config: 'logging' must be an object");
            cfg.log_level = parse_log_level(l.value("level", std::string{"info"}), "logging.level");
            cfg.log_file = l.value("file", std::string{});
            cfg.log_use_flock = l.value("use_flock", false);
        }

        if (j.contains("bus"))
        {
            const auto &b = j["bus"];
            if (!b.is_object())
                throw std::runtime_error("Bus config: 'bus' must be an object");
            cfg.dedup_policy = parse_dedup(b.value("dedup_policy", std::string{"per_instance"}));
            cfg.failure_policy = parse_on_wiring_error(
                b.value("on_wiring_error", std::string{"throw"}), "bus.on_wiring_error");
            if (b.contains("feed_capacity"))
                cfg.feed_capacity = parse_capacity(b["feed_capacity"]);
            cfg.graph_export_path = b.value("graph_export", std::string{});
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(std::string("Bus config: wrong value type: ") + e.what());
    }
    return cfg;
}

BusConfig BusConfig::load_file(const std::filesystem::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Bus config: cannot open file: " + path.string());

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Bus config: JSON parse error in '" + path.string() +
                                 "': " + e.what());
    }
    auto cfg = from_json(j);
    LOGGER_INFO("Bus config loaded from '{}'", path.string());
    return cfg;
}

BusConfig BusConfig::load()
{
    BusConfig cfg;
    if (const char *file = std::getenv("RELAYHUB_CONFIG_FILE"); file != nullptr && *file != '\0')
        cfg = load_file(file);
    cfg.apply_env_overrides();
    return cfg;
}

void BusConfig::apply_env_overrides()
{
    if (const char *lvl = std::getenv("RELAYHUB_LOG_LEVEL"); lvl != nullptr && *lvl != '\0')
        log_level = parse_log_level(lvl, "RELAYHUB_LOG_LEVEL");
    if (const char *pol = std::getenv("RELAYHUB_ON_WIRING_ERROR"); pol != nullptr && *pol != '\0')
        failure_policy = parse_on_wiring_error(pol, "RELAYHUB_ON_WIRING_ERROR");
}

nlohmann::json BusConfig::to_json() const
{
    return nlohmann::json{
        {"logging",
         {{"level", utils::level_to_string(log_level)},
          {"file", log_file},
          {"use_flock", log_use_flock}}},
        {"bus",
         {{"dedup_policy", bus::to_string(dedup_policy)},
          {"on_wiring_error", bus::to_string(failure_policy)},
          {"feed_capacity", feed_capacity},
          {"graph_export", graph_export_path}}},
    };
}

bus::RegistryOptions BusConfig::registry_options() const noexcept
{
    bus::RegistryOptions options;
    options.dedup = dedup_policy;
    options.feed_capacity = feed_capacity;
    return options;
}

bool BusConfig::apply() const
{
    auto &logger = utils::Logger::instance();
    logger.set_level(log_level);
    bool ok = true;
    if (log_file.empty())
        logger.set_console();
    else
        ok = logger.set_logfile(log_file, log_use_flock);
    bus::set_failure_policy(failure_policy);
    LOGGER_DEBUG("Bus config applied: level={} sink='{}' on_wiring_error={} dedup={}",
                 utils::level_to_string(log_level), logger.sink_description(),
                 bus::to_string(failure_policy), bus::to_string(dedup_policy));
    return ok;
}

} // namespace relayhub
