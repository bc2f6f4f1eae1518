#pragma once
/**
 * @file graph_export.hpp
 * @brief Read-only exports of a Registry's wiring: Graphviz DOT and JSON.
 *
 * DOT layout:
 *  - one node per channel, shaped by kind (box = many, ellipse = one,
 *    diamond = at_most_one, cds = feed);
 *  - one node per handler kind, id `handler:<name>`, shape component;
 *  - listen edges channel -> handler, emit edges handler -> channel;
 *  - reachability edges channel -> channel, dotted.
 * All lists are sorted and every identifier is quoted, so the output is stable.
 */
#include "rlh_platform.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace relayhub
{
struct BusConfig;
}

namespace relayhub::bus
{

class Registry;

class RELAYHUB_UTILS_EXPORT GraphExporter
{
  public:
    explicit GraphExporter(const Registry &registry) noexcept : m_registry(registry) {}

    [[nodiscard]] std::string to_dot(const std::string &graph_name = "Hub") const;

    /**
     * @brief `{"channels": [{"name", "kind", "listeners", "emitters"}], "edges": [[from, to]]}`.
     */
    [[nodiscard]] nlohmann::json to_json() const;

    /** @throws std::runtime_error if the file cannot be written. */
    void write_dot_file(const std::filesystem::path &path,
                        const std::string &graph_name = "Hub") const;

    /**
     * @brief Writes the DOT file named by `config.graph_export_path`.
     * @return false if no path is configured.
     * @throws std::runtime_error if the file cannot be written.
     */
    bool write_configured(const BusConfig &config) const;

  private:
    const Registry &m_registry;
};

} // namespace relayhub::bus
