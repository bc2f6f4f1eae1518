#include "rlh_service.hpp"
#include "utils/graph_export.hpp"
#include "utils/registry.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace relayhub::bus
{

namespace
{

const char *shape_of(ChannelKind kind) noexcept
{
    switch (kind)
    {
    case ChannelKind::Many:
        return "box";
    case ChannelKind::One:
        return "ellipse";
    case ChannelKind::AtMostOne:
        return "diamond";
    case ChannelKind::Feed:
        return "cds";
    }
    return "box";
}

std::string handler_node(const std::string &name)
{
    return format_tools::quote_dot_id("handler:" + name);
}

} // namespace

std::string GraphExporter::to_dot(const std::string &graph_name) const
{
    auto out = format_tools::make_buffer("digraph {} {{\n", format_tools::quote_dot_id(graph_name));
    auto it = std::back_inserter(out);
    fmt::format_to(it, "  rankdir=LR;\n");

    const auto channels = m_registry.channel_names();
    for (const auto &name : channels)
    {
        const auto kind = m_registry.channel_kind(*m_registry.find_channel(name));
        fmt::format_to(it, "  {} [shape={}, label={}];\n", format_tools::quote_dot_id(name),
                       shape_of(kind), format_tools::quote_dot_id(name + " (" + to_string(kind) + ")"));
    }

    for (const auto &handler : m_registry.handler_names())
    {
        fmt::format_to(it, "  {} [shape=component, label={}];\n", handler_node(handler),
                       format_tools::quote_dot_id(handler));
    }

    for (const auto &name : channels)
    {
        for (const auto &listener : m_registry.listeners_of(name))
            fmt::format_to(it, "  {} -> {};\n", format_tools::quote_dot_id(name),
                           handler_node(listener));
    }
    for (const auto &name : channels)
    {
        for (const auto &emitter : m_registry.emitters_of(name))
            fmt::format_to(it, "  {} -> {};\n", handler_node(emitter),
                           format_tools::quote_dot_id(name));
    }
    for (const auto &[from, to] : m_registry.edges())
    {
        fmt::format_to(it, "  {} -> {} [style=dotted];\n", format_tools::quote_dot_id(from),
                       format_tools::quote_dot_id(to));
    }

    fmt::format_to(it, "}}\n");
    return fmt::to_string(out);
}

nlohmann::json GraphExporter::to_json() const
{
    nlohmann::json channels = nlohmann::json::array();
    for (const auto &name : m_registry.channel_names())
    {
        channels.push_back({
            {"name", name},
            {"kind", to_string(m_registry.channel_kind(*m_registry.find_channel(name)))},
            {"listeners", m_registry.listeners_of(name)},
            {"emitters", m_registry.emitters_of(name)},
        });
    }

    nlohmann::json edges = nlohmann::json::array();
    for (const auto &[from, to] : m_registry.edges())
        edges.push_back(nlohmann::json::array({from, to}));

    return nlohmann::json{{"channels", std::move(channels)}, {"edges", std::move(edges)}};
}

void GraphExporter::write_dot_file(const std::filesystem::path &path,
                                   const std::string &graph_name) const
{
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f.is_open())
        throw std::runtime_error("GraphExporter: cannot open '" + path.string() + "' for writing");
    f << to_dot(graph_name);
    f.flush();
    if (!f)
        throw std::runtime_error("GraphExporter: failed writing '" + path.string() + "'");
    LOGGER_INFO("wiring graph written to '{}'", path.string());
}

bool GraphExporter::write_configured(const BusConfig &config) const
{
    if (config.graph_export_path.empty())
        return false;
    write_dot_file(config.graph_export_path);
    return true;
}

} // namespace relayhub::bus
