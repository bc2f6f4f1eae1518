#pragma once
/**
 * @file reachability_graph.hpp
 * @brief Directed channel -> channel graph: "a dispatch on `from` can synchronously cause a
 *        dispatch on `to`".
 *
 * Channels are identified by dense ChannelId indices into an arena owned by the Registry;
 * the graph keeps each channel's name only to visit nodes in a deterministic (sorted by
 * name) order, which makes the reported cycle independent of declaration order.
 */
#include "rlh_platform.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace relayhub::bus
{

using ChannelId = uint32_t;

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

class RELAYHUB_UTILS_EXPORT ReachabilityGraph
{
  public:
    /// @brief Adds a node. Ids must be added densely in order 0, 1, 2, ...
    void add_node(ChannelId id, std::string name);

    /// @return true if the edge was not present before.
    bool add_edge(ChannelId from, ChannelId to);

    [[nodiscard]] bool has_edge(ChannelId from, ChannelId to) const noexcept;
    [[nodiscard]] const std::set<ChannelId> &successors(ChannelId id) const;
    [[nodiscard]] size_t node_count() const noexcept { return m_names.size(); }
    [[nodiscard]] size_t edge_count() const noexcept { return m_edge_count; }
    [[nodiscard]] const std::string &name(ChannelId id) const { return m_names.at(id); }

    /// @brief True if `to` can be reached from `from` through one or more edges.
    [[nodiscard]] bool reaches(ChannelId from, ChannelId to) const;

    /**
     * @brief Depth-first search for a cycle.
     *
     * Roots are visited in sorted name order, successors likewise. Reaching a node that
     * is on the current path is a cycle; the result is the path slice from that node's
     * first occurrence to the end (an open chain: [a, b] stands for a -> b -> a).
     * Fully explored nodes are memoised.
     *
     * @return The first cycle found, or std::nullopt if the graph is acyclic.
     */
    [[nodiscard]] std::optional<std::vector<ChannelId>> find_cycle() const;

    /// @brief All edges, ordered by (from name, to name).
    [[nodiscard]] std::vector<std::pair<ChannelId, ChannelId>> edges() const;

    /// @brief Node ids ordered by name.
    [[nodiscard]] std::vector<ChannelId> sorted_nodes() const;

  private:
    [[nodiscard]] std::vector<ChannelId> sorted(const std::set<ChannelId> &ids) const;

    std::vector<std::string> m_names;
    std::vector<std::set<ChannelId>> m_adjacency;
    size_t m_edge_count = 0;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace relayhub::bus
