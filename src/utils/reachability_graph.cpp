#include "rlh_base.hpp"
#include "utils/reachability_graph.hpp"

#include <algorithm>
#include <stdexcept>

namespace relayhub::bus
{

void ReachabilityGraph::add_node(ChannelId id, std::string name)
{
    if (id != m_names.size())
        throw std::out_of_range(fmt::format("ReachabilityGraph: node id {} added out of order "
                                            "(expected {})",
                                            id, m_names.size()));
    m_names.push_back(std::move(name));
    m_adjacency.emplace_back();
}

bool ReachabilityGraph::add_edge(ChannelId from, ChannelId to)
{
    if (from >= m_adjacency.size() || to >= m_adjacency.size())
        throw std::out_of_range(fmt::format("ReachabilityGraph: edge {} -> {} names an unknown node",
                                            from, to));
    const bool inserted = m_adjacency[from].insert(to).second;
    if (inserted)
        ++m_edge_count;
    return inserted;
}

bool ReachabilityGraph::has_edge(ChannelId from, ChannelId to) const noexcept
{
    return from < m_adjacency.size() && m_adjacency[from].count(to) != 0;
}

const std::set<ChannelId> &ReachabilityGraph::successors(ChannelId id) const
{
    return m_adjacency.at(id);
}

std::vector<ChannelId> ReachabilityGraph::sorted(const std::set<ChannelId> &ids) const
{
    std::vector<ChannelId> out(ids.begin(), ids.end());
    std::sort(out.begin(), out.end(),
              [this](ChannelId a, ChannelId b) { return m_names[a] < m_names[b]; });
    return out;
}

std::vector<ChannelId> ReachabilityGraph::sorted_nodes() const
{
    std::vector<ChannelId> out(m_names.size());
    for (ChannelId i = 0; i < out.size(); ++i)
        out[i] = i;
    std::sort(out.begin(), out.end(),
              [this](ChannelId a, ChannelId b) { return m_names[a] < m_names[b]; });
    return out;
}

bool ReachabilityGraph::reaches(ChannelId from, ChannelId to) const
{
    if (from >= m_adjacency.size() || to >= m_adjacency.size())
        return false;
    std::vector<bool> seen(m_adjacency.size(), false);
    std::vector<ChannelId> pending(m_adjacency[from].begin(), m_adjacency[from].end());
    while (!pending.empty())
    {
        const ChannelId cur = pending.back();
        pending.pop_back();
        if (cur == to)
            return true;
        if (seen[cur])
            continue;
        seen[cur] = true;
        pending.insert(pending.end(), m_adjacency[cur].begin(), m_adjacency[cur].end());
    }
    return false;
}

namespace
{
enum class Mark : uint8_t
{
    Unvisited,
    OnPath,
    Done,
};
} // namespace

std::optional<std::vector<ChannelId>> ReachabilityGraph::find_cycle() const
{
    std::vector<Mark> marks(m_names.size(), Mark::Unvisited);
    std::vector<ChannelId> path;

    // Iterative DFS; each frame holds a node and its sorted successors still to visit.
    struct Frame
    {
        ChannelId node;
        std::vector<ChannelId> next;
        size_t pos = 0;
    };

    for (ChannelId root : sorted_nodes())
    {
        if (marks[root] != Mark::Unvisited)
            continue;

        std::vector<Frame> stack;
        stack.push_back(Frame{root, sorted(m_adjacency[root])});
        marks[root] = Mark::OnPath;
        path.push_back(root);

        while (!stack.empty())
        {
            Frame &top = stack.back();
            if (top.pos == top.next.size())
            {
                marks[top.node] = Mark::Done;
                path.pop_back();
                stack.pop_back();
                continue;
            }
            const ChannelId child = top.next[top.pos++];
            if (marks[child] == Mark::OnPath)
            {
                auto first = std::find(path.begin(), path.end(), child);
                return std::vector<ChannelId>(first, path.end());
            }
            if (marks[child] == Mark::Unvisited)
            {
                marks[child] = Mark::OnPath;
                path.push_back(child);
                stack.push_back(Frame{child, sorted(m_adjacency[child])});
            }
        }
    }
    return std::nullopt;
}

std::vector<std::pair<ChannelId, ChannelId>> ReachabilityGraph::edges() const
{
    std::vector<std::pair<ChannelId, ChannelId>> out;
    out.reserve(m_edge_count);
    for (ChannelId from : sorted_nodes())
        for (ChannelId to : sorted(m_adjacency[from]))
            out.emplace_back(from, to);
    return out;
}

} // namespace relayhub::bus
