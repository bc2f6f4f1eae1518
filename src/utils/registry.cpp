/**
 * @file registry.cpp
 * @brief Registry implementation: channel arena, construction frames, scratch-graph
 *        validation and unsubscribe bookkeeping.
 */
#include "rlh_service.hpp"
#include "utils/registry.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <unordered_map>

namespace relayhub::bus
{

namespace
{
// Registries with an open construction frame on this thread, innermost last.
thread_local std::vector<const Registry *> t_active_registries;

void pop_active(const Registry *registry) noexcept
{
    auto it = std::find(t_active_registries.rbegin(), t_active_registries.rend(), registry);
    if (it != t_active_registries.rend())
        t_active_registries.erase(std::next(it).base());
}
} // namespace

struct ChannelRecord
{
    std::string name;
    ChannelKind kind;
    std::set<HandlerId> listeners;
    std::set<HandlerId> emitters;
};

struct HandlerRecord
{
    HandlerIdentity identity;
    bool has_wiring = false; ///< first committed wiring recorded below
    std::set<ChannelId> listens;
    std::set<ChannelId> emits;
    size_t live_subscriptions = 0;
};

struct StagedJoin
{
    std::function<void()> join;
    std::function<void()> leave;
};

// Committed wiring as it stood before a frame's first nested subscription committed.
struct WiringSnapshot
{
    ReachabilityGraph graph;
    std::vector<std::pair<std::set<HandlerId>, std::set<HandlerId>>> members; ///< per channel
    std::vector<HandlerRecord> handlers;
};

struct ConstructionFrame
{
    HandlerId handler;
    std::set<ChannelId> listens;
    std::set<ChannelId> emits;
    std::vector<StagedJoin> joins;
    std::vector<uint64_t> children; ///< nested subscriptions committed inside this frame
    std::optional<WiringSnapshot> before_children;
};

struct Subscription
{
    HandlerId handler;
    std::vector<std::function<void()>> leaves;
};

struct RegistryImpl
{
    RegistryOptions options;
    std::vector<ChannelRecord> channels;
    std::unordered_map<std::string, ChannelId> channel_by_name;
    std::vector<HandlerRecord> handlers;
    std::unordered_map<std::string, HandlerId> handler_by_key;
    ReachabilityGraph graph;
    std::vector<ConstructionFrame> frames;
    std::unordered_map<uint64_t, Subscription> subscriptions;

    [[nodiscard]] std::vector<std::string> names_of(const std::set<HandlerId> &ids) const
    {
        std::vector<std::string> out;
        out.reserve(ids.size());
        for (HandlerId id : ids)
            out.push_back(handlers[id].identity.name);
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return out;
    }

    [[nodiscard]] bool in_graph(ChannelId id) const
    {
        return channels[id].kind != ChannelKind::Feed;
    }

    // Handlers that listen on `from` and emit on `to`, counting the frame being validated.
    [[nodiscard]] std::vector<std::string> hop_handlers(ChannelId from, ChannelId to,
                                                        const ConstructionFrame &frame) const
    {
        std::set<HandlerId> listeners = channels[from].listeners;
        std::set<HandlerId> emitters = channels[to].emitters;
        if (frame.listens.count(from) != 0)
            listeners.insert(frame.handler);
        if (frame.emits.count(to) != 0)
            emitters.insert(frame.handler);
        std::set<HandlerId> both;
        std::set_intersection(listeners.begin(), listeners.end(), emitters.begin(),
                              emitters.end(), std::inserter(both, both.begin()));
        return names_of(both);
    }

    [[nodiscard]] WiringSnapshot snapshot() const
    {
        WiringSnapshot snap{graph, {}, handlers};
        snap.members.reserve(channels.size());
        for (const auto &c : channels)
            snap.members.emplace_back(c.listeners, c.emitters);
        return snap;
    }

    // Channels and handlers created since the snapshot are kept, with their wiring cleared.
    // Live subscription counts are not restored; unsubscribing the children adjusts them.
    void restore(WiringSnapshot &&snap)
    {
        graph = std::move(snap.graph);
        for (size_t id = graph.node_count(); id < channels.size(); ++id)
            graph.add_node(static_cast<ChannelId>(id), channels[id].name);
        for (size_t id = 0; id < channels.size(); ++id)
        {
            if (id < snap.members.size())
            {
                channels[id].listeners = std::move(snap.members[id].first);
                channels[id].emitters = std::move(snap.members[id].second);
            }
            else
            {
                channels[id].listeners.clear();
                channels[id].emitters.clear();
            }
        }
        for (size_t id = 0; id < handlers.size(); ++id)
        {
            auto &h = handlers[id];
            if (id < snap.handlers.size())
            {
                h.has_wiring = snap.handlers[id].has_wiring;
                h.listens = std::move(snap.handlers[id].listens);
                h.emits = std::move(snap.handlers[id].emits);
            }
            else
            {
                h.has_wiring = false;
                h.listens.clear();
                h.emits.clear();
            }
        }
    }

    /// Undoes the nested subscriptions a discarded frame committed, innermost first.
    void roll_back_children(ConstructionFrame &frame) noexcept
    {
        for (auto child = frame.children.rbegin(); child != frame.children.rend(); ++child)
        {
            auto it = subscriptions.find(*child);
            if (it == subscriptions.end())
                continue; // unsubscribed by the parent itself
            auto &leaves = it->second.leaves;
            while (!leaves.empty())
            {
                try
                {
                    leaves.back()();
                }
                catch (const std::exception &e)
                {
                    LOGGER_ERROR("rolling back nested subscription of cell #{}: {}", *child,
                                 e.what());
                }
                leaves.pop_back();
            }
            auto &h = handlers[it->second.handler];
            if (h.live_subscriptions > 0)
                --h.live_subscriptions;
            LOGGER_DEBUG("nested subscription of '{}' (cell #{}) rolled back",
                         h.identity.name, *child);
            subscriptions.erase(it);
        }
        if (frame.before_children)
        {
            try
            {
                restore(std::move(*frame.before_children));
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("restoring wiring after a discarded subscription failed: {}",
                             e.what());
            }
        }
    }
};

Registry::Registry(RegistryOptions options) : pImpl(std::make_unique<RegistryImpl>())
{
    pImpl->options = options;
}

Registry::~Registry()
{
    if (!pImpl->frames.empty())
    {
        LOGGER_WARN("Registry destroyed with {} open subscription frame(s)", pImpl->frames.size());
        for (size_t i = 0; i < pImpl->frames.size(); ++i)
            pop_active(this);
    }
}

const RegistryOptions &Registry::options() const noexcept
{
    return pImpl->options;
}

// ============================================================================
// Channel names
// ============================================================================

ChannelId Registry::declare_channel(std::string_view name, ChannelKind kind)
{
    std::string key(name);
    if (pImpl->channel_by_name.count(key) != 0)
    {
        raise_error(BusErrorKind::DuplicateChannelName,
                    fmt::format("channel name '{}' is already declared on this registry", key));
    }
    const auto id = static_cast<ChannelId>(pImpl->channels.size());
    pImpl->graph.add_node(id, key);
    pImpl->channels.push_back(ChannelRecord{key, kind, {}, {}});
    pImpl->channel_by_name.emplace(std::move(key), id);
    LOGGER_TRACE("channel '{}' declared (#{}, {})", name, id, to_string(kind));
    return id;
}

std::optional<ChannelId> Registry::find_channel(std::string_view name) const
{
    auto it = pImpl->channel_by_name.find(std::string(name));
    if (it == pImpl->channel_by_name.end())
        return std::nullopt;
    return it->second;
}

const std::string &Registry::channel_name(ChannelId id) const
{
    if (id >= pImpl->channels.size())
        raise_error(BusErrorKind::UnknownChannel, fmt::format("unknown channel id {}", id));
    return pImpl->channels[id].name;
}

ChannelKind Registry::channel_kind(ChannelId id) const
{
    if (id >= pImpl->channels.size())
        raise_error(BusErrorKind::UnknownChannel, fmt::format("unknown channel id {}", id));
    return pImpl->channels[id].kind;
}

size_t Registry::channel_count() const noexcept
{
    return pImpl->channels.size();
}

// ============================================================================
// Construction frames
// ============================================================================

const Registry *Registry::active() noexcept
{
    return t_active_registries.empty() ? nullptr : t_active_registries.back();
}

void Registry::begin_subscription(const HandlerIdentity &identity)
{
    HandlerId handler = 0;
    auto it = pImpl->handler_by_key.find(identity.key);
    if (it == pImpl->handler_by_key.end())
    {
        handler = static_cast<HandlerId>(pImpl->handlers.size());
        pImpl->handlers.push_back(HandlerRecord{identity, false, {}, {}, 0});
        pImpl->handler_by_key.emplace(identity.key, handler);
    }
    else
    {
        handler = it->second;
    }
    pImpl->frames.push_back(ConstructionFrame{handler, {}, {}, {}, {}, std::nullopt});
    t_active_registries.push_back(this);
    RLH_DEBUG("subscription frame opened for '{}' (depth {})", identity.name, pImpl->frames.size());
}

void Registry::require_frame(ChannelId channel, const char *what) const
{
    const Registry *current = active();
    if (current == nullptr)
    {
        raise_error(BusErrorKind::NoActiveSubscription,
                    fmt::format("{} outside of a subscription", what));
    }
    if (current != this)
    {
        raise_error(BusErrorKind::RegistryMismatch,
                    fmt::format("{} on a container of another registry", what));
    }
    if (channel >= pImpl->channels.size())
    {
        raise_error(BusErrorKind::UnknownChannel,
                    fmt::format("{}: channel id {} is not declared on this registry", what, channel));
    }
}

void Registry::record_listen(ChannelId channel)
{
    require_frame(channel, "listen");
    auto &frame = pImpl->frames.back();
    if (!frame.listens.insert(channel).second)
    {
        raise_error(BusErrorKind::DuplicateDeclaration,
                    fmt::format("handler '{}' already declared listen on '{}'",
                                pImpl->handlers[frame.handler].identity.name,
                                pImpl->channels[channel].name));
    }
}

void Registry::record_emit(ChannelId channel)
{
    require_frame(channel, "emit");
    auto &frame = pImpl->frames.back();
    if (!frame.emits.insert(channel).second)
    {
        raise_error(BusErrorKind::DuplicateDeclaration,
                    fmt::format("handler '{}' already declared emit on '{}'",
                                pImpl->handlers[frame.handler].identity.name,
                                pImpl->channels[channel].name));
    }
}

void Registry::stage_join(std::function<void()> join, std::function<void()> leave)
{
    if (pImpl->frames.empty() || active() != this)
    {
        raise_error(BusErrorKind::NoActiveSubscription, "join staged outside of a subscription");
    }
    pImpl->frames.back().joins.push_back(StagedJoin{std::move(join), std::move(leave)});
}

void Registry::end_subscription(uint64_t cell_id)
{
    if (pImpl->frames.empty())
        raise_error(BusErrorKind::NoActiveSubscription, "no subscription frame to end");

    ConstructionFrame frame = std::move(pImpl->frames.back());
    pImpl->frames.pop_back();
    pop_active(this);

    auto &handler = pImpl->handlers[frame.handler];
    const std::string &handler_name = handler.identity.name;

    const bool identical_repeat = handler.has_wiring && handler.listens == frame.listens &&
                                  handler.emits == frame.emits;
    const bool skip_validation =
        pImpl->options.dedup == DedupPolicy::PerKind && identical_repeat;

    std::optional<ReachabilityGraph> staged;
    if (!skip_validation)
    {
        if (pImpl->options.dedup == DedupPolicy::PerKind && handler.has_wiring)
        {
            LOGGER_WARN("handler kind '{}' subscribed with wiring that differs from its first "
                        "subscription; validating it separately",
                        handler_name);
        }

        ReachabilityGraph scratch = pImpl->graph;
        bool added = false;
        for (ChannelId from : frame.listens)
        {
            if (!pImpl->in_graph(from))
                continue;
            for (ChannelId to : frame.emits)
            {
                if (pImpl->in_graph(to))
                    added |= scratch.add_edge(from, to);
            }
        }

        // The committed graph is acyclic, so only new edges can close a cycle.
        if (added)
        {
            if (auto cycle = scratch.find_cycle())
            {
                std::vector<std::string> chain;
                std::vector<RecursionHop> hops;
                for (size_t i = 0; i < cycle->size(); ++i)
                {
                    const ChannelId from = (*cycle)[i];
                    const ChannelId to = (*cycle)[(i + 1) % cycle->size()];
                    chain.push_back(pImpl->channels[from].name);
                    hops.push_back(RecursionHop{pImpl->channels[from].name,
                                                pImpl->channels[to].name,
                                                pImpl->hop_handlers(from, to, frame)});
                }
                LOGGER_DEBUG("subscription of '{}' rejected", handler_name);
                pImpl->roll_back_children(frame);
                raise(RecursionDetected(std::move(chain), std::move(hops)));
            }
            staged = std::move(scratch);
        }
    }

    // Container joins run before the graph commit; a failing join undoes the earlier ones.
    std::vector<std::function<void()>> leaves;
    leaves.reserve(frame.joins.size());
    try
    {
        for (auto &staged_join : frame.joins)
        {
            staged_join.join();
            leaves.push_back(std::move(staged_join.leave));
        }
    }
    catch (...)
    {
        for (auto it = leaves.rbegin(); it != leaves.rend(); ++it)
            (*it)();
        pImpl->roll_back_children(frame);
        throw;
    }

    // A parent frame on this registry takes over this subscription and its children, so
    // discarding the parent later undoes them too.
    ConstructionFrame *parent = pImpl->frames.empty() ? nullptr : &pImpl->frames.back();
    if (parent != nullptr && !parent->before_children)
    {
        parent->before_children = frame.before_children ? std::move(frame.before_children)
                                                        : std::optional(pImpl->snapshot());
    }

    if (staged)
        pImpl->graph = std::move(*staged);
    for (ChannelId id : frame.listens)
        pImpl->channels[id].listeners.insert(frame.handler);
    for (ChannelId id : frame.emits)
        pImpl->channels[id].emitters.insert(frame.handler);
    if (!handler.has_wiring)
    {
        handler.has_wiring = true;
        handler.listens = frame.listens;
        handler.emits = frame.emits;
    }
    ++handler.live_subscriptions;

    auto &subscription = pImpl->subscriptions[cell_id];
    subscription.handler = frame.handler;
    for (auto &leave : leaves)
        subscription.leaves.push_back(std::move(leave));
    if (parent != nullptr)
    {
        parent->children.insert(parent->children.end(), frame.children.begin(),
                                frame.children.end());
        parent->children.push_back(cell_id);
    }

    LOGGER_DEBUG("subscription of '{}' committed: cell #{}, {} listen(s), {} emit(s){}",
                 handler_name, cell_id, frame.listens.size(), frame.emits.size(),
                 skip_validation ? " (repeat of known wiring)" : "");
}

void Registry::abort_subscription() noexcept
{
    if (pImpl->frames.empty())
        return;
    ConstructionFrame frame = std::move(pImpl->frames.back());
    pImpl->frames.pop_back();
    pop_active(this);
    pImpl->roll_back_children(frame);
}

bool Registry::in_subscription() const noexcept
{
    return !pImpl->frames.empty();
}

size_t Registry::subscription_depth() const noexcept
{
    return pImpl->frames.size();
}

// ============================================================================
// Unsubscribe
// ============================================================================

void Registry::unsubscribe(uint64_t cell_id)
{
    auto it = pImpl->subscriptions.find(cell_id);
    if (it == pImpl->subscriptions.end())
    {
        raise_error(BusErrorKind::NotSubscribed,
                    fmt::format("cell #{} is not subscribed to this registry", cell_id));
    }

    auto &leaves = it->second.leaves;
    while (!leaves.empty())
    {
        // A leave that throws (e.g. ContainerBusy) stays recorded so the call can be retried.
        leaves.back()();
        leaves.pop_back();
    }

    auto &handler = pImpl->handlers[it->second.handler];
    if (handler.live_subscriptions > 0)
        --handler.live_subscriptions;
    LOGGER_DEBUG("cell #{} of '{}' unsubscribed", cell_id, handler.identity.name);
    pImpl->subscriptions.erase(it);
}

bool Registry::is_subscribed(uint64_t cell_id) const noexcept
{
    return pImpl->subscriptions.count(cell_id) != 0;
}

size_t Registry::subscription_count() const noexcept
{
    return pImpl->subscriptions.size();
}

// ============================================================================
// Diagnostics
// ============================================================================

std::vector<std::string> Registry::channel_names() const
{
    std::vector<std::string> out;
    out.reserve(pImpl->channels.size());
    for (const auto &c : pImpl->channels)
        out.push_back(c.name);
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> Registry::listeners_of(std::string_view channel) const
{
    auto id = find_channel(channel);
    if (!id)
        return {};
    return pImpl->names_of(pImpl->channels[*id].listeners);
}

std::vector<std::string> Registry::emitters_of(std::string_view channel) const
{
    auto id = find_channel(channel);
    if (!id)
        return {};
    return pImpl->names_of(pImpl->channels[*id].emitters);
}

std::vector<std::string> Registry::handler_names() const
{
    std::vector<std::string> out;
    for (const auto &h : pImpl->handlers)
    {
        if (h.has_wiring)
            out.push_back(h.identity.name);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

size_t Registry::live_subscriptions_of(std::string_view handler) const
{
    size_t total = 0;
    for (const auto &h : pImpl->handlers)
    {
        if (h.identity.name == handler)
            total += h.live_subscriptions;
    }
    return total;
}

std::vector<std::pair<std::string, std::string>> Registry::edges() const
{
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto &[from, to] : pImpl->graph.edges())
        out.emplace_back(pImpl->channels[from].name, pImpl->channels[to].name);
    return out;
}

bool Registry::reaches(std::string_view from, std::string_view to) const
{
    auto f = find_channel(from);
    auto t = find_channel(to);
    return f && t && pImpl->graph.reaches(*f, *t);
}

const ReachabilityGraph &Registry::graph() const noexcept
{
    return pImpl->graph;
}

} // namespace relayhub::bus
