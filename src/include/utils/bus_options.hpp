#pragma once
/**
 * @file bus_options.hpp
 * @brief Tunables of a Registry, shared by the configuration layer and the bus.
 */
#include <cstddef>

namespace relayhub::bus
{

/**
 * @brief How repeat subscriptions of one handler kind are folded into the graph.
 *
 * - PerInstance: every subscription stages its edges and runs cycle detection.
 * - PerKind: a repeat subscription whose declared wiring equals the kind's first committed
 *   wiring is accepted without re-staging or re-checking. A repeat with different wiring is
 *   validated like a new node.
 */
enum class DedupPolicy
{
    PerInstance,
    PerKind,
};

constexpr const char *to_string(DedupPolicy policy) noexcept
{
    return policy == DedupPolicy::PerInstance ? "per_instance" : "per_kind";
}

struct RegistryOptions
{
    DedupPolicy dedup = DedupPolicy::PerInstance;
    /// Default per-feedee queue bound for feeds declared on the registry (0 = unbounded).
    size_t feed_capacity = 0;
};

} // namespace relayhub::bus
