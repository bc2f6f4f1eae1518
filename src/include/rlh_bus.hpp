#pragma once
/**
 * @file rlh_bus.hpp
 * @brief Layer 3: The in-process event bus built on rlh_service.
 *
 * Provides the complete bus API:
 *   - Registry / ReachabilityGraph: channel names, handler wiring, cycle rejection
 *   - Channel, Slot, Single, Feed: membership containers and dispatch
 *   - Hub, subscribe, unsubscribe: subscription glue for handler types
 *   - GraphExporter: DOT and JSON diagnostics of the wiring
 *
 * Include this single header to build hubs and handlers.
 */
#include "rlh_service.hpp"

#include <nlohmann/json.hpp>

#include "utils/reachability_graph.hpp"
#include "utils/registry.hpp"
#include "utils/channel.hpp"
#include "utils/single.hpp"
#include "utils/feed.hpp"
#include "utils/subscription.hpp"
#include "utils/graph_export.hpp"
