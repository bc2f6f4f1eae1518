#pragma once
/**
 * @file registry.hpp
 * @brief Registry: the hub-wide record of channel names, handler wiring and the
 *        reachability graph.
 *
 * One Registry is owned per hub and shared (std::shared_ptr) with every container
 * declared on it. It is mutated only at subscribe/unsubscribe time; dispatch never
 * touches it.
 *
 * ## Subscription protocol
 * @code
 *   registry->begin_subscription({"Logger", "app::Logger"});
 *   registry->record_listen(tick);        // via Channel::listen
 *   registry->record_emit(log_line);      // via Channel::emitter
 *   registry->stage_join(join, leave);    // container membership, applied on success
 *   registry->end_subscription(cell.id());
 * @endcode
 * `end_subscription` stages the listen x emit edges on a scratch copy of the graph,
 * rejects the subscription with RecursionDetected if the scratch graph has a cycle, and
 * otherwise commits edges, membership records and staged joins together. A rejected
 * subscription leaves the registry and every container unchanged.
 *
 * Edges and membership records are append-only: unsubscribing removes the cell from its
 * containers but keeps the wiring it declared.
 *
 * Single-threaded: a registry and its containers belong to one thread.
 */
#include "utils/bus_options.hpp"
#include "utils/reachability_graph.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relayhub::bus
{

using HandlerId = uint32_t;

enum class ChannelKind : uint8_t
{
    Many,      ///< Channel: any number of members, visited in order
    One,       ///< Slot: exactly one member required at dispatch
    AtMostOne, ///< Single: zero or one member
    Feed,      ///< backward FIFO; excluded from the reachability graph
};

constexpr const char *to_string(ChannelKind kind) noexcept
{
    switch (kind)
    {
    case ChannelKind::Many:
        return "many";
    case ChannelKind::One:
        return "one";
    case ChannelKind::AtMostOne:
        return "at_most_one";
    case ChannelKind::Feed:
        return "feed";
    }
    return "unknown";
}

/**
 * @brief Identity of a handler kind. `key` decides equality; `name` is what diagnostics
 *        and RecursionDetected messages print.
 */
struct HandlerIdentity
{
    std::string name;
    std::string key;
};

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

struct RegistryImpl;

class RELAYHUB_UTILS_EXPORT Registry
{
  public:
    explicit Registry(RegistryOptions options = {});
    ~Registry();

    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;
    Registry(Registry &&) = delete;
    Registry &operator=(Registry &&) = delete;

    [[nodiscard]] const RegistryOptions &options() const noexcept;

    // --- Channel names ---

    /**
     * @brief Declares a unique channel name.
     * @throws BusError(DuplicateChannelName) if the name is already declared here.
     */
    ChannelId declare_channel(std::string_view name, ChannelKind kind = ChannelKind::Many);

    [[nodiscard]] std::optional<ChannelId> find_channel(std::string_view name) const;
    [[nodiscard]] const std::string &channel_name(ChannelId id) const;
    [[nodiscard]] ChannelKind channel_kind(ChannelId id) const;
    [[nodiscard]] size_t channel_count() const noexcept;

    // --- Construction frames ---

    /// @brief Opens a frame for one handler being constructed. Frames nest.
    void begin_subscription(const HandlerIdentity &identity);

    /**
     * @brief Records "the handler under construction listens on `channel`".
     * @throws BusError(NoActiveSubscription) without an open frame,
     *         BusError(RegistryMismatch) if another registry's frame is innermost,
     *         BusError(UnknownChannel) for an id not declared here,
     *         BusError(DuplicateDeclaration) if already recorded in this frame.
     */
    void record_listen(ChannelId channel);

    /// @brief Records "the handler under construction emits on `channel`". Errors as above.
    void record_emit(ChannelId channel);

    /**
     * @brief Stages a container membership change for the innermost frame. `join` runs
     *        when the subscription commits; `leave` is kept for `unsubscribe`.
     */
    void stage_join(std::function<void()> join, std::function<void()> leave);

    /**
     * @brief Validates and commits the innermost frame for `cell_id`.
     * @throws RecursionDetected if the frame's edges would close a cycle; the frame is
     *         discarded, nothing is committed and nested subscriptions committed inside
     *         the frame are rolled back.
     */
    void end_subscription(uint64_t cell_id);

    /**
     * @brief Discards the innermost frame without committing anything. Subscriptions
     *        committed by nested frames inside it are unsubscribed and their wiring undone.
     */
    void abort_subscription() noexcept;

    [[nodiscard]] bool in_subscription() const noexcept;
    [[nodiscard]] size_t subscription_depth() const noexcept;

    /**
     * @brief The registry whose frame is innermost on this thread, or nullptr.
     */
    [[nodiscard]] static const Registry *active() noexcept;

    // --- Unsubscribe ---

    /**
     * @brief Removes the cell from every container it joined.
     * @throws BusError(NotSubscribed) if the cell is not currently subscribed here.
     */
    void unsubscribe(uint64_t cell_id);

    [[nodiscard]] bool is_subscribed(uint64_t cell_id) const noexcept;
    [[nodiscard]] size_t subscription_count() const noexcept;

    // --- Diagnostics (read-only) ---

    [[nodiscard]] std::vector<std::string> channel_names() const;
    [[nodiscard]] std::vector<std::string> listeners_of(std::string_view channel) const;
    [[nodiscard]] std::vector<std::string> emitters_of(std::string_view channel) const;
    [[nodiscard]] std::vector<std::string> handler_names() const;
    /// @brief Number of currently subscribed cells of the handler kind named `handler`.
    [[nodiscard]] size_t live_subscriptions_of(std::string_view handler) const;
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> edges() const;
    [[nodiscard]] bool reaches(std::string_view from, std::string_view to) const;
    [[nodiscard]] const ReachabilityGraph &graph() const noexcept;

  private:
    void require_frame(ChannelId channel, const char *what) const;

    std::unique_ptr<RegistryImpl> pImpl;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace relayhub::bus
