#pragma once
/**
 * @file subscription.hpp
 * @brief Subscribe-time glue: Hub base, handler identities and `subscribe<H>()`.
 *
 * A handler type `H` describes its wiring with two optional static hooks:
 * @code
 *   struct Logger
 *   {
 *       static constexpr const char *kName = "Logger";          // optional display name
 *
 *       struct Emits { Channel<Line>::Emitter lines; };
 *       static Emits register_emits(AppHub &hub) { return {hub.lines.emitter()}; }
 *       static void register_listens(AppHub &hub, const ExclusivityCell<Logger> &self)
 *       {
 *           hub.ticks.listen(self);
 *       }
 *
 *       Logger(Emits emits, int verbosity);
 *   };
 *
 *   auto logger = subscribe<Logger>(hub, 2);
 * @endcode
 * `register_emits` runs before construction and its result is the constructor's first
 * argument. `register_listens` runs after construction with the new cell. Both run inside
 * one construction frame, which `subscribe` validates and commits, or discards if
 * anything throws.
 */
#include "utils/exclusivity_cell.hpp"
#include "utils/registry.hpp"

#include <concepts>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>

namespace relayhub::bus
{

/**
 * @class Hub
 * @brief Base for application hubs. Derived hubs declare their containers as members,
 *        initialised from `registry()`.
 *
 * @code
 *   struct AppHub : Hub
 *   {
 *       Channel<Tick> ticks{registry(), "ticks"};
 *       Slot<Clock> clock{registry(), "clock"};
 *   };
 * @endcode
 */
class Hub
{
  public:
    explicit Hub(RegistryOptions options = {})
        : m_registry(std::make_shared<Registry>(options))
    {
    }

    explicit Hub(std::shared_ptr<Registry> registry) : m_registry(std::move(registry))
    {
        if (!m_registry)
            throw std::invalid_argument("Hub: registry must not be null");
    }

    Hub(const Hub &) = delete;
    Hub &operator=(const Hub &) = delete;

    [[nodiscard]] const std::shared_ptr<Registry> &registry() const noexcept { return m_registry; }

  private:
    std::shared_ptr<Registry> m_registry;
};

template <typename H>
concept HasHandlerName = requires {
    { H::kName } -> std::convertible_to<std::string>;
};

/** @brief `H::kName` when present, else the RTTI name. The key is always the RTTI name. */
template <typename H> HandlerIdentity identity_of()
{
    std::string key = typeid(H).name();
    if constexpr (HasHandlerName<H>)
        return HandlerIdentity{std::string(H::kName), std::move(key)};
    else
        return HandlerIdentity{key, std::move(key)};
}

/**
 * @class SubscriptionScope
 * @brief RAII construction frame. Aborts the frame on unwind unless committed.
 */
class SubscriptionScope
{
  public:
    SubscriptionScope(Registry &registry, const HandlerIdentity &identity) : m_registry(registry)
    {
        m_registry.begin_subscription(identity);
    }

    ~SubscriptionScope()
    {
        if (!m_done)
            m_registry.abort_subscription();
    }

    SubscriptionScope(const SubscriptionScope &) = delete;
    SubscriptionScope &operator=(const SubscriptionScope &) = delete;

    /** @brief Validates and commits the frame for `cell_id`. */
    void commit(uint64_t cell_id)
    {
        // end_subscription discards the frame itself, also when it throws.
        m_done = true;
        m_registry.end_subscription(cell_id);
    }

  private:
    Registry &m_registry;
    bool m_done = false;
};

template <typename H, typename HubT>
concept EmitsRegistrar = requires(HubT &hub) { H::register_emits(hub); };

template <typename H, typename HubT>
concept ListensRegistrar = requires(HubT &hub, const ExclusivityCell<H> &cell) {
    H::register_listens(hub, cell);
};

/**
 * @brief Constructs `H` in a new cell and subscribes it to `hub`.
 * @throws RecursionDetected if the handler's wiring closes a cycle, or any wiring error
 *         raised while registering. On failure nothing is committed, and subscriptions
 *         made while constructing `H` are rolled back.
 */
template <typename H, typename HubT, typename... Args>
ExclusivityCell<H> subscribe(HubT &hub, Args &&...args)
{
    Registry &registry = *static_cast<const Hub &>(hub).registry();
    SubscriptionScope scope(registry, identity_of<H>());

    auto cell = [&]
    {
        if constexpr (EmitsRegistrar<H, HubT>)
            return make_cell<H>(H::register_emits(hub), std::forward<Args>(args)...);
        else
            return make_cell<H>(std::forward<Args>(args)...);
    }();

    if constexpr (ListensRegistrar<H, HubT>)
        H::register_listens(hub, std::as_const(cell));

    scope.commit(cell.id());
    return cell;
}

/**
 * @brief Removes `cell` from every container it joined through `hub`.
 * @throws BusError(NotSubscribed) if it is not subscribed there.
 */
template <typename HubT, typename H> void unsubscribe(HubT &hub, const ExclusivityCell<H> &cell)
{
    static_cast<const Hub &>(hub).registry()->unsubscribe(cell.id());
}

} // namespace relayhub::bus
