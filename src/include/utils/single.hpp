#pragma once
/**
 * @file single.hpp
 * @brief Slot<T> (exactly one member) and Single<T> (at most one member).
 *
 * Both hold zero or one cell. They differ in what an empty container means:
 *  - Slot<T>: the member is required. Dispatching an empty slot raises EmptyRequiredSlot.
 *  - Single<T>: the member is optional. `dispatch` still raises EmptyRequiredSlot, while
 *    `dispatch_if_present` / `dispatch_ref_if_present` are the explicit opt-in for the
 *    empty case and report whether a member was visited.
 *
 * A dispatch works on a copy of the member handle, so removing or replacing the member
 * from inside its own dispatch is allowed; the running call completes on the old member.
 */
#include "utils/exclusivity_cell.hpp"
#include "utils/registry.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace relayhub::bus
{

namespace detail
{

template <typename T> struct SlotState
{
    std::string name;
    ChannelId id = 0;
    ChannelKind kind = ChannelKind::One;
    std::shared_ptr<Registry> registry;
    std::optional<ExclusivityCell<T>> member;

    [[nodiscard]] ExclusivityCell<T> require_member() const
    {
        if (!member)
        {
            raise_error(BusErrorKind::EmptyRequiredSlot,
                        fmt::format("dispatch on empty {} '{}'",
                                    kind == ChannelKind::One ? "slot" : "single", name));
        }
        return *member;
    }

    void occupy(ExclusivityCell<T> cell)
    {
        if (member)
        {
            raise_error(BusErrorKind::SlotOccupied,
                        fmt::format("'{}' already holds cell #{}; cannot insert cell #{}", name,
                                    member->id(), cell.id()));
        }
        member = std::move(cell);
    }
};

/** @brief Dispatch operations shared by containers and their emitters. */
template <typename T> class SlotAccess
{
  public:
    /**
     * @brief Mutable dispatch to the member.
     * @throws BusError(EmptyRequiredSlot) if there is no member.
     */
    template <typename F> decltype(auto) dispatch(F &&fn) const
    {
        const auto cell = m_state->require_member();
        return cell.dispatch(std::forward<F>(fn));
    }

    template <typename F> decltype(auto) dispatch_ref(F &&fn) const
    {
        const auto cell = m_state->require_member();
        return cell.dispatch_ref(std::forward<F>(fn));
    }

    [[nodiscard]] bool populated() const noexcept { return m_state->member.has_value(); }
    [[nodiscard]] const std::string &name() const noexcept { return m_state->name; }

  protected:
    SlotAccess() = default;
    explicit SlotAccess(std::shared_ptr<SlotState<T>> state) noexcept : m_state(std::move(state)) {}

    std::shared_ptr<SlotState<T>> m_state;
};

/** @brief SlotAccess plus the opt-in dispatch for an optional member. */
template <typename T> class OptionalSlotAccess : public SlotAccess<T>
{
  public:
    /**
     * @brief Dispatches if a member is present.
     * @return `bool` (visited or not) when `fn` returns void, else `std::optional<R>`.
     */
    template <typename F> auto dispatch_if_present(F &&fn) const
    {
        return visit_if_present(
            [&fn](const ExclusivityCell<T> &cell) -> decltype(auto) { return cell.dispatch(fn); });
    }

    template <typename F> auto dispatch_ref_if_present(F &&fn) const
    {
        return visit_if_present([&fn](const ExclusivityCell<T> &cell) -> decltype(auto)
                                { return cell.dispatch_ref(fn); });
    }

  protected:
    using SlotAccess<T>::SlotAccess;

  private:
    template <typename Visit> auto visit_if_present(Visit &&visit) const
    {
        const std::optional<ExclusivityCell<T>> cell = this->m_state->member;
        using R = decltype(visit(*cell));
        if constexpr (std::is_void_v<R>)
        {
            if (!cell)
                return false;
            visit(*cell);
            return true;
        }
        else
        {
            using V = std::decay_t<R>;
            if (!cell)
                return std::optional<V>{};
            return std::optional<V>(visit(*cell));
        }
    }
};

/**
 * @brief Owning side of a zero-or-one container, parameterised by its dispatch surface
 *        and registry kind.
 */
template <typename T, typename Access, ChannelKind Kind> class SlotContainer : public Access
{
  public:
    using element_type = T;

    /** @brief Dispatch-only view handed to a handler that emits here. */
    class Emitter : public Access
    {
      private:
        friend class SlotContainer;
        explicit Emitter(std::shared_ptr<SlotState<T>> state) noexcept : Access(std::move(state)) {}
    };

    /**
     * @brief Declares `name` on `registry`.
     * @throws BusError(DuplicateChannelName) if the name is taken.
     */
    SlotContainer(std::shared_ptr<Registry> registry, std::string_view name)
        : Access(std::make_shared<SlotState<T>>())
    {
        if (!registry)
            throw std::invalid_argument("SlotContainer: registry must not be null");
        auto &state = *this->m_state;
        state.name = std::string(name);
        state.kind = Kind;
        state.id = registry->declare_channel(name, Kind);
        state.registry = std::move(registry);
    }

    SlotContainer(const SlotContainer &) = delete;
    SlotContainer &operator=(const SlotContainer &) = delete;
    SlotContainer(SlotContainer &&) noexcept = default;
    SlotContainer &operator=(SlotContainer &&) noexcept = default;

    [[nodiscard]] ChannelId id() const noexcept { return this->m_state->id; }

    template <typename U> [[nodiscard]] bool contains(const ExclusivityCell<U> &cell) const noexcept
    {
        return this->m_state->member && this->m_state->member->same_as(cell);
    }

    /** @throws BusError(SlotOccupied) if a member is present. */
    void insert(ExclusivityCell<T> cell) { this->m_state->occupy(std::move(cell)); }

    /**
     * @brief Takes the member out.
     * @throws BusError(NotSubscribed) if the container is empty.
     */
    ExclusivityCell<T> remove()
    {
        auto &member = this->m_state->member;
        if (!member)
        {
            raise_error(BusErrorKind::NotSubscribed,
                        fmt::format("remove on empty '{}'", this->m_state->name));
        }
        ExclusivityCell<T> out = std::move(*member);
        member.reset();
        return out;
    }

    /** @brief Installs `cell`, returning the previous member if there was one. */
    std::optional<ExclusivityCell<T>> replace(ExclusivityCell<T> cell)
    {
        auto previous = std::exchange(this->m_state->member, std::move(cell));
        return previous;
    }

    // --- Subscribe-time wiring ---

    /**
     * @brief Declares that the handler under construction listens here, and stages `cell`
     *        as the member.
     * @throws BusError(SlotOccupied) immediately if a member is already present.
     */
    void listen(ExclusivityCell<T> cell)
    {
        auto &state = *this->m_state;
        if (state.member)
        {
            raise_error(BusErrorKind::SlotOccupied,
                        fmt::format("'{}' already holds cell #{}", state.name, state.member->id()));
        }
        state.registry->record_listen(state.id);
        std::weak_ptr<SlotState<T>> weak = this->m_state;
        const uint64_t cell_id = cell.id();
        state.registry->stage_join(
            [weak, cell = std::move(cell)]()
            {
                if (auto s = weak.lock())
                    s->occupy(cell);
            },
            [weak, cell_id]()
            {
                auto s = weak.lock();
                if (s && s->member && s->member->id() == cell_id)
                    s->member.reset();
            });
    }

    /** @brief Declares that the handler under construction emits here. */
    [[nodiscard]] Emitter emitter()
    {
        this->m_state->registry->record_emit(this->m_state->id);
        return Emitter(this->m_state);
    }
};

} // namespace detail

/** @brief Container requiring exactly one member at dispatch time. */
template <typename T>
using Slot = detail::SlotContainer<T, detail::SlotAccess<T>, ChannelKind::One>;

/** @brief Container holding zero or one member. */
template <typename T>
using Single = detail::SlotContainer<T, detail::OptionalSlotAccess<T>, ChannelKind::AtMostOne>;

} // namespace relayhub::bus
