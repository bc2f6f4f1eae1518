#pragma once
/**
 * @file exclusivity_cell.hpp
 * @brief Shared handle to one handler object plus its runtime access state.
 *
 * An ExclusivityCell enforces "one mutable holder at a time" at run time. Every dispatch
 * moves the cell's access state and pushes a frame on the thread's dispatch stack
 * (see dispatch_context.hpp). A handler that must let a nested, provably safe dispatch
 * re-enter itself calls `suspend` with the SuspendToken it was handed; the hold is
 * released for the duration of the nested action and restored afterwards.
 *
 * @code
 *  auto cell = make_cell<Counter>();
 *  cell.dispatch([](Counter &c) { ++c.hits; });
 *  cell.dispatch([&](Counter &c, const SuspendToken &token) {
 *      token.suspend([&] { hub.tick.dispatch(...); }); // may dispatch `cell` again
 *  });
 * @endcode
 *
 * Errors (raised through relayhub::bus::raise):
 *  - AlreadyBorrowed: dispatch on an Exclusive cell, or dispatch on a Shared cell.
 *  - NotInContext:    suspend with no active dispatch, or on an already suspended one.
 *  - UnexpectedItem:  suspend whose target is not the innermost dispatch.
 */
#include "utils/bus_error.hpp"
#include "utils/dispatch_context.hpp"
#include "utils/scope_guard.hpp"

#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace relayhub::bus
{

/**
 * @brief Tagged access state of a cell: Free, Exclusive, or Shared(n).
 *
 * `suspensions()` counts holders that have voluntarily released their hold and will
 * restore it when their suspended action returns.
 */
class AccessState
{
  public:
    enum class Mode : uint8_t
    {
        Free,
        Exclusive,
        Shared,
    };

    [[nodiscard]] Mode mode() const noexcept { return m_mode; }
    [[nodiscard]] uint32_t readers() const noexcept { return m_readers; }
    [[nodiscard]] uint32_t suspensions() const noexcept { return m_suspensions; }
    [[nodiscard]] bool can_acquire_exclusive() const noexcept { return m_mode == Mode::Free; }
    [[nodiscard]] bool can_acquire_shared() const noexcept { return m_mode != Mode::Exclusive; }

    void acquire_exclusive() noexcept { m_mode = Mode::Exclusive; }
    void release_exclusive() noexcept { m_mode = Mode::Free; }

    void acquire_shared() noexcept
    {
        m_mode = Mode::Shared;
        ++m_readers;
    }
    void release_shared() noexcept
    {
        if (m_readers > 0 && --m_readers == 0)
            m_mode = Mode::Free;
    }

    void begin_suspension() noexcept { ++m_suspensions; }
    void end_suspension() noexcept
    {
        if (m_suspensions > 0)
            --m_suspensions;
    }

  private:
    Mode m_mode = Mode::Free;
    uint32_t m_readers = 0;
    uint32_t m_suspensions = 0;
};

constexpr const char *to_string(AccessState::Mode mode) noexcept
{
    switch (mode)
    {
    case AccessState::Mode::Free:
        return "free";
    case AccessState::Mode::Exclusive:
        return "exclusive";
    case AccessState::Mode::Shared:
        return "shared";
    }
    return "unknown";
}

template <typename T> class ExclusivityCell;

namespace detail
{

struct CellCore
{
    explicit CellCore(uint64_t cell_id) noexcept : id(cell_id) {}
    const uint64_t id;
    AccessState state;
};

template <typename T> struct CellBox : CellCore
{
    template <typename... Args>
    explicit CellBox(uint64_t cell_id, Args &&...args)
        : CellCore(cell_id), payload(std::forward<Args>(args)...)
    {
    }
    T payload;
};

/** @brief Process-wide, never-reused cell identities. 0 is reserved. */
RELAYHUB_UTILS_EXPORT uint64_t next_cell_id() noexcept;

RELAYHUB_UTILS_EXPORT void raise_already_borrowed(const CellCore &core,
                                                  basics::AccessKind requested);

/**
 * @brief RAII suspension of the innermost dispatch.
 *
 * The constructor validates the dispatch stack, then reverses the innermost frame's
 * access transition and marks the frame paused. The destructor restores both.
 * `expected_depth == 0` accepts the innermost frame at any depth (cell-based suspend);
 * a token passes the depth it was issued for.
 */
class RELAYHUB_UTILS_EXPORT Suspension
{
  public:
    Suspension(CellCore *core, uint64_t cell_id, size_t expected_depth);
    ~Suspension() noexcept;

    Suspension(const Suspension &) = delete;
    Suspension &operator=(const Suspension &) = delete;

  private:
    CellCore *m_core;
    size_t m_depth;
    basics::AccessKind m_access;
};

} // namespace detail

/**
 * @class SuspendToken
 * @brief Capability handed to a handler by `dispatch`/`dispatch_ref`.
 *
 * It identifies exactly one dispatch frame (cell id + stack depth). `suspend` succeeds only
 * while that frame is the innermost one; a stale token is rejected before any cell state
 * is touched.
 */
class SuspendToken
{
  public:
    [[nodiscard]] uint64_t cell_id() const noexcept { return m_cell_id; }
    [[nodiscard]] size_t depth() const noexcept { return m_depth; }
    [[nodiscard]] basics::AccessKind access() const noexcept { return m_access; }

    /**
     * @brief Releases the hold of the dispatch this token was issued for, runs `fn`,
     *        restores the hold (also when `fn` throws) and returns `fn`'s result.
     */
    template <typename F> decltype(auto) suspend(F &&fn) const
    {
        detail::Suspension suspension(m_core, m_cell_id, m_depth);
        return std::invoke(std::forward<F>(fn));
    }

  private:
    template <typename> friend class ExclusivityCell;

    SuspendToken(detail::CellCore *core, size_t depth, basics::AccessKind access) noexcept
        : m_core(core), m_cell_id(core->id), m_depth(depth), m_access(access)
    {
    }

    detail::CellCore *m_core;
    uint64_t m_cell_id;
    size_t m_depth;
    basics::AccessKind m_access;
};

namespace detail
{
template <typename F, typename Arg>
decltype(auto) invoke_handler(F &fn, Arg &payload, const SuspendToken &token)
{
    if constexpr (std::is_invocable_v<F &, Arg &, const SuspendToken &>)
    {
        return std::invoke(fn, payload, token);
    }
    else
    {
        static_assert(std::is_invocable_v<F &, Arg &>,
                      "handler must be callable as fn(T&) or fn(T&, const SuspendToken&)");
        return std::invoke(fn, payload);
    }
}
} // namespace detail

/**
 * @class ExclusivityCell
 * @brief Copyable handle; copies share payload, access state and identity.
 *
 * `ExclusivityCell<Derived>` converts to `ExclusivityCell<Base>` with the same identity,
 * so one handler can be a member of channels of different interface types.
 */
template <typename T> class ExclusivityCell
{
  public:
    using element_type = T;

    template <typename U>
    requires(!std::is_same_v<U, T> && std::convertible_to<U *, T *>)
    ExclusivityCell(const ExclusivityCell<U> &other) noexcept
        : m_core(other.m_core), m_payload(other.m_payload)
    {
    }

    [[nodiscard]] uint64_t id() const noexcept { return m_core->id; }
    [[nodiscard]] AccessState::Mode mode() const noexcept { return m_core->state.mode(); }
    [[nodiscard]] const AccessState &state() const noexcept { return m_core->state; }
    [[nodiscard]] bool is_free() const noexcept { return m_core->state.can_acquire_exclusive(); }
    [[nodiscard]] bool is_suspended() const noexcept { return m_core->state.suspensions() > 0; }

    /** @brief True if both handles refer to the same cell, whatever their interface type. */
    template <typename U> [[nodiscard]] bool same_as(const ExclusivityCell<U> &other) const noexcept
    {
        return m_core == other.m_core;
    }

    /**
     * @brief Mutable access: Free -> Exclusive for the duration of `fn`.
     * @param fn Called as `fn(T&)` or `fn(T&, const SuspendToken&)`.
     * @return Whatever `fn` returns.
     */
    template <typename F> decltype(auto) dispatch(F &&fn) const
    {
        auto &state = m_core->state;
        if (!state.can_acquire_exclusive())
            detail::raise_already_borrowed(*m_core, basics::AccessKind::Exclusive);

        state.acquire_exclusive();
        auto release = basics::make_scope_guard([&state]() noexcept { state.release_exclusive(); });
        basics::DispatchFrame frame(m_core->id, basics::AccessKind::Exclusive);
        const SuspendToken token(m_core.get(), frame.depth(), basics::AccessKind::Exclusive);
        T &payload = *m_payload;
        return detail::invoke_handler(fn, payload, token);
    }

    /**
     * @brief Read-only access: Shared(n) -> Shared(n+1) for the duration of `fn`.
     * @param fn Called as `fn(const T&)` or `fn(const T&, const SuspendToken&)`.
     */
    template <typename F> decltype(auto) dispatch_ref(F &&fn) const
    {
        auto &state = m_core->state;
        if (!state.can_acquire_shared())
            detail::raise_already_borrowed(*m_core, basics::AccessKind::Shared);

        state.acquire_shared();
        auto release = basics::make_scope_guard([&state]() noexcept { state.release_shared(); });
        basics::DispatchFrame frame(m_core->id, basics::AccessKind::Shared);
        const SuspendToken token(m_core.get(), frame.depth(), basics::AccessKind::Shared);
        const T &payload = *m_payload;
        return detail::invoke_handler(fn, payload, token);
    }

    /**
     * @brief Suspends this cell's innermost dispatch while `fn` runs.
     *
     * Fails with NotInContext if no dispatch is active, UnexpectedItem if the innermost
     * dispatch is not on this cell.
     */
    template <typename F> decltype(auto) suspend(F &&fn) const
    {
        detail::Suspension suspension(m_core.get(), m_core->id, 0);
        return std::invoke(std::forward<F>(fn));
    }

    /**
     * @brief Suspends the dispatch `token` was issued for. The token must belong to this cell.
     */
    template <typename F> decltype(auto) suspend(const SuspendToken &token, F &&fn) const
    {
        if (token.cell_id() != m_core->id)
        {
            if (basics::DispatchFrame::current_depth() == 0)
                raise_error(BusErrorKind::NotInContext, "suspend called outside of any dispatch");
            raise_error(BusErrorKind::UnexpectedItem,
                        fmt::format("suspend token belongs to cell #{}, not to cell #{}",
                                    token.cell_id(), m_core->id));
        }
        return token.suspend(std::forward<F>(fn));
    }

    template <typename U, typename... Args> friend ExclusivityCell<U> make_cell(Args &&...args);
    template <typename> friend class ExclusivityCell;

  private:
    ExclusivityCell(std::shared_ptr<detail::CellCore> core, std::shared_ptr<T> payload) noexcept
        : m_core(std::move(core)), m_payload(std::move(payload))
    {
    }

    std::shared_ptr<detail::CellCore> m_core;
    std::shared_ptr<T> m_payload;
};

/**
 * @brief Constructs a `T` in a new cell. The payload and its access state share one
 *        allocation; the returned handle aliases the payload.
 */
template <typename T, typename... Args> ExclusivityCell<T> make_cell(Args &&...args)
{
    auto box = std::make_shared<detail::CellBox<T>>(detail::next_cell_id(),
                                                    std::forward<Args>(args)...);
    std::shared_ptr<T> payload(box, &box->payload);
    return ExclusivityCell<T>(std::move(box), std::move(payload));
}

} // namespace relayhub::bus
