#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace relayhub::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * The cleanup action runs when the current scope is exited, whether by normal execution
 * or by an exception. The bus uses it to restore access states and iteration counters
 * around user handlers, which may throw.
 *
 * It is movable but not copyable, enforcing unique ownership of the cleanup action.
 *
 * @code
 *  state.release();
 *  auto restore = relayhub::basics::make_scope_guard([&]() noexcept { state.reacquire(); });
 *  run_user_code(); // restore runs even if this throws
 * @endcode
 *
 * ### Exceptions
 *
 * The destructor is `noexcept`: a callable that throws from the destructor terminates the
 * program. Cleanup actions must therefore be non-throwing.
 *
 * ### Thread Safety
 *
 * Not thread-safe. A guard belongs to the scope that created it.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_move_constructible_v<Callable> || std::is_copy_constructible_v<Callable>,
                  "ScopeGuard's callable must be move- or copy-constructible.");

    /**
     * @brief Checks if the guard is active and will execute on scope exit.
     */
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    /**
     * @brief Move constructor. The source guard is dismissed and will no longer execute.
     */
    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    /**
     * @brief Executes the callable if the guard is active.
     */
    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /**
     * @brief Deactivates the guard, preventing the callable from being executed.
     */
    constexpr void dismiss() noexcept { m_active = false; }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard; the callable is stored by value (decayed).
 *
 * @note Ensure that any references captured by `f` remain valid until the guard executes.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace relayhub::basics
