#pragma once

/*******************************************************************************
 * @file dispatch_context.hpp
 * @brief A thread-local, RAII-based stack of active dispatches.
 *
 * Every dispatch into an ExclusivityCell pushes one frame (cell id, access kind)
 * and pops it on exit. Only the top frame is a legal suspend target. Uses a
 * fixed-capacity, stack-allocated (thread-local) buffer; no heap allocation.
 * If the nesting depth exceeds the limit, the frame constructor panics
 * (RLH_PANIC) instead of throwing.
 ******************************************************************************/
#include "utils/debug_info.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace relayhub::basics
{

// Configurable at compile time via CMake option RLH_DISPATCH_CONTEXT_MAX_DEPTH (default 256).
#ifndef RLH_DISPATCH_CONTEXT_MAX_DEPTH
#define RLH_DISPATCH_CONTEXT_MAX_DEPTH 256
#endif

/** Maximum dispatch nesting per thread. Exceeding this causes panic (RLH_PANIC). */
constexpr size_t kMaxDispatchDepth = RLH_DISPATCH_CONTEXT_MAX_DEPTH;

/** 0 is never handed out as a cell id; frames carrying it are inert. */
constexpr uint64_t kNoCell = 0;

enum class AccessKind : uint8_t
{
    Exclusive,
    Shared,
};

constexpr const char *to_string(AccessKind kind) noexcept
{
    return kind == AccessKind::Exclusive ? "exclusive" : "shared";
}

struct ContextEntry
{
    uint64_t cell_id = kNoCell;
    AccessKind access = AccessKind::Exclusive;
    bool paused = false; ///< set while the holder has suspended its hold
};

struct DispatchStack
{
    std::array<ContextEntry, kMaxDispatchDepth> entries{};
    size_t size = 0;
};

/**
 * @brief Gets the thread-local stack of active dispatches.
 * @return A mutable reference to the thread-local stack. Does not throw.
 */
inline DispatchStack &get_dispatch_stack() noexcept
{
    static thread_local DispatchStack g_dispatch_stack;
    return g_dispatch_stack;
}

/** Called when dispatch depth would exceed kMaxDispatchDepth. Does not return. */
[[noreturn]] inline void dispatch_stack_panic() noexcept
{
    RLH_PANIC("DispatchFrame: max dispatch depth ({}) exceeded.", kMaxDispatchDepth);
}

/**
 * @class DispatchFrame
 * @brief RAII frame for one active dispatch on the current thread.
 *
 * Pushes `(cell_id, access)` on construction and removes it on destruction, so the
 * stack stays correct when a handler throws. `depth()` is the 1-based position of
 * the frame; a SuspendToken records it to prove which frame it was issued for.
 *
 * Movable, not copyable. A moved-from frame is inert.
 */
class DispatchFrame
{
  public:
    DispatchFrame(uint64_t cell_id, AccessKind access) noexcept : cell_id_(cell_id)
    {
        if (cell_id_ == kNoCell)
            return;
        auto &st = get_dispatch_stack();
        if (st.size >= kMaxDispatchDepth)
            dispatch_stack_panic();
        st.entries[st.size++] = ContextEntry{cell_id_, access, false};
        depth_ = st.size;
    }

    /**
     * @brief Removes the frame. Handles both LIFO and non-LIFO destruction order;
     *        in the non-LIFO case the entry at this frame's recorded depth is removed.
     */
    ~DispatchFrame() noexcept
    {
        if (cell_id_ == kNoCell)
            return;

        auto &st = get_dispatch_stack();
        if (st.size > 0 && st.size == depth_ && st.entries[st.size - 1].cell_id == cell_id_)
        {
            --st.size;
            return;
        }
        auto *beg = st.entries.data();
        auto *end = beg + st.size;
        auto *it = (depth_ > 0 && depth_ <= st.size && st.entries[depth_ - 1].cell_id == cell_id_)
                       ? beg + (depth_ - 1)
                       : std::find_if(beg, end, [this](const ContextEntry &e)
                                      { return e.cell_id == cell_id_; });
        if (it != end)
        {
            std::move(it + 1, end, it);
            --st.size;
        }
    }

    DispatchFrame(const DispatchFrame &) = delete;
    DispatchFrame &operator=(const DispatchFrame &) = delete;
    DispatchFrame &operator=(DispatchFrame &&) = delete;

    DispatchFrame(DispatchFrame &&other) noexcept : cell_id_(other.cell_id_), depth_(other.depth_)
    {
        other.cell_id_ = kNoCell;
        other.depth_ = 0;
    }

    [[nodiscard]] size_t depth() const noexcept { return depth_; }

    /** @brief Number of active dispatches on this thread. */
    [[nodiscard]] static size_t current_depth() noexcept { return get_dispatch_stack().size; }

    /** @brief The innermost active dispatch, or nullptr when none is active. */
    [[nodiscard]] static ContextEntry *top() noexcept
    {
        auto &st = get_dispatch_stack();
        return st.size == 0 ? nullptr : &st.entries[st.size - 1];
    }

    /** @brief True if `cell_id` has a frame anywhere on this thread's stack. */
    [[nodiscard]] static bool is_active(uint64_t cell_id) noexcept
    {
        if (cell_id == kNoCell)
            return false;
        const auto &st = get_dispatch_stack();
        const auto *beg = st.entries.data();
        return std::find_if(beg, beg + st.size, [cell_id](const ContextEntry &e)
                            { return e.cell_id == cell_id; }) != beg + st.size;
    }

  private:
    uint64_t cell_id_;
    size_t depth_ = 0;
};

} // namespace relayhub::basics
