#include "rlh_service.hpp"
#include "utils/exclusivity_cell.hpp"

#include <atomic>

namespace relayhub::bus::detail
{

namespace
{
std::atomic<uint64_t> g_next_cell_id{1};
} // namespace

uint64_t next_cell_id() noexcept
{
    return g_next_cell_id.fetch_add(1, std::memory_order_relaxed);
}

void raise_already_borrowed(const CellCore &core, basics::AccessKind requested)
{
    raise_error(BusErrorKind::AlreadyBorrowed,
                fmt::format("cell #{} is already borrowed: {} access requested while {}", core.id,
                            basics::to_string(requested), to_string(core.state.mode())));
}

Suspension::Suspension(CellCore *core, uint64_t cell_id, size_t expected_depth)
    : m_core(core), m_depth(basics::DispatchFrame::current_depth()),
      m_access(basics::AccessKind::Exclusive)
{
    basics::ContextEntry *top = basics::DispatchFrame::top();
    if (top == nullptr)
    {
        raise_error(BusErrorKind::NotInContext, "suspend called outside of any dispatch");
    }
    if (top->cell_id != cell_id || (expected_depth != 0 && expected_depth != m_depth))
    {
        raise_error(BusErrorKind::UnexpectedItem,
                    fmt::format("suspend target cell #{} is not the innermost dispatch "
                                "(innermost: cell #{} at depth {})",
                                cell_id, top->cell_id, m_depth));
    }
    if (top->paused)
    {
        raise_error(BusErrorKind::NotInContext,
                    fmt::format("dispatch of cell #{} is already suspended", cell_id));
    }

    // Validated: the innermost frame is a live dispatch on `core`, so `core` is alive.
    m_access = top->access;
    auto &state = m_core->state;
    if (m_access == basics::AccessKind::Exclusive)
        state.release_exclusive();
    else
        state.release_shared();
    state.begin_suspension();
    top->paused = true;
    RLH_DEBUG("cell #{} suspended at depth {}", cell_id, m_depth);
}

Suspension::~Suspension() noexcept
{
    auto &state = m_core->state;
    if (m_access == basics::AccessKind::Exclusive)
    {
        if (!state.can_acquire_exclusive())
            RLH_PANIC("cell #{} cannot be restored after suspend: still {}", m_core->id,
                      to_string(state.mode()));
        state.acquire_exclusive();
    }
    else
    {
        if (!state.can_acquire_shared())
            RLH_PANIC("cell #{} cannot be restored after suspend: still {}", m_core->id,
                      to_string(state.mode()));
        state.acquire_shared();
    }
    state.end_suspension();

    auto &st = basics::get_dispatch_stack();
    if (m_depth > 0 && m_depth <= st.size && st.entries[m_depth - 1].cell_id == m_core->id)
        st.entries[m_depth - 1].paused = false;
}

} // namespace relayhub::bus::detail
