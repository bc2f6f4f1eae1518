#pragma once
/**
 * @file channel.hpp
 * @brief Channel<T>: an ordered multiset of handler cells sharing interface `T`.
 *
 * A dispatch visits the members in list order, each through its own ExclusivityCell, so
 * protection is per cell and not per channel: a handler reached through two channels is
 * still held at most once.
 *
 * Members are ordered by an integer key. On equal keys a negative key goes before the
 * existing equal-keyed members and a non-negative key after them, so the default key 0
 * appends. A negative key is placed before the first member whose key is not smaller, a
 * non-negative key after the last member whose key is not larger. On a key-ordered list
 * both rules agree with plain key order; after sort_by they still place the new member
 * deterministically relative to the sorted list.
 *
 * Structural changes (insert, remove, remove_if, sort_by) while the channel is being
 * iterated raise ContainerBusy. Re-dispatching the same channel from inside a member is
 * allowed and is subject to the usual per-cell rules.
 */
#include "utils/exclusivity_cell.hpp"
#include "utils/registry.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relayhub::bus
{

template <typename T> class Channel
{
    struct Member
    {
        int key;
        ExclusivityCell<T> cell;
    };

    struct State
    {
        std::string name;
        ChannelId id = 0;
        std::shared_ptr<Registry> registry;
        std::vector<Member> members;
        uint32_t iterating = 0;

        void require_idle(const char *op) const
        {
            if (iterating != 0)
            {
                raise_error(BusErrorKind::ContainerBusy,
                            fmt::format("channel '{}': {} while the channel is being dispatched",
                                        name, op));
            }
        }

        void insert(int key, ExclusivityCell<T> cell)
        {
            require_idle("insert");
            auto pos = members.end();
            if (key < 0)
            {
                pos = std::find_if(members.begin(), members.end(),
                                   [key](const Member &m) { return m.key >= key; });
            }
            else
            {
                auto last = std::find_if(members.rbegin(), members.rend(),
                                         [key](const Member &m) { return m.key <= key; });
                pos = last.base();
            }
            members.insert(pos, Member{key, std::move(cell)});
        }

        // Removes the first member with the given identity and key; used by unsubscribe.
        void leave(uint64_t cell_id, int key)
        {
            auto it = std::find_if(members.begin(), members.end(), [&](const Member &m)
                                   { return m.cell.id() == cell_id && m.key == key; });
            if (it == members.end())
                return;
            require_idle("unsubscribe");
            members.erase(it);
        }

        template <typename F> void for_each(F &&visit)
        {
            ++iterating;
            auto done = basics::make_scope_guard([this]() noexcept { --iterating; });
            for (size_t i = 0; i < members.size(); ++i)
                visit(members[i].cell);
        }
    };

  public:
    using element_type = T;

    /**
     * @class Emitter
     * @brief Dispatch-only view of a channel, handed to a handler that emits on it.
     *
     * Shares the member list with the channel: members joining later are visited too.
     */
    class Emitter
    {
      public:
        template <typename F> void dispatch(F &&fn) const
        {
            m_state->for_each([&fn](const ExclusivityCell<T> &cell) { cell.dispatch(fn); });
        }

        template <typename F> void dispatch_ref(F &&fn) const
        {
            m_state->for_each([&fn](const ExclusivityCell<T> &cell) { cell.dispatch_ref(fn); });
        }

        [[nodiscard]] const std::string &name() const noexcept { return m_state->name; }
        [[nodiscard]] size_t size() const noexcept { return m_state->members.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_state->members.empty(); }

      private:
        friend class Channel;
        explicit Emitter(std::shared_ptr<State> state) noexcept : m_state(std::move(state)) {}

        std::shared_ptr<State> m_state;
    };

    /**
     * @brief Declares `name` on `registry` with multiplicity many.
     * @throws BusError(DuplicateChannelName) if the name is taken.
     */
    Channel(std::shared_ptr<Registry> registry, std::string_view name)
        : m_state(std::make_shared<State>())
    {
        if (!registry)
            throw std::invalid_argument("Channel: registry must not be null");
        m_state->name = std::string(name);
        m_state->id = registry->declare_channel(name, ChannelKind::Many);
        m_state->registry = std::move(registry);
    }

    Channel(const Channel &) = delete;
    Channel &operator=(const Channel &) = delete;
    Channel(Channel &&) noexcept = default;
    Channel &operator=(Channel &&) noexcept = default;

    [[nodiscard]] ChannelId id() const noexcept { return m_state->id; }
    [[nodiscard]] const std::string &name() const noexcept { return m_state->name; }
    [[nodiscard]] size_t size() const noexcept { return m_state->members.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_state->members.empty(); }
    [[nodiscard]] bool is_dispatching() const noexcept { return m_state->iterating != 0; }

    /** @brief Number of members with the same identity as `cell`. */
    template <typename U> [[nodiscard]] size_t count(const ExclusivityCell<U> &cell) const noexcept
    {
        return static_cast<size_t>(std::count_if(m_state->members.begin(), m_state->members.end(),
                                                 [&cell](const Member &m)
                                                 { return m.cell.same_as(cell); }));
    }

    template <typename U> [[nodiscard]] bool contains(const ExclusivityCell<U> &cell) const noexcept
    {
        return count(cell) != 0;
    }

    /** @brief Member keys in list order. */
    [[nodiscard]] std::vector<int> keys() const
    {
        std::vector<int> out;
        out.reserve(m_state->members.size());
        for (const auto &m : m_state->members)
            out.push_back(m.key);
        return out;
    }

    void insert(int key, ExclusivityCell<T> cell) { m_state->insert(key, std::move(cell)); }
    void insert(ExclusivityCell<T> cell) { m_state->insert(0, std::move(cell)); }

    /**
     * @brief Removes every member with the same identity as `cell`.
     * @return Number of members removed.
     */
    template <typename U> size_t remove(const ExclusivityCell<U> &cell)
    {
        m_state->require_idle("remove");
        auto &members = m_state->members;
        const auto before = members.size();
        members.erase(std::remove_if(members.begin(), members.end(),
                                     [&cell](const Member &m) { return m.cell.same_as(cell); }),
                      members.end());
        return before - members.size();
    }

    /** @brief Visits every member with mutable access, in list order. */
    template <typename F> void dispatch(F &&fn)
    {
        m_state->for_each([&fn](const ExclusivityCell<T> &cell) { cell.dispatch(fn); });
    }

    /** @brief Visits every member with shared access, in list order. */
    template <typename F> void dispatch_ref(F &&fn)
    {
        m_state->for_each([&fn](const ExclusivityCell<T> &cell) { cell.dispatch_ref(fn); });
    }

    /**
     * @brief Mutable pass that drops the members for which `pred` returns true.
     *
     * Survivors keep their relative order. If `pred` throws, no member is removed.
     * @return Number of members removed.
     */
    template <typename Pred> size_t remove_if(Pred &&pred)
    {
        m_state->require_idle("remove_if");
        std::vector<bool> drop;
        drop.reserve(m_state->members.size());
        m_state->for_each([&](const ExclusivityCell<T> &cell)
                          { drop.push_back(static_cast<bool>(cell.dispatch(pred))); });

        auto &members = m_state->members;
        std::vector<Member> kept;
        kept.reserve(members.size());
        for (size_t i = 0; i < members.size(); ++i)
        {
            if (!drop[i])
                kept.push_back(std::move(members[i]));
        }
        const size_t removed = members.size() - kept.size();
        members = std::move(kept);
        return removed;
    }

    /**
     * @brief Stable sort of the members; `less(const T&, const T&)` sees both through
     *        shared access. The sorted order replaces key order; each member keeps its key,
     *        which later inserts use as described above. If `less` throws, the order is
     *        unchanged.
     */
    template <typename Less> void sort_by(Less &&less)
    {
        m_state->require_idle("sort_by");
        ++m_state->iterating;
        auto done = basics::make_scope_guard([this]() noexcept { --m_state->iterating; });

        std::vector<Member> sorted = m_state->members;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [&less](const Member &a, const Member &b)
                         {
                             return a.cell.dispatch_ref(
                                 [&](const T &x)
                                 {
                                     return b.cell.dispatch_ref([&](const T &y)
                                                                { return static_cast<bool>(less(x, y)); });
                                 });
                         });
        m_state->members = std::move(sorted);
    }

    // --- Subscribe-time wiring ---

    /**
     * @brief Declares that the handler under construction listens here, and stages the
     *        insertion of `cell` at `key` for when the subscription commits.
     */
    void listen(ExclusivityCell<T> cell, int key = 0)
    {
        m_state->registry->record_listen(m_state->id);
        std::weak_ptr<State> weak = m_state;
        const uint64_t cell_id = cell.id();
        m_state->registry->stage_join(
            [weak, key, cell = std::move(cell)]()
            {
                if (auto state = weak.lock())
                    state->insert(key, cell);
            },
            [weak, key, cell_id]()
            {
                if (auto state = weak.lock())
                    state->leave(cell_id, key);
            });
    }

    /** @brief Declares that the handler under construction emits here. */
    [[nodiscard]] Emitter emitter()
    {
        m_state->registry->record_emit(m_state->id);
        return Emitter(m_state);
    }

  private:
    std::shared_ptr<State> m_state;
};

} // namespace relayhub::bus
