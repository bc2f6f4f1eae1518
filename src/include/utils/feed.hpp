#pragma once
/**
 * @file feed.hpp
 * @brief Feed<T>: backward FIFO from children to ancestors.
 *
 * A handler that must pass data "up" to a handler that dispatches to it cannot emit on a
 * channel the ancestor listens on without closing a cycle. A feed breaks the cycle: the
 * feeder enqueues, and the feedee drains its own queue later, outside the dispatch that
 * produced the items. Feeds are recorded in the registry for diagnostics but are not
 * part of the reachability graph.
 *
 * @code
 *   Feed<Request> requests(registry, "requests");
 *   auto out = requests.feeder();   // in the child, at subscribe time
 *   auto in  = requests.feedee();   // in the parent, at subscribe time
 *   out.feed(Request{...});
 *   while (auto r = in.pop()) handle(*r);
 * @endcode
 */
#include "utils/logger.hpp"
#include "utils/registry.hpp"

#include <algorithm>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relayhub::bus
{

template <typename T> class Feed
{
    struct Queue
    {
        std::deque<T> items;
        size_t dropped = 0;
    };

    struct State
    {
        std::string name;
        ChannelId id = 0;
        size_t capacity = 0;
        std::shared_ptr<Registry> registry;
        std::vector<std::weak_ptr<Queue>> queues;

        void detach(const std::shared_ptr<Queue> &queue)
        {
            queues.erase(std::remove_if(queues.begin(), queues.end(),
                                        [&queue](const std::weak_ptr<Queue> &w)
                                        {
                                            auto q = w.lock();
                                            return !q || q == queue;
                                        }),
                         queues.end());
        }
    };

  public:
    using element_type = T;

    /** @brief Sending side; copies every item into each attached feedee's queue. */
    class Feeder
    {
      public:
        /** @return Number of feedees that received the item. */
        size_t feed(const T &item) const
        {
            auto &state = *m_state;
            size_t delivered = 0;
            bool expired = false;
            for (const auto &weak : state.queues)
            {
                auto queue = weak.lock();
                if (!queue)
                {
                    expired = true;
                    continue;
                }
                if (state.capacity != 0 && queue->items.size() >= state.capacity)
                {
                    ++queue->dropped;
                    LOGGER_WARN("feed '{}': queue full ({} items), item dropped ({} so far)",
                                state.name, state.capacity, queue->dropped);
                    continue;
                }
                queue->items.push_back(item);
                ++delivered;
            }
            if (expired)
                state.detach(nullptr);
            return delivered;
        }

        [[nodiscard]] const std::string &name() const noexcept { return m_state->name; }

      private:
        friend class Feed;
        explicit Feeder(std::shared_ptr<State> state) noexcept : m_state(std::move(state)) {}

        std::shared_ptr<State> m_state;
    };

    /** @brief Receiving side with its own FIFO. Destroying it detaches the queue. */
    class Feedee
    {
      public:
        Feedee(const Feedee &) = delete;
        Feedee &operator=(const Feedee &) = delete;
        Feedee(Feedee &&) noexcept = default;
        Feedee &operator=(Feedee &&) noexcept = default;
        ~Feedee() = default;

        [[nodiscard]] std::optional<T> pop()
        {
            if (m_queue->items.empty())
                return std::nullopt;
            std::optional<T> out(std::move(m_queue->items.front()));
            m_queue->items.pop_front();
            return out;
        }

        [[nodiscard]] size_t pending() const noexcept { return m_queue->items.size(); }
        [[nodiscard]] size_t dropped() const noexcept { return m_queue->dropped; }

      private:
        friend class Feed;
        explicit Feedee(std::shared_ptr<Queue> queue) noexcept : m_queue(std::move(queue)) {}

        std::shared_ptr<Queue> m_queue;
    };

    /**
     * @param capacity Per-feedee queue bound; std::nullopt takes the registry's
     *        `feed_capacity`, 0 is unbounded.
     */
    Feed(std::shared_ptr<Registry> registry, std::string_view name,
         std::optional<size_t> capacity = std::nullopt)
        : m_state(std::make_shared<State>())
    {
        if (!registry)
            throw std::invalid_argument("Feed: registry must not be null");
        m_state->name = std::string(name);
        m_state->id = registry->declare_channel(name, ChannelKind::Feed);
        m_state->capacity = capacity.value_or(registry->options().feed_capacity);
        m_state->registry = std::move(registry);
    }

    Feed(const Feed &) = delete;
    Feed &operator=(const Feed &) = delete;
    Feed(Feed &&) noexcept = default;
    Feed &operator=(Feed &&) noexcept = default;

    [[nodiscard]] ChannelId id() const noexcept { return m_state->id; }
    [[nodiscard]] const std::string &name() const noexcept { return m_state->name; }
    [[nodiscard]] size_t capacity() const noexcept { return m_state->capacity; }

    [[nodiscard]] size_t feedee_count() const noexcept
    {
        return static_cast<size_t>(std::count_if(m_state->queues.begin(), m_state->queues.end(),
                                                 [](const std::weak_ptr<Queue> &w)
                                                 { return !w.expired(); }));
    }

    /** @brief Declares that the handler under construction feeds this feed. */
    [[nodiscard]] Feeder feeder()
    {
        m_state->registry->record_emit(m_state->id);
        return Feeder(m_state);
    }

    /**
     * @brief Declares that the handler under construction drains this feed. The queue is
     *        attached when the subscription commits.
     */
    [[nodiscard]] Feedee feedee()
    {
        m_state->registry->record_listen(m_state->id);
        auto queue = std::make_shared<Queue>();
        std::weak_ptr<State> weak_state = m_state;
        std::weak_ptr<Queue> weak_queue = queue;
        m_state->registry->stage_join(
            [weak_state, weak_queue]()
            {
                if (auto state = weak_state.lock())
                    state->queues.push_back(weak_queue);
            },
            [weak_state, weak_queue]()
            {
                if (auto state = weak_state.lock())
                    state->detach(weak_queue.lock());
            });
        return Feedee(std::move(queue));
    }

  private:
    std::shared_ptr<State> m_state;
};

} // namespace relayhub::bus
