/**
 * @file test_feed.cpp
 * @brief Unit tests for Feed<T>: FIFO order, capacity drops, attachment on commit and
 *        detachment on unsubscribe or feedee destruction.
 */
#include "rlh_bus.hpp"
#include "test_patterns.h"

#include <memory>
#include <optional>
#include <string>

using namespace relayhub::bus;

class FeedTest : public relayhub::tests::BusTest
{
  protected:
    std::shared_ptr<Registry> registry_ = std::make_shared<Registry>();

    // Wires a feeder and a feedee through two committed frames.
    template <typename T>
    std::pair<typename Feed<T>::Feeder, typename Feed<T>::Feedee> wire(Feed<T> &feed,
                                                                      uint64_t child_cell,
                                                                      uint64_t parent_cell)
    {
        std::optional<typename Feed<T>::Feeder> out;
        {
            SubscriptionScope scope(*registry_, {"Child", "Child"});
            out.emplace(feed.feeder());
            scope.commit(child_cell);
        }
        std::optional<typename Feed<T>::Feedee> in;
        {
            SubscriptionScope scope(*registry_, {"Parent", "Parent"});
            in.emplace(feed.feedee());
            scope.commit(parent_cell);
        }
        return {std::move(*out), std::move(*in)};
    }
};

TEST_F(FeedTest, ItemsArriveInOrder)
{
    Feed<std::string> feed(registry_, "requests");
    EXPECT_EQ(registry_->channel_kind(feed.id()), ChannelKind::Feed);
    auto [out, in] = wire(feed, 1, 2);
    EXPECT_EQ(feed.feedee_count(), 1u);

    EXPECT_EQ(out.feed("first"), 1u);
    EXPECT_EQ(out.feed("second"), 1u);
    EXPECT_EQ(in.pending(), 2u);
    EXPECT_EQ(in.pop().value(), "first");
    EXPECT_EQ(in.pop().value(), "second");
    EXPECT_FALSE(in.pop().has_value());
}

TEST_F(FeedTest, EveryFeedeeGetsACopy)
{
    Feed<int> feed(registry_, "numbers");
    auto [out, first] = wire(feed, 1, 2);
    std::optional<Feed<int>::Feedee> second;
    {
        SubscriptionScope scope(*registry_, {"Auditor", "Auditor"});
        second.emplace(feed.feedee());
        scope.commit(3);
    }
    EXPECT_EQ(out.feed(7), 2u);
    EXPECT_EQ(first.pop().value(), 7);
    EXPECT_EQ(second->pop().value(), 7);
}

TEST_F(FeedTest, FullQueueDropsAndWarns)
{
    Feed<int> feed(registry_, "bounded", 2);
    EXPECT_EQ(feed.capacity(), 2u);
    auto [out, in] = wire(feed, 1, 2);
    EXPECT_EQ(out.feed(1), 1u);
    EXPECT_EQ(out.feed(2), 1u);
    EXPECT_EQ(out.feed(3), 0u);
    EXPECT_EQ(in.dropped(), 1u);
    EXPECT_EQ(in.pending(), 2u);
    EXPECT_TRUE(captured().contains("feed 'bounded': queue full (2 items), item dropped (1 so far)"));

    EXPECT_EQ(in.pop().value(), 1);
    EXPECT_EQ(out.feed(4), 1u);
}

TEST_F(FeedTest, CapacityDefaultsToRegistryOption)
{
    RegistryOptions opts;
    opts.feed_capacity = 3;
    auto registry = std::make_shared<Registry>(opts);
    Feed<int> inherited(registry, "inherited");
    Feed<int> unbounded(registry, "unbounded", 0);
    EXPECT_EQ(inherited.capacity(), 3u);
    EXPECT_EQ(unbounded.capacity(), 0u);
}

TEST_F(FeedTest, FeedeeAttachesOnlyOnCommit)
{
    Feed<int> feed(registry_, "requests");
    std::optional<Feed<int>::Feeder> out;
    {
        SubscriptionScope scope(*registry_, {"Child", "Child"});
        out.emplace(feed.feeder());
        scope.commit(1);
    }
    {
        SubscriptionScope scope(*registry_, {"Parent", "Parent"});
        auto in = feed.feedee();
        EXPECT_EQ(feed.feedee_count(), 0u);
        // scope unwinds without commit
    }
    EXPECT_EQ(feed.feedee_count(), 0u);
    EXPECT_EQ(out->feed(1), 0u);
}

TEST_F(FeedTest, UnsubscribeDetachesTheQueue)
{
    Feed<int> feed(registry_, "requests");
    auto [out, in] = wire(feed, 1, 2);
    registry_->unsubscribe(2);
    EXPECT_EQ(feed.feedee_count(), 0u);
    EXPECT_EQ(out.feed(5), 0u);
    EXPECT_EQ(in.pending(), 0u);
}

TEST_F(FeedTest, DestroyedFeedeeIsPruned)
{
    Feed<int> feed(registry_, "requests");
    std::optional<Feed<int>::Feeder> out;
    {
        auto pair = wire(feed, 1, 2);
        out.emplace(std::move(pair.first));
        EXPECT_EQ(feed.feedee_count(), 1u);
    }
    EXPECT_EQ(feed.feedee_count(), 0u);
    EXPECT_EQ(out->feed(9), 0u);
    EXPECT_NO_THROW(registry_->unsubscribe(2));
}

TEST_F(FeedTest, FeedsDoNotCloseCycles)
{
    // Parent listens on "down" and emits on it through the child; the child answers
    // through a feed. Only Channel edges enter the graph.
    Channel<int> down(registry_, "down");
    Feed<int> up(registry_, "up");
    {
        SubscriptionScope scope(*registry_, {"Child", "Child"});
        down.listen(make_cell<int>(0));
        (void)up.feeder();
        scope.commit(10);
    }
    {
        SubscriptionScope scope(*registry_, {"Parent", "Parent"});
        (void)up.feedee();
        (void)down.emitter();
        EXPECT_NO_THROW(scope.commit(11));
    }
    EXPECT_TRUE(registry_->edges().empty());
    EXPECT_EQ(registry_->listeners_of("up"), std::vector<std::string>{"Parent"});
    EXPECT_EQ(registry_->emitters_of("up"), std::vector<std::string>{"Child"});
}
