/**
 * @file test_registry.cpp
 * @brief Unit tests for Registry: channel names, construction frames, cycle rejection,
 *        dedup policies, unsubscribe and diagnostics.
 *
 * These tests drive the Registry protocol directly; test_subscription.cpp covers the same
 * behaviour through subscribe<H>().
 */
#include "rlh_bus.hpp"
#include "test_patterns.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace relayhub::bus;

namespace
{

template <typename F> BusErrorKind kind_of(F &&fn)
{
    try
    {
        fn();
    }
    catch (const BusError &e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "expected a BusError";
    return BusErrorKind::ContainerBusy;
}

using Edge = std::pair<std::string, std::string>;

} // namespace

class RegistryTest : public relayhub::tests::BusTest
{
  protected:
    // Runs one complete subscription with the given listens and emits.
    void wire(Registry &reg, const std::string &handler, const std::vector<ChannelId> &listens,
              const std::vector<ChannelId> &emits, uint64_t cell_id)
    {
        SubscriptionScope scope(reg, HandlerIdentity{handler, handler});
        for (auto id : listens)
            reg.record_listen(id);
        for (auto id : emits)
            reg.record_emit(id);
        scope.commit(cell_id);
    }
};

TEST_F(RegistryTest, DeclareChannelAssignsDenseIds)
{
    Registry reg;
    EXPECT_EQ(reg.declare_channel("a"), 0u);
    EXPECT_EQ(reg.declare_channel("b", ChannelKind::One), 1u);
    EXPECT_EQ(reg.channel_count(), 2u);
    EXPECT_EQ(reg.channel_name(1), "b");
    EXPECT_EQ(reg.channel_kind(1), ChannelKind::One);
    EXPECT_EQ(reg.find_channel("a").value(), 0u);
    EXPECT_FALSE(reg.find_channel("zzz").has_value());
    EXPECT_EQ(kind_of([&] { (void)reg.channel_name(7); }), BusErrorKind::UnknownChannel);
    EXPECT_TRUE(captured().contains("channel 'a' declared"));
}

TEST_F(RegistryTest, DuplicateChannelNameIsRejected)
{
    Registry reg;
    reg.declare_channel("tick");
    EXPECT_EQ(kind_of([&] { reg.declare_channel("tick"); }), BusErrorKind::DuplicateChannelName);
    EXPECT_EQ(reg.channel_count(), 1u);

    // Names are scoped to one registry.
    Registry other;
    EXPECT_NO_THROW(other.declare_channel("tick"));
}

TEST_F(RegistryTest, RecordOutsideFrameIsNoActiveSubscription)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    EXPECT_EQ(kind_of([&] { reg.record_listen(a); }), BusErrorKind::NoActiveSubscription);
    EXPECT_EQ(kind_of([&] { reg.record_emit(a); }), BusErrorKind::NoActiveSubscription);
    EXPECT_EQ(kind_of([&] { reg.stage_join([] {}, [] {}); }), BusErrorKind::NoActiveSubscription);
    EXPECT_EQ(kind_of([&] { reg.end_subscription(1); }), BusErrorKind::NoActiveSubscription);
}

TEST_F(RegistryTest, DuplicateDeclarationInOneFrame)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    SubscriptionScope scope(reg, {"H", "H"});
    reg.record_listen(a);
    EXPECT_EQ(kind_of([&] { reg.record_listen(a); }), BusErrorKind::DuplicateDeclaration);
    reg.record_emit(b);
    EXPECT_EQ(kind_of([&] { reg.record_emit(b); }), BusErrorKind::DuplicateDeclaration);
    // Listening and emitting on the same channel are separate declarations.
    EXPECT_NO_THROW(reg.record_emit(a));
}

TEST_F(RegistryTest, UnknownChannelId)
{
    Registry reg;
    SubscriptionScope scope(reg, {"H", "H"});
    EXPECT_EQ(kind_of([&] { reg.record_listen(42); }), BusErrorKind::UnknownChannel);
}

TEST_F(RegistryTest, WiringAnotherRegistryIsRegistryMismatch)
{
    Registry first;
    Registry second;
    const auto foreign = second.declare_channel("x");
    SubscriptionScope scope(first, {"H", "H"});
    EXPECT_EQ(Registry::active(), &first);
    EXPECT_EQ(kind_of([&] { second.record_listen(foreign); }), BusErrorKind::RegistryMismatch);
}

TEST_F(RegistryTest, FramesNestAndActiveRegistryFollows)
{
    Registry reg;
    EXPECT_EQ(Registry::active(), nullptr);
    {
        SubscriptionScope outer(reg, {"Parent", "Parent"});
        EXPECT_EQ(reg.subscription_depth(), 1u);
        {
            SubscriptionScope inner(reg, {"Child", "Child"});
            EXPECT_EQ(reg.subscription_depth(), 2u);
            inner.commit(100);
        }
        EXPECT_EQ(reg.subscription_depth(), 1u);
        EXPECT_EQ(Registry::active(), &reg);
        outer.commit(200);
    }
    EXPECT_FALSE(reg.in_subscription());
    EXPECT_EQ(Registry::active(), nullptr);
    EXPECT_TRUE(reg.is_subscribed(100));
    EXPECT_TRUE(reg.is_subscribed(200));
}

TEST_F(RegistryTest, ListenTimesEmitEdgesAreCommitted)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    const auto c = reg.declare_channel("c");
    wire(reg, "X", {a}, {b, c}, 1);
    EXPECT_EQ(reg.edges(), (std::vector<Edge>{{"a", "b"}, {"a", "c"}}));
    EXPECT_TRUE(reg.reaches("a", "c"));
    EXPECT_FALSE(reg.reaches("b", "a"));
    EXPECT_EQ(reg.listeners_of("a"), std::vector<std::string>{"X"});
    EXPECT_EQ(reg.emitters_of("b"), std::vector<std::string>{"X"});
    EXPECT_EQ(reg.handler_names(), std::vector<std::string>{"X"});
    EXPECT_TRUE(captured().contains("subscription of 'X' committed"));
}

TEST_F(RegistryTest, SecondHandlerClosingCycleIsRejected)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    wire(reg, "X", {a}, {b}, 1);

    try
    {
        wire(reg, "Y", {b}, {a}, 2);
        FAIL() << "cycle was accepted";
    }
    catch (const RecursionDetected &e)
    {
        EXPECT_EQ(e.chain(), (std::vector<std::string>{"a", "b"}));
        ASSERT_EQ(e.hops().size(), 2u);
        EXPECT_EQ(e.hops()[0].handlers, std::vector<std::string>{"X"});
        EXPECT_EQ(e.hops()[1].handlers, std::vector<std::string>{"Y"});
        EXPECT_STREQ(e.what(), "recursion detected during subscription: [X]a -> [Y]b -> a");
    }

    // No side effects: graph, memberships and subscriptions are unchanged.
    EXPECT_EQ(reg.edges(), (std::vector<Edge>{{"a", "b"}}));
    EXPECT_TRUE(reg.listeners_of("b").empty());
    EXPECT_FALSE(reg.is_subscribed(2));
    EXPECT_FALSE(reg.in_subscription());
    EXPECT_EQ(Registry::active(), nullptr);
    EXPECT_TRUE(captured().contains("bus error [RecursionDetected]"));
}

TEST_F(RegistryTest, SelfLoopHandlerIsRejected)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    try
    {
        wire(reg, "Echo", {a}, {a}, 1);
        FAIL() << "self loop was accepted";
    }
    catch (const RecursionDetected &e)
    {
        EXPECT_EQ(e.chain(), std::vector<std::string>{"a"});
        EXPECT_STREQ(e.what(), "recursion detected during subscription: [Echo]a -> a");
    }
    EXPECT_EQ(reg.graph().edge_count(), 0u);
}

TEST_F(RegistryTest, LongerCycleListsEveryHop)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    const auto c = reg.declare_channel("c");
    wire(reg, "AB1", {a}, {b}, 1);
    wire(reg, "AB2", {a}, {b}, 2);
    wire(reg, "BC", {b}, {c}, 3);
    try
    {
        wire(reg, "CA", {c}, {a}, 4);
        FAIL();
    }
    catch (const RecursionDetected &e)
    {
        EXPECT_EQ(e.chain(), (std::vector<std::string>{"a", "b", "c"}));
        EXPECT_STREQ(e.what(),
                     "recursion detected during subscription: [AB1,AB2]a -> [BC]b -> [CA]c -> a");
    }
}

TEST_F(RegistryTest, StagedJoinsRunOnlyOnCommit)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    wire(reg, "X", {a}, {b}, 1);

    int joined = 0;
    int left = 0;
    {
        SubscriptionScope scope(reg, {"Y", "Y"});
        reg.record_listen(b);
        reg.record_emit(a);
        reg.stage_join([&] { ++joined; }, [&] { ++left; });
        EXPECT_EQ(joined, 0);
        EXPECT_THROW(scope.commit(2), RecursionDetected);
    }
    EXPECT_EQ(joined, 0);

    const auto c = reg.declare_channel("c");
    {
        SubscriptionScope scope(reg, {"Z", "Z"});
        reg.record_listen(b);
        reg.record_emit(c);
        reg.stage_join([&] { ++joined; }, [&] { ++left; });
        scope.commit(3);
    }
    EXPECT_EQ(joined, 1);
    EXPECT_EQ(left, 0);
    reg.unsubscribe(3);
    EXPECT_EQ(left, 1);
}

TEST_F(RegistryTest, FailingJoinRollsBackEarlierJoins)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    std::vector<std::string> log;
    {
        SubscriptionScope scope(reg, {"H", "H"});
        reg.record_listen(a);
        reg.stage_join([&] { log.push_back("join1"); }, [&] { log.push_back("leave1"); });
        reg.stage_join([] { throw std::runtime_error("join failed"); }, [] {});
        EXPECT_THROW(scope.commit(1), std::runtime_error);
    }
    EXPECT_EQ(log, (std::vector<std::string>{"join1", "leave1"}));
    EXPECT_FALSE(reg.is_subscribed(1));
    EXPECT_TRUE(reg.listeners_of("a").empty());
}

TEST_F(RegistryTest, AbortedFrameLeavesNoTrace)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    {
        SubscriptionScope scope(reg, {"H", "H"});
        reg.record_listen(a);
        reg.record_emit(b);
    } // not committed
    EXPECT_EQ(reg.graph().edge_count(), 0u);
    EXPECT_TRUE(reg.handler_names().empty());
    EXPECT_EQ(Registry::active(), nullptr);
}

TEST_F(RegistryTest, AbortedParentRollsBackNestedSubscriptions)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    const auto c = reg.declare_channel("c");
    int members = 0;
    {
        SubscriptionScope parent(reg, {"Parent", "Parent"});
        reg.record_listen(a);
        {
            SubscriptionScope child(reg, {"Child", "Child"});
            reg.record_listen(b);
            reg.record_emit(c);
            reg.stage_join([&] { ++members; }, [&] { --members; });
            {
                SubscriptionScope grandchild(reg, {"Grandchild", "Grandchild"});
                reg.record_listen(c);
                reg.stage_join([&] { ++members; }, [&] { --members; });
                grandchild.commit(3);
            }
            child.commit(2);
        }
        EXPECT_EQ(members, 2);
        EXPECT_TRUE(reg.reaches("b", "c"));
    } // parent not committed

    EXPECT_EQ(members, 0);
    EXPECT_FALSE(reg.is_subscribed(2));
    EXPECT_FALSE(reg.is_subscribed(3));
    EXPECT_EQ(reg.subscription_count(), 0u);
    EXPECT_EQ(reg.graph().edge_count(), 0u);
    EXPECT_TRUE(reg.listeners_of("b").empty());
    EXPECT_TRUE(reg.listeners_of("c").empty());
    EXPECT_TRUE(reg.handler_names().empty());
    EXPECT_EQ(reg.live_subscriptions_of("Child"), 0u);
    EXPECT_TRUE(captured().contains("nested subscription of 'Child' (cell #2) rolled back"));

    // The rolled-back wiring does not count against a later subscription.
    wire(reg, "Reverse", {c}, {b}, 4);
    EXPECT_TRUE(reg.reaches("c", "b"));
}

TEST_F(RegistryTest, RejectedParentRollsBackNestedSubscriptions)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    const auto c = reg.declare_channel("c");
    wire(reg, "Closer", {a}, {b}, 1);
    int members = 0;
    {
        SubscriptionScope parent(reg, {"Parent", "Parent"});
        reg.record_listen(b);
        reg.record_emit(a);
        wire(reg, "Child", {c}, {}, 2);
        {
            SubscriptionScope child(reg, {"Joiner", "Joiner"});
            reg.record_listen(c);
            reg.stage_join([&] { ++members; }, [&] { --members; });
            child.commit(3);
        }
        EXPECT_THROW(parent.commit(10), RecursionDetected);
    }
    EXPECT_EQ(members, 0);
    EXPECT_EQ(reg.subscription_count(), 1u);
    EXPECT_TRUE(reg.is_subscribed(1));
    EXPECT_FALSE(reg.is_subscribed(2));
    EXPECT_FALSE(reg.is_subscribed(3));
    EXPECT_TRUE(reg.listeners_of("c").empty());
    EXPECT_EQ(reg.edges(), (std::vector<Edge>{{"a", "b"}}));
    EXPECT_EQ(reg.handler_names(), std::vector<std::string>{"Closer"});
    EXPECT_FALSE(reg.in_subscription());
}

TEST_F(RegistryTest, LiveSubscriptionsFollowSubscribeAndUnsubscribe)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    wire(reg, "X", {a}, {b}, 1);
    wire(reg, "X", {a}, {b}, 2);
    wire(reg, "Y", {b}, {}, 3);
    EXPECT_EQ(reg.live_subscriptions_of("X"), 2u);
    EXPECT_EQ(reg.live_subscriptions_of("Y"), 1u);
    EXPECT_EQ(reg.live_subscriptions_of("Z"), 0u);
    reg.unsubscribe(1);
    EXPECT_EQ(reg.live_subscriptions_of("X"), 1u);
    // Wiring outlives the last subscription.
    reg.unsubscribe(2);
    EXPECT_EQ(reg.live_subscriptions_of("X"), 0u);
    EXPECT_EQ(reg.listeners_of("a"), std::vector<std::string>{"X"});
}

TEST_F(RegistryTest, FeedChannelsStayOutOfTheGraph)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto back = reg.declare_channel("back", ChannelKind::Feed);
    wire(reg, "Child", {a}, {back}, 1);
    wire(reg, "Parent", {back}, {a}, 2);
    EXPECT_EQ(reg.graph().edge_count(), 0u);
    EXPECT_EQ(reg.emitters_of("back"), std::vector<std::string>{"Child"});
    EXPECT_EQ(reg.listeners_of("back"), std::vector<std::string>{"Parent"});
}

TEST_F(RegistryTest, UnsubscribeKeepsWiringAndRejectsSecondCall)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    wire(reg, "X", {a}, {b}, 1);
    EXPECT_EQ(reg.subscription_count(), 1u);
    reg.unsubscribe(1);
    EXPECT_FALSE(reg.is_subscribed(1));
    EXPECT_EQ(reg.subscription_count(), 0u);
    // Append-only: the edge and membership record remain.
    EXPECT_TRUE(reg.reaches("a", "b"));
    EXPECT_EQ(reg.listeners_of("a"), std::vector<std::string>{"X"});
    EXPECT_EQ(kind_of([&] { reg.unsubscribe(1); }), BusErrorKind::NotSubscribed);
    EXPECT_EQ(kind_of([&] { reg.unsubscribe(999); }), BusErrorKind::NotSubscribed);
}

TEST_F(RegistryTest, ThrowingLeaveCanBeRetried)
{
    Registry reg;
    const auto a = reg.declare_channel("a");
    bool fail = true;
    int first_leaves = 0;
    {
        SubscriptionScope scope(reg, {"H", "H"});
        reg.record_listen(a);
        reg.stage_join([] {}, [&] { ++first_leaves; });
        reg.stage_join([] {},
                       [&]
                       {
                           if (fail)
                               throw std::runtime_error("busy");
                       });
        scope.commit(1);
    }
    EXPECT_THROW(reg.unsubscribe(1), std::runtime_error);
    EXPECT_TRUE(reg.is_subscribed(1));
    EXPECT_EQ(first_leaves, 0);
    fail = false;
    reg.unsubscribe(1);
    EXPECT_EQ(first_leaves, 1);
    EXPECT_FALSE(reg.is_subscribed(1));
}

TEST_F(RegistryTest, PerInstanceValidatesEveryRepeat)
{
    Registry reg(RegistryOptions{DedupPolicy::PerInstance, 0});
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    wire(reg, "X", {a}, {b}, 1);
    wire(reg, "X", {a}, {b}, 2);
    EXPECT_EQ(reg.subscription_count(), 2u);
    EXPECT_FALSE(captured().contains("repeat of known wiring"));
}

TEST_F(RegistryTest, PerKindSkipsIdenticalRepeatsAndChecksDivergentOnes)
{
    Registry reg(RegistryOptions{DedupPolicy::PerKind, 0});
    const auto a = reg.declare_channel("a");
    const auto b = reg.declare_channel("b");
    wire(reg, "X", {a}, {b}, 1);
    wire(reg, "X", {a}, {b}, 2);
    EXPECT_TRUE(captured().contains("repeat of known wiring"));
    EXPECT_EQ(reg.subscription_count(), 2u);

    // Same kind, different wiring: validated like a new node and warned about.
    EXPECT_THROW(wire(reg, "X", {b}, {a}, 3), RecursionDetected);
    EXPECT_TRUE(captured().contains("differs from its first subscription"));
    EXPECT_FALSE(reg.is_subscribed(3));
}

TEST_F(RegistryTest, GraphStaysAcyclicAcrossManySubscriptions)
{
    Registry reg;
    std::vector<ChannelId> ids;
    for (int i = 0; i < 8; ++i)
        ids.push_back(reg.declare_channel(fmt::format("c{}", i)));

    uint64_t cell = 1;
    for (size_t from = 0; from < ids.size(); ++from)
    {
        for (size_t to = 0; to < ids.size(); ++to)
        {
            try
            {
                wire(reg, fmt::format("H{}_{}", from, to), {ids[from]}, {ids[to]}, cell++);
            }
            catch (const RecursionDetected &)
            {
            }
            EXPECT_FALSE(reg.graph().find_cycle().has_value());
        }
    }
    // Forward edges were all accepted, every backward edge and self loop rejected.
    EXPECT_TRUE(reg.reaches("c0", "c7"));
    EXPECT_FALSE(reg.reaches("c7", "c0"));
    EXPECT_EQ(reg.graph().edge_count(), ids.size() * (ids.size() - 1) / 2);
}

TEST_F(RegistryTest, OptionsAreKept)
{
    Registry reg(RegistryOptions{DedupPolicy::PerKind, 8});
    EXPECT_EQ(reg.options().dedup, DedupPolicy::PerKind);
    EXPECT_EQ(reg.options().feed_capacity, 8u);
    EXPECT_STREQ(to_string(ChannelKind::AtMostOne), "at_most_one");
    EXPECT_STREQ(to_string(DedupPolicy::PerInstance), "per_instance");
}
