/**
 * @file test_exclusivity_cell.cpp
 * @brief Unit tests for ExclusivityCell, SuspendToken and the access state machine.
 *
 * Covers: exclusive/shared transitions, AlreadyBorrowed on overlapping holds, safe
 * re-entry through suspend, suspend targeting errors (NotInContext, UnexpectedItem), state
 * restoration on exceptions and the Derived -> Base handle conversion.
 */
#include "rlh_base.hpp"
#include "test_patterns.h"

#include <optional>
#include <stdexcept>
#include <string>

using namespace relayhub::bus;
using relayhub::basics::DispatchFrame;

namespace
{

struct Counter
{
    int hits = 0;
};

struct Shape
{
    virtual ~Shape() = default;
    virtual int sides() const = 0;
};

struct Square : Shape
{
    int sides() const override { return 4; }
};

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

} // namespace

class ExclusivityCellTest : public relayhub::tests::BusTest
{
};

TEST_F(ExclusivityCellTest, DispatchReturnsResultAndRestoresFree)
{
    auto cell = make_cell<Counter>();
    EXPECT_TRUE(cell.is_free());
    const int result = cell.dispatch(
        [&](Counter &c)
        {
            EXPECT_EQ(cell.mode(), AccessState::Mode::Exclusive);
            EXPECT_EQ(DispatchFrame::top()->cell_id, cell.id());
            return ++c.hits;
        });
    EXPECT_EQ(result, 1);
    EXPECT_TRUE(cell.is_free());
    EXPECT_EQ(DispatchFrame::current_depth(), 0u);
}

TEST_F(ExclusivityCellTest, IdsAreUniqueAndSharedByCopies)
{
    auto a = make_cell<Counter>();
    auto b = make_cell<Counter>();
    auto a2 = a;
    EXPECT_NE(a.id(), b.id());
    EXPECT_EQ(a.id(), a2.id());
    EXPECT_TRUE(a.same_as(a2));
    EXPECT_FALSE(a.same_as(b));

    a2.dispatch([](Counter &c) { c.hits = 5; });
    EXPECT_EQ(a.dispatch_ref([](const Counter &c) { return c.hits; }), 5);
}

TEST_F(ExclusivityCellTest, NestedDispatchOnSameCellIsAlreadyBorrowed)
{
    auto cell = make_cell<Counter>();
    const auto kind = kind_of([&] { cell.dispatch([&](Counter &) { cell.dispatch([](Counter &) {}); }); });
    EXPECT_EQ(kind, BusErrorKind::AlreadyBorrowed);
    EXPECT_TRUE(cell.is_free());
    EXPECT_EQ(DispatchFrame::current_depth(), 0u);
    EXPECT_TRUE(captured().contains("already borrowed"));
}

TEST_F(ExclusivityCellTest, SharedAccessNestsButBlocksExclusive)
{
    auto cell = make_cell<Counter>();
    cell.dispatch_ref(
        [&](const Counter &)
        {
            cell.dispatch_ref(
                [&](const Counter &)
                {
                    EXPECT_EQ(cell.mode(), AccessState::Mode::Shared);
                    EXPECT_EQ(cell.state().readers(), 2u);
                });
            EXPECT_EQ(kind_of([&] { cell.dispatch([](Counter &) {}); }), BusErrorKind::AlreadyBorrowed);
        });
    EXPECT_TRUE(cell.is_free());

    cell.dispatch(
        [&](Counter &)
        {
            EXPECT_EQ(kind_of([&] { cell.dispatch_ref([](const Counter &) {}); }),
                      BusErrorKind::AlreadyBorrowed);
        });
}

TEST_F(ExclusivityCellTest, StateRestoredWhenHandlerThrows)
{
    auto cell = make_cell<Counter>();
    EXPECT_THROW(cell.dispatch([](Counter &) { throw std::runtime_error("handler failed"); }),
                 std::runtime_error);
    EXPECT_TRUE(cell.is_free());
    EXPECT_EQ(DispatchFrame::current_depth(), 0u);

    EXPECT_THROW(cell.dispatch_ref([](const Counter &) { throw std::runtime_error("x"); }),
                 std::runtime_error);
    EXPECT_EQ(cell.state().readers(), 0u);
    EXPECT_TRUE(cell.is_free());
}

TEST_F(ExclusivityCellTest, SuspendAllowsExactlyOneReentry)
{
    auto cell = make_cell<Counter>();
    cell.dispatch(
        [&](Counter &c, const SuspendToken &token)
        {
            ++c.hits;
            token.suspend(
                [&]
                {
                    EXPECT_TRUE(cell.is_free());
                    EXPECT_TRUE(cell.is_suspended());
                    EXPECT_TRUE(DispatchFrame::top()->paused);
                    cell.dispatch([](Counter &inner) { ++inner.hits; });
                });
            EXPECT_EQ(cell.mode(), AccessState::Mode::Exclusive);
            EXPECT_FALSE(cell.is_suspended());
            EXPECT_FALSE(DispatchFrame::top()->paused);
        });
    EXPECT_EQ(cell.dispatch_ref([](const Counter &c) { return c.hits; }), 2);
    EXPECT_TRUE(cell.is_free());
}

TEST_F(ExclusivityCellTest, SuspendOfSharedHoldReleasesOneReader)
{
    auto cell = make_cell<Counter>();
    cell.dispatch_ref(
        [&](const Counter &, const SuspendToken &token)
        {
            EXPECT_EQ(token.access(), relayhub::basics::AccessKind::Shared);
            token.suspend(
                [&]
                {
                    EXPECT_TRUE(cell.is_free());
                    cell.dispatch([](Counter &c) { c.hits = 9; });
                });
            EXPECT_EQ(cell.state().readers(), 1u);
        });
    EXPECT_EQ(cell.dispatch_ref([](const Counter &c) { return c.hits; }), 9);
}

TEST_F(ExclusivityCellTest, SuspendRestoresHoldWhenActionThrows)
{
    auto cell = make_cell<Counter>();
    cell.dispatch(
        [&](Counter &, const SuspendToken &token)
        {
            EXPECT_THROW(token.suspend([] { throw std::runtime_error("nested failure"); }),
                         std::runtime_error);
            EXPECT_EQ(cell.mode(), AccessState::Mode::Exclusive);
            EXPECT_FALSE(cell.is_suspended());
        });
    EXPECT_TRUE(cell.is_free());
}

TEST_F(ExclusivityCellTest, SuspendReturnsActionResult)
{
    auto cell = make_cell<Counter>();
    const int v = cell.dispatch([&](Counter &, const SuspendToken &token)
                                { return token.suspend([] { return 17; }); });
    EXPECT_EQ(v, 17);
}

TEST_F(ExclusivityCellTest, SuspendOutsideDispatchIsNotInContext)
{
    auto cell = make_cell<Counter>();
    EXPECT_EQ(kind_of([&] { cell.suspend([] {}); }), BusErrorKind::NotInContext);
}

TEST_F(ExclusivityCellTest, SuspendOfNonInnermostCellIsUnexpectedItem)
{
    auto outer = make_cell<Counter>();
    auto inner = make_cell<Counter>();
    outer.dispatch(
        [&](Counter &, const SuspendToken &outer_token)
        {
            inner.dispatch(
                [&](Counter &)
                {
                    EXPECT_EQ(kind_of([&] { outer.suspend([] {}); }), BusErrorKind::UnexpectedItem);
                    EXPECT_EQ(kind_of([&] { outer_token.suspend([] {}); }),
                              BusErrorKind::UnexpectedItem);
                    EXPECT_EQ(kind_of([&] { inner.suspend(outer_token, [] {}); }),
                              BusErrorKind::UnexpectedItem);
                });
            EXPECT_EQ(outer.mode(), AccessState::Mode::Exclusive);
        });
    EXPECT_TRUE(outer.is_free());
    EXPECT_TRUE(inner.is_free());
}

TEST_F(ExclusivityCellTest, SuspendTwiceOnSameFrameIsNotInContext)
{
    auto cell = make_cell<Counter>();
    cell.dispatch(
        [&](Counter &, const SuspendToken &token)
        {
            token.suspend([&] { EXPECT_EQ(kind_of([&] { token.suspend([] {}); }), BusErrorKind::NotInContext); });
        });
    EXPECT_TRUE(cell.is_free());
}

TEST_F(ExclusivityCellTest, StaleTokenIsRejected)
{
    auto cell = make_cell<Counter>();
    std::optional<SuspendToken> saved;
    cell.dispatch([&](Counter &, const SuspendToken &token) { saved = token; });
    EXPECT_EQ(kind_of([&] { saved->suspend([] {}); }), BusErrorKind::NotInContext);

    auto other = make_cell<Counter>();
    other.dispatch(
        [&](Counter &) { EXPECT_EQ(kind_of([&] { saved->suspend([] {}); }), BusErrorKind::UnexpectedItem); });
}

TEST_F(ExclusivityCellTest, CellSuspendWithForeignTokenOutsideDispatch)
{
    auto a = make_cell<Counter>();
    auto b = make_cell<Counter>();
    std::optional<SuspendToken> token_of_a;
    a.dispatch([&](Counter &, const SuspendToken &token) { token_of_a = token; });
    EXPECT_EQ(kind_of([&] { b.suspend(*token_of_a, [] {}); }), BusErrorKind::NotInContext);
}

TEST_F(ExclusivityCellTest, DerivedHandleConvertsToBaseWithSameIdentity)
{
    auto square = make_cell<Square>();
    ExclusivityCell<Shape> shape = square;
    EXPECT_EQ(shape.id(), square.id());
    EXPECT_TRUE(shape.same_as(square));
    EXPECT_EQ(shape.dispatch_ref([](const Shape &s) { return s.sides(); }), 4);

    // A hold through one interface blocks the other.
    square.dispatch(
        [&](Square &)
        { EXPECT_EQ(kind_of([&] { shape.dispatch([](Shape &) {}); }), BusErrorKind::AlreadyBorrowed); });
}

TEST_F(ExclusivityCellTest, AccessModeNames)
{
    EXPECT_STREQ(to_string(AccessState::Mode::Free), "free");
    EXPECT_STREQ(to_string(AccessState::Mode::Exclusive), "exclusive");
    EXPECT_STREQ(to_string(AccessState::Mode::Shared), "shared");
}
