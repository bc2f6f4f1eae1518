/**
 * @file reentrancy_example.cpp
 * @brief Example: re-entering a handler through SuspendToken.
 *
 * A counter handler sits on two channels. While it is dispatched from "outer" it is
 * exclusively borrowed, so a plain dispatch of "inner" from inside the callback fails
 * with AlreadyBorrowed. Suspending the outer borrow first makes the counter reachable
 * again; the outer callback resumes afterwards with its borrow restored.
 */
#include "rlh_bus.hpp"
#include "rlh_service.hpp"

#include <iostream>
#include <memory>

using namespace relayhub::bus;

struct Counter
{
    int hits = 0;
};

int main()
{
    relayhub::utils::Logger::instance().set_level(relayhub::utils::Logger::Level::L_DEBUG);

    auto registry = std::make_shared<Registry>();
    Channel<Counter> outer(registry, "outer");
    Channel<Counter> inner(registry, "inner");

    auto counter = make_cell<Counter>();
    outer.insert(counter);
    inner.insert(counter);

    // Without suspend: the nested dispatch collides with the outer borrow.
    try
    {
        outer.dispatch([&](Counter &) { inner.dispatch([](Counter &c) { ++c.hits; }); });
    }
    catch (const BusError &e)
    {
        std::cout << "nested dispatch refused: " << to_string(e.kind()) << "\n";
    }

    // With suspend: the outer borrow is released for the duration of the closure.
    outer.dispatch(
        [&](Counter &c, const SuspendToken &token)
        {
            ++c.hits;
            token.suspend([&] { inner.dispatch([](Counter &again) { again.hits += 10; }); });
            ++c.hits;
        });

    std::cout << "hits: " << counter.dispatch_ref([](const Counter &c) { return c.hits; }) << "\n";
    std::cout << "cell is free again: " << std::boolalpha << counter.is_free() << "\n";
    return 0;
}
