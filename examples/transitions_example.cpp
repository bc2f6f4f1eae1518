/**
 * @file transitions_example.cpp
 * @brief Example: a job list driven by remove_if, with results passed upward by a Feed.
 *
 * The scheduler dispatches to its jobs, so a job cannot emit back to the scheduler on a
 * channel without closing a cycle. Jobs report completions through a Feed instead; the
 * scheduler drains it after each round, outside the dispatch that produced the items.
 */
#include "rlh_bus.hpp"
#include "rlh_service.hpp"

#include <iostream>
#include <string>

using namespace relayhub::bus;

struct Job
{
    virtual ~Job() = default;
    /// @return true once the job is finished.
    virtual bool step() = 0;
};

struct JobHub : Hub
{
    Channel<Job> jobs{registry(), "jobs"};
    Feed<std::string> completions{registry(), "completions", 8};
};

struct CountdownJob : Job
{
    static constexpr const char *kName = "CountdownJob";
    struct Emits
    {
        Feed<std::string>::Feeder done;
    };
    static Emits register_emits(JobHub &hub) { return {hub.completions.feeder()}; }
    static void register_listens(JobHub &hub, const ExclusivityCell<CountdownJob> &self)
    {
        hub.jobs.listen(self);
    }

    CountdownJob(Emits e, std::string name, int steps)
        : emits(std::move(e)), name(std::move(name)), remaining(steps)
    {
    }

    bool step() override
    {
        if (--remaining > 0)
            return false;
        emits.done.feed(name);
        return true;
    }

    Emits emits;
    std::string name;
    int remaining;
};

struct Scheduler
{
    static constexpr const char *kName = "Scheduler";
    struct Emits
    {
        Channel<Job>::Emitter jobs;
    };
    static Emits register_emits(JobHub &hub) { return {hub.jobs.emitter()}; }

    Scheduler(Emits e, JobHub &hub) : emits(std::move(e)), hub(hub), done(hub.completions.feedee()) {}

    // Runs one round; finished jobs leave the channel in the same pass.
    size_t round()
    {
        const auto finished = hub.jobs.remove_if([](Job &j) { return j.step(); });
        while (auto name = done.pop())
            std::cout << "  completed: " << *name << "\n";
        return finished;
    }

    Emits emits;
    JobHub &hub;
    Feed<std::string>::Feedee done;
};

int main()
{
    JobHub hub;
    auto scheduler = subscribe<Scheduler>(hub, hub);
    (void)subscribe<CountdownJob>(hub, "fetch", 1);
    (void)subscribe<CountdownJob>(hub, "parse", 3);
    (void)subscribe<CountdownJob>(hub, "index", 2);

    for (int r = 1; !hub.jobs.empty(); ++r)
    {
        std::cout << "round " << r << "\n";
        scheduler.dispatch([](Scheduler &s) { s.round(); });
    }

    std::cout << relayhub::bus::GraphExporter(*hub.registry()).to_json().dump(2) << "\n";
    return 0;
}
