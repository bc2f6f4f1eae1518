/**
 * @file basic_hub_example.cpp
 * @brief Example: a small sensor pipeline wired through subscribe<H>().
 *
 * Key concepts shown:
 *  - Declaring channels as members of a Hub.
 *  - Handler hooks: `register_emits` runs before construction, `register_listens` after.
 *  - A subscription that would close a cycle is rejected with RecursionDetected and
 *    leaves the hub untouched.
 *  - Exporting the wiring as Graphviz DOT.
 *
 * Configuration is read from RELAYHUB_CONFIG_FILE / RELAYHUB_* environment variables.
 */
#include "rlh_bus.hpp"
#include "rlh_service.hpp"

#include <iostream>
#include <string>

using namespace relayhub::bus;

// ─── Interfaces ───────────────────────────────────────────────────────────────

struct SampleListener
{
    virtual ~SampleListener() = default;
    virtual void on_sample(double value) = 0;
};

struct AlarmListener
{
    virtual ~AlarmListener() = default;
    virtual void on_alarm(const std::string &reason) = 0;
};

struct PipelineHub : Hub
{
    using Hub::Hub;
    Channel<SampleListener> samples{registry(), "samples"};
    Channel<AlarmListener> alarms{registry(), "alarms"};
};

// ─── Handlers ─────────────────────────────────────────────────────────────────

/// Raises an alarm whenever a sample crosses the threshold.
struct ThresholdMonitor : SampleListener
{
    static constexpr const char *kName = "ThresholdMonitor";

    struct Emits
    {
        Channel<AlarmListener>::Emitter alarms;
    };
    static Emits register_emits(PipelineHub &hub) { return {hub.alarms.emitter()}; }
    static void register_listens(PipelineHub &hub, const ExclusivityCell<ThresholdMonitor> &self)
    {
        hub.samples.listen(self);
    }

    ThresholdMonitor(Emits e, double limit) : emits(std::move(e)), limit(limit) {}

    void on_sample(double value) override
    {
        if (value > limit)
        {
            const auto reason = fmt::format("sample {:.1f} above {:.1f}", value, limit);
            emits.alarms.dispatch([&](AlarmListener &l) { l.on_alarm(reason); });
        }
    }

    Emits emits;
    double limit;
};

/// Prints alarms.
struct AlarmPrinter : AlarmListener
{
    static constexpr const char *kName = "AlarmPrinter";
    static void register_listens(PipelineHub &hub, const ExclusivityCell<AlarmPrinter> &self)
    {
        hub.alarms.listen(self);
    }

    void on_alarm(const std::string &reason) override
    {
        ++count;
        std::cout << "ALARM: " << reason << "\n";
    }

    int count = 0;
};

/// Would re-inject a sample on every alarm: alarms -> samples closes a cycle.
struct AlarmReplayer : AlarmListener
{
    static constexpr const char *kName = "AlarmReplayer";
    struct Emits
    {
        Channel<SampleListener>::Emitter samples;
    };
    static Emits register_emits(PipelineHub &hub) { return {hub.samples.emitter()}; }
    static void register_listens(PipelineHub &hub, const ExclusivityCell<AlarmReplayer> &self)
    {
        hub.alarms.listen(self);
    }

    explicit AlarmReplayer(Emits e) : emits(std::move(e)) {}
    void on_alarm(const std::string &) override
    {
        emits.samples.dispatch([](SampleListener &l) { l.on_sample(0.0); });
    }

    Emits emits;
};

int main()
{
    relayhub::BusConfig config;
    try
    {
        config = relayhub::BusConfig::load();
    }
    catch (const std::exception &e)
    {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 1;
    }
    if (!config.apply())
        std::cerr << "log file '" << config.log_file << "' unavailable, logging to console\n";

    PipelineHub hub(config.registry_options());
    auto monitor = subscribe<ThresholdMonitor>(hub, 50.0);
    auto printer = subscribe<AlarmPrinter>(hub);

    try
    {
        (void)subscribe<AlarmReplayer>(hub);
    }
    catch (const RecursionDetected &e)
    {
        std::cout << "rejected: " << e.what() << "\n";
    }

    for (double v : {12.0, 48.5, 51.2, 75.0, 3.3})
        hub.samples.dispatch([v](SampleListener &l) { l.on_sample(v); });

    std::cout << "alarms printed: "
              << printer.dispatch_ref([](const AlarmPrinter &p) { return p.count; }) << "\n";

    GraphExporter exporter(*hub.registry());
    if (!exporter.write_configured(config))
        std::cout << exporter.to_dot("Pipeline");

    unsubscribe(hub, monitor);
    unsubscribe(hub, printer);
    LOGGER_INFO("pipeline shut down; {} channel(s) declared", hub.registry()->channel_names().size());
    return 0;
}
