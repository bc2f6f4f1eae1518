#include "rlh_service.hpp"
#include "utils/bus_error.hpp"

#include <atomic>

namespace relayhub::bus
{

namespace
{
std::atomic<FailurePolicy> g_failure_policy{FailurePolicy::Throw};
} // namespace

BusError::BusError(BusErrorKind kind, const std::string &message)
    : std::logic_error(message), m_kind(kind)
{
}

RecursionDetected::RecursionDetected(std::vector<std::string> chain,
                                     std::vector<RecursionHop> hops)
    : BusError(BusErrorKind::RecursionDetected,
               "recursion detected during subscription: " + render(chain, hops)),
      m_chain(std::move(chain)), m_hops(std::move(hops))
{
}

std::string RecursionDetected::render(const std::vector<std::string> &chain,
                                      const std::vector<RecursionHop> &hops)
{
    std::string out;
    for (size_t i = 0; i < chain.size(); ++i)
    {
        const std::vector<std::string> *handlers = nullptr;
        if (i < hops.size())
            handlers = &hops[i].handlers;
        out += fmt::format("[{}]{} -> ",
                           handlers ? format_tools::join_names(*handlers) : std::string(), chain[i]);
    }
    if (!chain.empty())
        out += chain.front();
    return out;
}

void set_failure_policy(FailurePolicy policy) noexcept
{
    g_failure_policy.store(policy, std::memory_order_relaxed);
}

FailurePolicy failure_policy() noexcept
{
    return g_failure_policy.load(std::memory_order_relaxed);
}

void report_failure(const BusError &error) noexcept
{
    LOGGER_ERROR("bus error [{}]: {}", to_string(error.kind()), error.what());
    if (failure_policy() == FailurePolicy::Panic)
    {
        utils::Logger::instance().flush();
        RLH_PANIC("bus error [{}]: {}", to_string(error.kind()), error.what());
    }
}

} // namespace relayhub::bus
