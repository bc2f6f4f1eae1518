#pragma once
/**
 * @file bus_error.hpp
 * @brief Error taxonomy of the bus and the process-wide failure policy.
 *
 * Every wiring or reentrancy violation is reported through `raise()`: the error is
 * logged at ERROR level, then either thrown as a typed exception (FailurePolicy::Throw,
 * the default) or turned into a fatal RLH_PANIC (FailurePolicy::Panic).
 */
#include "rlh_platform.hpp"

#include <concepts>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace relayhub::bus
{

enum class BusErrorKind
{
    DuplicateChannelName, ///< a channel name was declared twice on one registry
    DuplicateDeclaration, ///< a handler declared the same listen/emit twice in one subscription
    RecursionDetected,    ///< a subscription would close a cycle in the reachability graph
    AlreadyBorrowed,      ///< dispatch on a cell whose access state forbids it
    NotInContext,         ///< suspend with no active (unsuspended) dispatch
    UnexpectedItem,       ///< suspend target is not the innermost dispatch
    EmptyRequiredSlot,    ///< dispatch on an unpopulated Slot or Single
    UnknownChannel,
    NoActiveSubscription,
    RegistryMismatch,
    SlotOccupied,
    NotSubscribed,
    ContainerBusy,
};

/**
 * @brief Human-readable name of an error kind (for logs and test diagnostics).
 */
inline const char *to_string(BusErrorKind kind) noexcept
{
    switch (kind)
    {
    case BusErrorKind::DuplicateChannelName:
        return "DuplicateChannelName";
    case BusErrorKind::DuplicateDeclaration:
        return "DuplicateDeclaration";
    case BusErrorKind::RecursionDetected:
        return "RecursionDetected";
    case BusErrorKind::AlreadyBorrowed:
        return "AlreadyBorrowed";
    case BusErrorKind::NotInContext:
        return "NotInContext";
    case BusErrorKind::UnexpectedItem:
        return "UnexpectedItem";
    case BusErrorKind::EmptyRequiredSlot:
        return "EmptyRequiredSlot";
    case BusErrorKind::UnknownChannel:
        return "UnknownChannel";
    case BusErrorKind::NoActiveSubscription:
        return "NoActiveSubscription";
    case BusErrorKind::RegistryMismatch:
        return "RegistryMismatch";
    case BusErrorKind::SlotOccupied:
        return "SlotOccupied";
    case BusErrorKind::NotSubscribed:
        return "NotSubscribed";
    case BusErrorKind::ContainerBusy:
        return "ContainerBusy";
    }
    return "Unknown";
}

/**
 * @class BusError
 * @brief Base exception for every bus violation. `kind()` identifies the violation.
 */
class RELAYHUB_UTILS_EXPORT BusError : public std::logic_error
{
  public:
    BusError(BusErrorKind kind, const std::string &message);

    [[nodiscard]] BusErrorKind kind() const noexcept { return m_kind; }

  private:
    BusErrorKind m_kind;
};

/**
 * @brief One step of a detected cycle: the handlers that listen on `from` and emit on `to`.
 */
struct RecursionHop
{
    std::string from;
    std::string to;
    std::vector<std::string> handlers; ///< display names, sorted
};

/**
 * @class RecursionDetected
 * @brief Raised when a subscription would make some channel reachable from itself.
 *
 * `chain()` is the open cycle, e.g. `[a, b]` for a -> b -> a. `hops()` has one entry per
 * edge of the closed cycle, including the closing edge back to `chain().front()`.
 * The message reads `recursion detected during subscription: [X]a -> [Y]b -> a`.
 */
class RELAYHUB_UTILS_EXPORT RecursionDetected : public BusError
{
  public:
    RecursionDetected(std::vector<std::string> chain, std::vector<RecursionHop> hops);

    [[nodiscard]] const std::vector<std::string> &chain() const noexcept { return m_chain; }
    [[nodiscard]] const std::vector<RecursionHop> &hops() const noexcept { return m_hops; }

    /** @brief Renders "[H1,H2]a -> [H3]b -> a" for a chain and its hops. */
    [[nodiscard]] static std::string render(const std::vector<std::string> &chain,
                                            const std::vector<RecursionHop> &hops);

  private:
    std::vector<std::string> m_chain;
    std::vector<RecursionHop> m_hops;
};

enum class FailurePolicy
{
    Throw, ///< raise typed exceptions (default; recoverable by test harnesses)
    Panic, ///< abort with a message and stack trace
};

inline const char *to_string(FailurePolicy policy) noexcept
{
    return policy == FailurePolicy::Throw ? "throw" : "panic";
}

RELAYHUB_UTILS_EXPORT void set_failure_policy(FailurePolicy policy) noexcept;
[[nodiscard]] RELAYHUB_UTILS_EXPORT FailurePolicy failure_policy() noexcept;

/**
 * @brief Logs a bus error and, under FailurePolicy::Panic, aborts. Returns only under
 *        FailurePolicy::Throw. Use `raise()` rather than calling this directly.
 */
RELAYHUB_UTILS_EXPORT void report_failure(const BusError &error) noexcept;

/**
 * @brief Reports `error` and throws it with its dynamic type preserved.
 */
template <typename E>
requires std::derived_from<std::decay_t<E>, BusError>
[[noreturn]] void raise(E &&error)
{
    report_failure(error);
    throw std::forward<E>(error);
}

/** @brief Convenience: `raise(BusError(kind, message))`. */
[[noreturn]] inline void raise_error(BusErrorKind kind, const std::string &message)
{
    raise(BusError(kind, message));
}

} // namespace relayhub::bus
