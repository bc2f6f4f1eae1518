#pragma once
/**
 * @file test_patterns.h
 * @brief Standard test fixtures for the relayhub test suite.
 *
 * ## Pattern 1: PureApiTest
 *
 * In-process, no process-wide state touched.
 * For: pure functions, data structures, algorithms, compile-time traits.
 *
 *   class MyTest : public relayhub::tests::PureApiTest { ... };
 *
 * ---
 *
 * ## Pattern 2: BusTest
 *
 * In-process tests that exercise the bus. The Logger is redirected to an in-memory
 * CaptureSink so tests can assert on what was logged, and the failure policy is forced
 * to Throw. Both are restored in TearDown.
 *
 *   class RegistryTest : public relayhub::tests::BusTest { ... };
 *   TEST_F(RegistryTest, Rejects) {
 *       EXPECT_THROW(..., relayhub::bus::RecursionDetected);
 *       EXPECT_TRUE(captured().contains("recursion detected"));
 *   }
 *
 * ---
 *
 * ## Pattern 3: death tests
 *
 * Panics abort the process. Put them in a suite whose name ends in `DeathTest` and use
 * EXPECT_DEATH; GoogleTest runs the statement in a child process.
 */

#include "gtest/gtest.h"
#include "rlh_service.hpp"
#include "test_entrypoint.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace relayhub::tests
{

// ============================================================================
// Pattern 1: Pure API / Function Tests
// ============================================================================

class PureApiTest : public ::testing::Test
{
  protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ============================================================================
// In-memory sink
// ============================================================================

/**
 * @brief Records every log message. Shared state so the test keeps access after the
 *        Logger takes ownership of the sink.
 */
class CaptureSink : public utils::Sink
{
  public:
    struct Records
    {
        std::mutex mutex;
        std::vector<utils::LogMessage> messages;

        [[nodiscard]] bool contains(const std::string &needle)
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto &m : messages)
            {
                if (m.body.find(needle) != std::string::npos)
                    return true;
            }
            return false;
        }

        [[nodiscard]] size_t count_at(utils::Logger::Level lvl)
        {
            std::lock_guard<std::mutex> lock(mutex);
            size_t n = 0;
            for (const auto &m : messages)
            {
                if (m.level == static_cast<int>(lvl))
                    ++n;
            }
            return n;
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex);
            messages.clear();
        }
    };

    explicit CaptureSink(std::shared_ptr<Records> records) : m_records(std::move(records)) {}

    void write(const utils::LogMessage &msg) override
    {
        std::lock_guard<std::mutex> lock(m_records->mutex);
        m_records->messages.push_back(msg);
    }
    void flush() override {}
    std::string description() const override { return "Capture"; }

  private:
    std::shared_ptr<Records> m_records;
};

// ============================================================================
// Pattern 2: Bus tests
// ============================================================================

class BusTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        auto &logger = utils::Logger::instance();
        saved_level_ = logger.level();
        logger.set_level(utils::Logger::Level::L_TRACE);
        logger.set_sink(std::make_unique<CaptureSink>(records_));
        bus::set_failure_policy(bus::FailurePolicy::Throw);
    }

    void TearDown() override
    {
        auto &logger = utils::Logger::instance();
        logger.set_console();
        logger.set_level(saved_level_);
        bus::set_failure_policy(bus::FailurePolicy::Throw);
    }

    CaptureSink::Records &captured() { return *records_; }

  private:
    std::shared_ptr<CaptureSink::Records> records_ = std::make_shared<CaptureSink::Records>();
    utils::Logger::Level saved_level_ = utils::Logger::Level::L_INFO;
};

} // namespace relayhub::tests
