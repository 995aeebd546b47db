#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include "macscout/async/identification_pool.hpp"
#include "macscout/error/exception.hpp"
#include "support/fakes.hpp"

using namespace macscout;
using namespace macscout::async;
using namespace std::chrono_literals;
using device::DeviceStatus;
using macscout::test::ScriptedIdentifier;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

auto makeConfig(std::size_t workers, uint32_t max_attempts = 3) -> PoolConfig {
    PoolConfig config;
    config.workers = workers;
    config.attempt_timeout = 1000ms;
    config.max_attempts = max_attempts;
    config.shutdown_grace = 500ms;
    return config;
}

auto fastBackoff() -> BackoffPolicy {
    return BackoffPolicy(
        BackoffConfig{BackoffStrategy::Exponential, 0ms, 0ms});
}

// Ignores the stop token on purpose.
class StubbornIdentifier : public serial::DeviceIdentifier {
public:
    auto identify(const std::string&, std::chrono::milliseconds,
                  std::stop_token) -> serial::IdentifyResult override {
        std::this_thread::sleep_for(300ms);
        return std::string("aa:bb:cc:dd:ee:ff");
    }
};

class ThrowingIdentifier : public serial::DeviceIdentifier {
public:
    auto identify(const std::string&, std::chrono::milliseconds,
                  std::stop_token) -> serial::IdentifyResult override {
        throw std::runtime_error("serial port exploded");
    }
};

}  // namespace

class IdentificationPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        identifier = std::make_shared<ScriptedIdentifier>();
    }

    void makePool(std::size_t workers, uint32_t max_attempts = 3,
                  BackoffPolicy backoff = fastBackoff()) {
        pool = std::make_unique<IdentificationPool>(
            registry, identifier, makeConfig(workers, max_attempts),
            std::move(backoff));
        pool->start();
    }

    auto dispatch(const std::string& port) -> device::DispatchTicket {
        auto ticket = registry.dispatch(port);
        EXPECT_TRUE(ticket.has_value());
        return *ticket;
    }

    auto status(const std::string& port) -> DeviceStatus {
        return registry.get(port)->status;
    }

    device::DeviceRegistry registry;
    std::shared_ptr<ScriptedIdentifier> identifier;
    std::unique_ptr<IdentificationPool> pool;
};

TEST_F(IdentificationPoolTest, SucceedsOnFirstAttempt) {
    makePool(2);
    identifier->script("/dev/ttyUSB0",
                       {ScriptedIdentifier::mac("24:0a:c4:00:11:22")});

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->waitIdle(5s));

    auto record = registry.get("/dev/ttyUSB0");
    EXPECT_EQ(record->status, DeviceStatus::Success);
    EXPECT_EQ(record->mac, "24:0a:c4:00:11:22");
    EXPECT_EQ(record->attempt_count, 1u);
    EXPECT_EQ(identifier->lastTimeout(), 1000ms);
    EXPECT_EQ(pool->statistics().succeeded.load(), 1u);
}

TEST_F(IdentificationPoolTest, RetriesThenSucceeds) {
    makePool(1);
    identifier->script(
        "/dev/ttyUSB0",
        {ScriptedIdentifier::failure(serial::IdentifyError::Timeout),
         ScriptedIdentifier::failure(serial::IdentifyError::ProtocolError),
         ScriptedIdentifier::mac("24:0a:c4:00:11:22")});

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->waitIdle(5s));

    auto record = registry.get("/dev/ttyUSB0");
    EXPECT_EQ(record->status, DeviceStatus::Success);
    EXPECT_EQ(record->attempt_count, 3u);
    EXPECT_EQ(identifier->calls("/dev/ttyUSB0"), 3);
    EXPECT_EQ(pool->statistics().retried.load(), 2u);
}

TEST_F(IdentificationPoolTest, ExhaustedAttemptsMarkFailed) {
    makePool(1);

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->waitIdle(5s));

    auto record = registry.get("/dev/ttyUSB0");
    EXPECT_EQ(record->status, DeviceStatus::Failed);
    EXPECT_EQ(record->attempt_count, 3u);
    ASSERT_TRUE(record->last_error.has_value());
    EXPECT_THAT(*record->last_error, HasSubstr("timeout"));
    EXPECT_EQ(pool->statistics().failed.load(), 1u);
}

TEST_F(IdentificationPoolTest, SingleWorkerRunsOneJobAtATime) {
    makePool(1);
    identifier->hold("/dev/ttyUSB0");
    identifier->setDefault(ScriptedIdentifier::mac("24:0a:c4:00:11:22"));

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB1")));
    ASSERT_TRUE(identifier->waitForCalls("/dev/ttyUSB0", 1));

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(identifier->calls("/dev/ttyUSB1"), 0);
    EXPECT_EQ(status("/dev/ttyUSB1"), DeviceStatus::Reading);

    identifier->release("/dev/ttyUSB0");
    ASSERT_TRUE(pool->waitIdle(5s));

    EXPECT_THAT(identifier->callOrder(),
                ElementsAre("/dev/ttyUSB0", "/dev/ttyUSB1"));
    EXPECT_EQ(identifier->maxConcurrent(), 1);
    EXPECT_EQ(status("/dev/ttyUSB0"), DeviceStatus::Success);
    EXPECT_EQ(status("/dev/ttyUSB1"), DeviceStatus::Success);
}

TEST_F(IdentificationPoolTest, ConcurrencyIsBoundedByWorkerCount) {
    makePool(2);
    identifier->setDefault(ScriptedIdentifier::mac("24:0a:c4:00:11:22", 30ms));

    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB" + std::to_string(i))));
    }
    ASSERT_TRUE(pool->waitIdle(5s));

    EXPECT_LE(identifier->maxConcurrent(), 2);
    EXPECT_EQ(pool->statistics().succeeded.load(), 6u);
}

TEST_F(IdentificationPoolTest, CancelStopsRunningJob) {
    makePool(1);
    identifier->hold("/dev/ttyUSB0");
    identifier->setDefault(ScriptedIdentifier::mac("24:0a:c4:00:11:22"));

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(identifier->waitForCalls("/dev/ttyUSB0", 1));

    ASSERT_TRUE(registry.markRemoved("/dev/ttyUSB0"));
    EXPECT_TRUE(pool->cancel("/dev/ttyUSB0"));
    ASSERT_TRUE(pool->waitIdle(5s));

    EXPECT_EQ(status("/dev/ttyUSB0"), DeviceStatus::Removed);
    EXPECT_EQ(identifier->cancelledCalls(), 1);
    EXPECT_EQ(pool->statistics().cancelled.load(), 1u);
    EXPECT_FALSE(pool->cancel("/dev/ttyUSB0"));
    EXPECT_FALSE(pool->cancel("/dev/ttyUSB7"));
}

TEST_F(IdentificationPoolTest, CancelDropsQueuedJob) {
    makePool(1);
    identifier->hold("/dev/ttyUSB0");
    identifier->setDefault(ScriptedIdentifier::mac("24:0a:c4:00:11:22"));

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB1")));
    ASSERT_TRUE(identifier->waitForCalls("/dev/ttyUSB0", 1));
    EXPECT_EQ(pool->queuedJobs(), 1u);

    ASSERT_TRUE(registry.markRemoved("/dev/ttyUSB1"));
    EXPECT_TRUE(pool->cancel("/dev/ttyUSB1"));
    EXPECT_EQ(pool->queuedJobs(), 0u);

    identifier->release("/dev/ttyUSB0");
    ASSERT_TRUE(pool->waitIdle(5s));
    EXPECT_EQ(identifier->calls("/dev/ttyUSB1"), 0);
}

TEST_F(IdentificationPoolTest, SamePortNeverRunsTwiceAtOnce) {
    makePool(4);
    identifier->hold("/dev/ttyUSB0");
    identifier->script("/dev/ttyUSB0",
                       {ScriptedIdentifier::mac("24:0a:c4:00:00:01"),
                        ScriptedIdentifier::mac("24:0a:c4:00:00:02")});

    auto first = dispatch("/dev/ttyUSB0");
    ASSERT_TRUE(pool->submit(first));
    ASSERT_TRUE(identifier->waitForCalls("/dev/ttyUSB0", 1));

    // Unplugged and replugged while the first job is still blocked.
    ASSERT_TRUE(registry.markRemoved("/dev/ttyUSB0"));
    auto second = dispatch("/dev/ttyUSB0");
    ASSERT_TRUE(pool->submit(second));

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(identifier->calls("/dev/ttyUSB0"), 1);

    identifier->release("/dev/ttyUSB0");
    ASSERT_TRUE(pool->waitIdle(5s));

    EXPECT_FALSE(identifier->overlapDetected());
    EXPECT_EQ(identifier->calls("/dev/ttyUSB0"), 2);
    auto record = registry.get("/dev/ttyUSB0");
    EXPECT_EQ(record->status, DeviceStatus::Success);
    EXPECT_EQ(record->mac, "24:0a:c4:00:00:02");
    EXPECT_EQ(pool->statistics().discarded.load(), 1u);
}

TEST_F(IdentificationPoolTest, FreshJobsGoBeforeRetries) {
    makePool(1);
    identifier->hold("/dev/ttyUSB0");
    identifier->script(
        "/dev/ttyUSB0",
        {ScriptedIdentifier::failure(serial::IdentifyError::Timeout),
         ScriptedIdentifier::mac("24:0a:c4:00:00:01")});
    identifier->script("/dev/ttyUSB1",
                       {ScriptedIdentifier::mac("24:0a:c4:00:00:02")});

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(identifier->waitForCalls("/dev/ttyUSB0", 1));
    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB1")));
    identifier->release("/dev/ttyUSB0");
    ASSERT_TRUE(pool->waitIdle(5s));

    EXPECT_THAT(identifier->callOrder(),
                ElementsAre("/dev/ttyUSB0", "/dev/ttyUSB1", "/dev/ttyUSB0"));
}

TEST_F(IdentificationPoolTest, RetryWaitsForBackoffWhileFreshPortsRun) {
    makePool(1, 3,
             BackoffPolicy(
                 BackoffConfig{BackoffStrategy::Linear, 200ms, 1000ms}));
    identifier->script(
        "/dev/ttyUSB0",
        {ScriptedIdentifier::failure(serial::IdentifyError::Timeout),
         ScriptedIdentifier::mac("24:0a:c4:00:00:01")});
    identifier->script("/dev/ttyUSB1",
                       {ScriptedIdentifier::mac("24:0a:c4:00:00:02")});

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(identifier->waitForCalls("/dev/ttyUSB0", 1));
    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB1")));
    ASSERT_TRUE(pool->waitIdle(5s));

    EXPECT_THAT(identifier->callOrder(),
                ElementsAre("/dev/ttyUSB0", "/dev/ttyUSB1", "/dev/ttyUSB0"));
    auto first = identifier->callTimes("/dev/ttyUSB0");
    auto other = identifier->callTimes("/dev/ttyUSB1");
    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(other.size(), 1u);
    EXPECT_GE(first[1] - first[0], 190ms);
    EXPECT_LT(other[0], first[1]);
    EXPECT_EQ(status("/dev/ttyUSB0"), DeviceStatus::Success);
    EXPECT_EQ(status("/dev/ttyUSB1"), DeviceStatus::Success);
}

TEST_F(IdentificationPoolTest, EmptyMacIsAFailedAttempt) {
    makePool(1, 3);
    identifier->setDefault(ScriptedIdentifier::mac(""));

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->waitIdle(5s));

    auto record = registry.get("/dev/ttyUSB0");
    EXPECT_EQ(record->status, DeviceStatus::Failed);
    EXPECT_FALSE(record->mac.has_value());
    EXPECT_EQ(record->attempt_count, 3u);
    ASSERT_TRUE(record->last_error.has_value());
    EXPECT_THAT(*record->last_error, HasSubstr("mac not found"));
    EXPECT_EQ(identifier->calls("/dev/ttyUSB0"), 3);
    EXPECT_EQ(pool->statistics().succeeded.load(), 0u);
}

TEST_F(IdentificationPoolTest, MalformedMacIsRetriedAndValidMacNormalized) {
    makePool(1, 3);
    identifier->script("/dev/ttyUSB0",
                       {ScriptedIdentifier::mac("Chip is ESP32"),
                        ScriptedIdentifier::mac(" 240AC4001122\n")});

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->waitIdle(5s));

    auto record = registry.get("/dev/ttyUSB0");
    EXPECT_EQ(record->status, DeviceStatus::Success);
    EXPECT_EQ(record->mac, "24:0a:c4:00:11:22");
    EXPECT_EQ(record->attempt_count, 2u);
    EXPECT_EQ(pool->statistics().retried.load(), 1u);
}

TEST_F(IdentificationPoolTest, IdentifierExceptionIsAFailedAttempt) {
    pool = std::make_unique<IdentificationPool>(
        registry, std::make_shared<ThrowingIdentifier>(), makeConfig(1, 1),
        fastBackoff());
    pool->start();

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->waitIdle(5s));

    auto record = registry.get("/dev/ttyUSB0");
    EXPECT_EQ(record->status, DeviceStatus::Failed);
    EXPECT_THAT(record->last_error.value_or(""), HasSubstr("exploded"));
}

TEST_F(IdentificationPoolTest, ShutdownSignalsRunningJobs) {
    makePool(1);
    identifier->hold("/dev/ttyUSB0");
    identifier->setDefault(ScriptedIdentifier::mac("24:0a:c4:00:11:22"));

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB1")));
    ASSERT_TRUE(identifier->waitForCalls("/dev/ttyUSB0", 1));

    EXPECT_TRUE(pool->shutdown(1s));
    EXPECT_FALSE(pool->running());
    EXPECT_EQ(identifier->cancelledCalls(), 1);
    EXPECT_EQ(identifier->calls("/dev/ttyUSB1"), 0);
    // Nothing was written: the engine decides what happens to Reading.
    EXPECT_EQ(status("/dev/ttyUSB0"), DeviceStatus::Reading);
    EXPECT_FALSE(pool->submit(dispatch("/dev/ttyUSB2")));
}

TEST_F(IdentificationPoolTest, ShutdownAbandonsJobsPastGrace) {
    pool = std::make_unique<IdentificationPool>(
        registry, std::make_shared<StubbornIdentifier>(), makeConfig(1),
        fastBackoff());
    pool->start();

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(macscout::test::waitUntil(
        [&] { return pool->activeJobs() == 1; }));

    EXPECT_FALSE(pool->shutdown(20ms));
    EXPECT_EQ(pool->activeJobs(), 0u);
    EXPECT_EQ(status("/dev/ttyUSB0"), DeviceStatus::Reading);
    EXPECT_EQ(pool->statistics().cancelled.load(), 1u);
}

TEST_F(IdentificationPoolTest, PoolCanBeRestarted) {
    makePool(1);
    EXPECT_TRUE(pool->shutdown(100ms));
    pool->start();
    identifier->setDefault(ScriptedIdentifier::mac("24:0a:c4:00:11:22"));

    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(pool->waitIdle(5s));
    EXPECT_EQ(status("/dev/ttyUSB0"), DeviceStatus::Success);
}

TEST_F(IdentificationPoolTest, DuplicateTicketIsRejected) {
    makePool(1);
    identifier->hold("/dev/ttyUSB0");
    ASSERT_TRUE(pool->submit(dispatch("/dev/ttyUSB0")));
    ASSERT_TRUE(identifier->waitForCalls("/dev/ttyUSB0", 1));

    auto ticket = dispatch("/dev/ttyUSB1");
    EXPECT_TRUE(pool->submit(ticket));
    EXPECT_FALSE(pool->submit(ticket));
    identifier->release("/dev/ttyUSB0");
}

TEST(IdentificationPoolConfigTest, RejectsNullIdentifierAndBadConfig) {
    device::DeviceRegistry registry;
    EXPECT_THROW(IdentificationPool(registry, nullptr),
                 macscout::error::InvalidArgument);

    PoolConfig config;
    config.workers = 0;
    EXPECT_THROW(IdentificationPool(registry,
                                    std::make_shared<ScriptedIdentifier>(),
                                    config),
                 macscout::error::InvalidArgument);
}
