// ZoneWatch headers
#include "core/CommandDispatcher.hpp"
#include "core/ParameterStore.hpp"
#include "protocols/CommandBuilder.hpp"

// ZoneWatch fakes
#include "FakeDownlinkTransport.hpp"
#include "ManualScheduler.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace zonewatch::test {

  using zonewatch::core::CommandDispatcher;
  using zonewatch::core::ErrorMonitor;
  using zonewatch::core::Parameter;
  using zonewatch::core::ParameterStore;
  using zonewatch::protocols::CommandBuilder;
  using Bytes = std::vector<std::uint8_t>;
  using namespace std::chrono_literals;

  class CommandDispatcherTest : public ::testing::Test {
  protected:
    void SetUp() override {
      params->set(Parameter::CommandDelaySeconds, 2.0);
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();

      // Upcast to base class for the dispatcher ctor
      dispatcher = std::make_shared<CommandDispatcher>(
        transport, scheduler, builder, std::static_pointer_cast<ErrorMonitor>(errorMonitor), nullptr,
        params, CommandDispatcher::Options{ 10, 4, 6 });
    }

    std::shared_ptr<ParameterStore> params = std::make_shared<ParameterStore>();
    std::shared_ptr<FakeDownlinkTransport> transport = std::make_shared<FakeDownlinkTransport>();
    std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
    std::shared_ptr<CommandBuilder> builder = std::make_shared<CommandBuilder>();
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::shared_ptr<CommandDispatcher> dispatcher;
  };

  TEST_F(CommandDispatcherTest, SilenceIsSentImmediately) {
    dispatcher->silence("dev-a", "64AF");

    ASSERT_EQ(transport->sent().size(), 1u);
    EXPECT_EQ(transport->sent()[0].device, "dev-a");
    EXPECT_EQ(transport->sent()[0].payload, (Bytes{ 0xB0, 0x00, 0x01, 0x00 }));
    EXPECT_EQ(transport->sent()[0].port, 10);
    EXPECT_EQ(dispatcher->pending("dev-a"), 0u);
  }

  TEST_F(CommandDispatcherTest, SilenceHoldsTheDeviceForOneDelay) {
    dispatcher->silence("dev-a", "64AF");
    dispatcher->silence("dev-a", "64AF");
    ASSERT_EQ(transport->sent().size(), 1u);

    scheduler->advance(1999ms);
    EXPECT_EQ(transport->sent().size(), 1u);
    scheduler->advance(1ms);
    EXPECT_EQ(transport->sent().size(), 2u);
  }

  TEST_F(CommandDispatcherTest, TriggerPacesStepsWithoutBlocking) {
    dispatcher->trigger("dev-a", "64AF");

    // caller returns after the first step; the rest waits on the scheduler
    ASSERT_EQ(transport->sent().size(), 1u);
    EXPECT_EQ(transport->sent()[0].payload, (Bytes{ 0xB0, 0x00, 0x01, 0x04 }));
    EXPECT_EQ(dispatcher->pending("dev-a"), 2u);

    scheduler->advance(1999ms);
    EXPECT_EQ(transport->sent().size(), 1u);
    scheduler->advance(1ms);
    ASSERT_EQ(transport->sent().size(), 2u);
    EXPECT_EQ(transport->sent()[1].payload, (Bytes{ 0xB0, 0x00, 0x02, 0x06 }));

    scheduler->advance(2s);
    ASSERT_EQ(transport->sent().size(), 3u);
    EXPECT_EQ(transport->sent()[2].payload, (Bytes{ 0xAC, 0x00, 0x64, 0xAF }));
    EXPECT_EQ(dispatcher->pending("dev-a"), 0u);
    EXPECT_EQ(dispatcher->sentCount(), 3u);
  }

  TEST_F(CommandDispatcherTest, StopDuringTriggerIsQueuedBehindIt) {
    dispatcher->trigger("dev-a", "64AF");
    dispatcher->silence("dev-a", "64AF");
    EXPECT_EQ(transport->sent().size(), 1u);

    // search goes out at 4 s, the mute a full delay later
    scheduler->advance(4s);
    ASSERT_EQ(transport->sent().size(), 3u);
    EXPECT_EQ(transport->sent()[2].payload[0], 0xAC);
    scheduler->advance(1999ms);
    EXPECT_EQ(transport->sent().size(), 3u);
    scheduler->advance(1ms);
    ASSERT_EQ(transport->sent().size(), 4u);
    EXPECT_EQ(scheduler->now(), 6s);
    EXPECT_EQ(transport->sent()[3].payload, (Bytes{ 0xB0, 0x00, 0x01, 0x00 }));
  }

  TEST_F(CommandDispatcherTest, BackToBackTriggersKeepTheDelay) {
    dispatcher->trigger("dev-a", "64AF");
    dispatcher->trigger("dev-a", "64AF");

    scheduler->advance(4s);
    ASSERT_EQ(transport->sent().size(), 3u);
    scheduler->advance(1999ms);
    EXPECT_EQ(transport->sent().size(), 3u);
    scheduler->advance(1ms);
    ASSERT_EQ(transport->sent().size(), 4u);
    EXPECT_EQ(transport->sent()[3].payload, (Bytes{ 0xB0, 0x00, 0x01, 0x04 }));

    scheduler->advance(10s);
    EXPECT_EQ(transport->sent().size(), 6u);
  }

  TEST_F(CommandDispatcherTest, UnmuteWaitsBehindSilence) {
    dispatcher->silence("dev-a", "64AF");
    dispatcher->unmute("dev-a");
    EXPECT_EQ(dispatcher->pending("dev-a"), 1u);

    scheduler->advance(2s);
    ASSERT_EQ(transport->sent().size(), 2u);
    EXPECT_EQ(transport->sent()[1].payload, (Bytes{ 0xB0, 0x00, 0x01, 0x01 }));
  }

  TEST_F(CommandDispatcherTest, DevicesAreIndependent) {
    dispatcher->trigger("dev-a", "64AF");
    dispatcher->silence("dev-b", "64B0");

    ASSERT_EQ(transport->sent().size(), 2u);
    EXPECT_EQ(transport->sent()[1].device, "dev-b");
  }

  TEST_F(CommandDispatcherTest, SequenceByteIsDrawnAtSendTime) {
    dispatcher->trigger("dev-a", "64AF");
    dispatcher->trigger("dev-b", "64B0");
    scheduler->advance(10s);

    std::vector<std::uint8_t> seqs;
    for (const auto& p : transport->payloads())
      if (p[0] == 0xAC)
        seqs.push_back(p[1]);
    ASSERT_EQ(seqs.size(), 2u);
    EXPECT_EQ(seqs[0], 0);
    EXPECT_EQ(seqs[1], 1);
  }

  TEST_F(CommandDispatcherTest, FailedStepIsReportedAndSequenceContinues) {
    transport->fail_next = 1;
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("downlink to dev-a failed"))).Times(1);
    EXPECT_CALL(*errorMonitor, clearSeen()).Times(1);

    dispatcher->trigger("dev-a", "64AF");
    scheduler->advance(10s);

    EXPECT_EQ(dispatcher->failedCount(), 1u);
    EXPECT_EQ(dispatcher->sentCount(), 2u);
    ASSERT_EQ(transport->sent().size(), 2u);
    EXPECT_EQ(transport->sent()[1].payload[0], 0xAC);
  }

  TEST_F(CommandDispatcherTest, BadBeaconIdIsReportedNotThrown) {
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("not a hex string"))).Times(1);

    dispatcher->trigger("dev-a", "ZZZZ");
    EXPECT_NO_THROW(scheduler->advance(10s));
    EXPECT_EQ(dispatcher->sentCount(), 2u);
  }

  TEST_F(CommandDispatcherTest, DelayFollowsParameterStore) {
    params->set(Parameter::CommandDelaySeconds, 0.5);
    dispatcher->trigger("dev-a", "64AF");
    scheduler->advance(500ms);
    EXPECT_EQ(transport->sent().size(), 2u);
  }

  TEST_F(CommandDispatcherTest, PendingStepsAreDroppedWithTheDispatcher) {
    dispatcher->trigger("dev-a", "64AF");
    dispatcher.reset();
    EXPECT_NO_THROW(scheduler->advance(10s));
    EXPECT_EQ(transport->sent().size(), 1u);
  }

} // namespace zonewatch::test
