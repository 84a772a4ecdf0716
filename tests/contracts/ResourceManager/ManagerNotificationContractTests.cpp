#include "ResourceManagerTestFixture.h"
#include "../ContractRegistryEnvironment.h"

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "vinefeed/util/Logger.hpp"

using namespace vinefeed;
using namespace vinefeed::tests;
using resource::ResourceState;
using resource::StateChangeBatch;

namespace
{

  const std::vector<std::string> kRules = {"VRN-001", "VRN-002", "VRN-003", "VRN-004", "VRN-005",
                                           "VRN-006"};

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage("ManagerNotifications", kRules);
    return true;
  }();

  class ManagerNotificationContractTest : public ResourceManagerContractFixture
  {
  protected:
    [[nodiscard]] std::string DomainName() const override
    {
      return "ManagerNotifications";
    }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return kRules;
    }
  };

  // Rule: VRN-001 One command yields one ordered batch
  TEST_F(ManagerNotificationContractTest, VRN_001_ViewportChangeCoalescedIntoOneBatch)
  {
    backend_->HoldAll();
    auto& manager = BuildWithFeed(10);
    manager.SetViewportIndex(0);

    ASSERT_EQ(recorder_.batches.size(), 1u);
    const auto& changes = recorder_.batches[0].changes;
    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].id, "v0");
    EXPECT_EQ(changes[1].id, "v1");
    EXPECT_EQ(changes[2].id, "v2");
    for (const auto& change : changes)
    {
      EXPECT_EQ(change.from, ResourceState::kRegistered);
      EXPECT_EQ(change.to, ResourceState::kPreparing);
    }
  }

  TEST_F(ManagerNotificationContractTest, VRN_001_EvictionsPrecedeNewWarmupsInBatch)
  {
    auto& manager = BuildWithFeed(10);
    manager.SetViewportIndex(0);
    ASSERT_TRUE(PumpUntil(manager, [&] { return AllReady({0, 1, 2}); }));
    recorder_.Clear();

    manager.SetViewportIndex(7);
    ASSERT_EQ(recorder_.batches.size(), 1u);
    const auto& changes = recorder_.batches[0].changes;
    ASSERT_EQ(changes.size(), 6u);
    for (int i = 0; i < 3; ++i)
    {
      EXPECT_EQ(changes[i].to, ResourceState::kUnregistered);
    }
    EXPECT_EQ(changes[3].id, "v7");
    EXPECT_EQ(changes[4].id, "v8");
    EXPECT_EQ(changes[5].id, "v6");
  }

  TEST_F(ManagerNotificationContractTest, VRN_001_RegisterAllIsOneBatch)
  {
    auto& manager = Build(DefaultConfig());
    EXPECT_EQ(manager.RegisterAll(MakeFeed(8)), 8u);
    ASSERT_EQ(recorder_.batches.size(), 1u);
    EXPECT_EQ(recorder_.batches[0].changes.size(), 8u);
  }

  // Rule: VRN-002 Commands that change nothing notify nothing
  TEST_F(ManagerNotificationContractTest, VRN_002_NoOpCommandsAreSilent)
  {
    auto& manager = BuildWithFeed(5);
    manager.Register(MakeFeed(1)[0]);
    manager.RequestPreload("unknown");
    manager.PauseAll();
    manager.Pump();
    EXPECT_TRUE(recorder_.batches.empty());
  }

  // Rule: VRN-003 Batch sequence numbers increase; listeners may re-enter
  TEST_F(ManagerNotificationContractTest, VRN_003_ListenerMayIssueCommands)
  {
    auto& manager = BuildWithFeed(5);
    std::vector<uint64_t> sequences;
    bool played = false;
    manager.Subscribe([&](const StateChangeBatch& batch)
                      {
                        sequences.push_back(batch.sequence);
                        for (const auto& change : batch.changes)
                        {
                          if (!played && change.id == "v0" && change.to == ResourceState::kReady)
                          {
                            played = true;
                            EXPECT_TRUE(manager.Play("v0"));
                          }
                        } });

    manager.SetViewportIndex(0);
    ASSERT_TRUE(PumpUntil(manager, [&]
                          { return manager.GetState("v0") == ResourceState::kPlaying; }));

    for (std::size_t i = 1; i < sequences.size(); ++i)
    {
      EXPECT_LT(sequences[i - 1], sequences[i]);
    }

    // The play issued from the listener arrives in its own later batch.
    const auto& last = recorder_.batches.back();
    bool found = false;
    for (const auto& change : last.changes)
    {
      if (change.id == "v0" && change.to == ResourceState::kPlaying)
      {
        found = true;
      }
    }
    EXPECT_TRUE(found);
  }

  // Rule: VRN-004 Unsubscribed listeners receive nothing further
  TEST_F(ManagerNotificationContractTest, VRN_004_UnsubscribeStopsDelivery)
  {
    auto& manager = BuildWithFeed(5);
    int calls = 0;
    const auto token = manager.Subscribe([&](const StateChangeBatch&) { ++calls; });

    manager.Release("v0");  // Nothing held: silent
    manager.RequestPreload("v0");
    EXPECT_EQ(calls, 1);

    EXPECT_TRUE(manager.Unsubscribe(token));
    EXPECT_FALSE(manager.Unsubscribe(token));
    manager.RequestPreload("v1");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(recorder_.batches.size(), 2u);
  }

  // Rule: VRN-005 Evictions and rejected registrations leave log lines
  TEST_F(ManagerNotificationContractTest, VRN_005_EvictionAndRejectionAreLogged)
  {
    std::mutex mutex;
    std::vector<std::string> info_lines;
    std::vector<std::string> warn_lines;
    util::Logger::SetInfoSink([&](const std::string& line)
                              {
                                std::lock_guard<std::mutex> lock(mutex);
                                info_lines.push_back(line); });
    util::Logger::SetWarnSink([&](const std::string& line)
                              {
                                std::lock_guard<std::mutex> lock(mutex);
                                warn_lines.push_back(line); });

    auto& manager = BuildWithFeed(10);
    EXPECT_FALSE(manager.Register(resource::VideoDescriptor()));
    manager.SetViewportIndex(0);
    ASSERT_TRUE(PumpUntil(manager, [&] { return AllReady({0, 1, 2}); }));
    manager.SetViewportIndex(7);
    manager.Shutdown();

    util::Logger::SetInfoSink(nullptr);
    util::Logger::SetWarnSink(nullptr);

    auto contains = [](const std::vector<std::string>& lines, const std::string& needle)
    {
      for (const auto& line : lines)
      {
        if (line.find(needle) != std::string::npos)
        {
          return true;
        }
      }
      return false;
    };
    EXPECT_TRUE(contains(warn_lines, "REGISTER_REJECTED reason=empty_id"));
    EXPECT_TRUE(contains(info_lines, "EVICT video_id=v0"));
    EXPECT_TRUE(contains(info_lines, "reason=out_of_window"));
  }

  // Rule: VRN-006 A throwing listener does not disturb the manager or other listeners
  TEST_F(ManagerNotificationContractTest, VRN_006_ListenerExceptionIsContained)
  {
    std::mutex mutex;
    std::vector<std::string> warn_lines;
    util::Logger::SetWarnSink([&](const std::string& line)
                              {
                                std::lock_guard<std::mutex> lock(mutex);
                                warn_lines.push_back(line); });

    auto& manager = Build(DefaultConfig());
    int throws = 0;
    manager.Subscribe([&](const StateChangeBatch&)
                      {
                        ++throws;
                        throw std::runtime_error("listener failed"); });
    int after = 0;
    manager.Subscribe([&](const StateChangeBatch&) { ++after; });

    EXPECT_EQ(manager.RegisterAll(MakeFeed(5)), 5u);
    EXPECT_TRUE(manager.SetViewportIndex(0));
    ASSERT_TRUE(PumpUntil(manager, [&] { return AllReady({0, 1, 2}); }));
    EXPECT_TRUE(manager.Play("v0"));
    EXPECT_EQ(manager.GetState("v0"), ResourceState::kPlaying);

    util::Logger::SetWarnSink(nullptr);

    EXPECT_EQ(throws, static_cast<int>(recorder_.batches.size()));
    EXPECT_EQ(after, throws);
    EXPECT_GE(recorder_.batches.size(), 3u);

    // Later batches are still flushed: the flushing flag was reset.
    for (std::size_t i = 1; i < recorder_.batches.size(); ++i)
    {
      EXPECT_LT(recorder_.batches[i - 1].sequence, recorder_.batches[i].sequence);
    }
    bool logged = false;
    for (const auto& line : warn_lines)
    {
      if (line.find("LISTENER_THREW") != std::string::npos &&
          line.find("listener failed") != std::string::npos)
      {
        logged = true;
      }
    }
    EXPECT_TRUE(logged);
  }

} // namespace
