#ifndef VINEFEED_TESTS_CONTRACTS_RESOURCE_MANAGER_TEST_FIXTURE_H_
#define VINEFEED_TESTS_CONTRACTS_RESOURCE_MANAGER_TEST_FIXTURE_H_

#include <initializer_list>
#include <memory>
#include <set>
#include <string>

#include "../../BaseContractTest.h"
#include "../../fixtures/FakeDecoderBackend.h"
#include "../../fixtures/ManagerTestSupport.h"
#include "../../support/DeterministicTimeSource.hpp"

#include "vinefeed/manager/VideoResourceManager.hpp"

namespace vinefeed::tests
{

// Shared fixture for manager suites: fake backend, manual clock and an
// invariant-violation counter that must stay at zero.
class ResourceManagerContractFixture : public BaseContractTest
{
protected:
  void SetUp() override
  {
    BaseContractTest::SetUp();
    errors_ = std::make_unique<ErrorLineCounter>();
    backend_ = std::make_shared<FakeDecoderBackend>();
    clock_ = std::make_shared<DeterministicTimeSource>(1'000'000);
  }

  void TearDown() override
  {
    if (manager_)
    {
      manager_->Shutdown();
    }
    EXPECT_EQ(errors_->count(), 0) << "invariant violations were logged";
    manager_.reset();
    errors_.reset();
  }

  // Default config: capacity 3, ahead 2, behind 1, 1 s base backoff.
  static manager::ResourceManagerConfig DefaultConfig()
  {
    return manager::ResourceManagerConfig();
  }

  manager::VideoResourceManager& Build(const manager::ResourceManagerConfig& config,
                                       std::shared_ptr<feed::IFeedSource> feed = nullptr)
  {
    manager_ = std::make_unique<manager::VideoResourceManager>(config, backend_,
                                                               std::move(feed), clock_);
    manager_->Subscribe(recorder_.AsListener());
    return *manager_;
  }

  // Builds with the default config and registers v0..v{count-1}.
  manager::VideoResourceManager& BuildWithFeed(int count,
                                               manager::ResourceManagerConfig config = DefaultConfig())
  {
    auto& manager = Build(config);
    manager.RegisterAll(MakeFeed(count));
    recorder_.Clear();
    return manager;
  }

  std::set<std::string> HeldIds() const
  {
    std::set<std::string> held;
    for (int i = 0; i < static_cast<int>(manager_->feed_size()); ++i)
    {
      auto snapshot = manager_->GetSnapshot(IdAt(i));
      if (snapshot && snapshot->has_slot)
      {
        held.insert(IdAt(i));
      }
    }
    return held;
  }

  bool AllReady(std::initializer_list<int> indices) const
  {
    for (int i : indices)
    {
      if (manager_->GetState(IdAt(i)) != resource::ResourceState::kReady)
      {
        return false;
      }
    }
    return true;
  }

  std::shared_ptr<FakeDecoderBackend> backend_;
  std::shared_ptr<DeterministicTimeSource> clock_;
  std::unique_ptr<manager::VideoResourceManager> manager_;
  NotificationRecorder recorder_;
  std::unique_ptr<ErrorLineCounter> errors_;
};

} // namespace vinefeed::tests

#endif // VINEFEED_TESTS_CONTRACTS_RESOURCE_MANAGER_TEST_FIXTURE_H_
