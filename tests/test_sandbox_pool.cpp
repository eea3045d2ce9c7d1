/**
 * @file test_sandbox_pool.cpp
 * @brief Tests for pooled sandbox leasing
 * @date 2025
 */

#include "fake_backend.hpp"

#include "warden/core/errors.hpp"
#include "warden/core/event_bus.hpp"
#include "warden/sandbox/sandbox_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace warden;
using namespace warden::sandbox;
using warden::fakes::FakeBackend;
using warden::fakes::FakeControl;

namespace {

constexpr auto kLevel = core::IsolationLevel::CONTAINER;

std::chrono::steady_clock::time_point In(std::chrono::milliseconds ms) {
    return std::chrono::steady_clock::now() + ms;
}

template <typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = In(timeout);
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // anonymous namespace

class SandboxPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        control_ = std::make_shared<FakeControl>();
        registry_ = std::make_shared<BackendRegistry>();
        registry_->Register(std::make_shared<FakeBackend>(kLevel, control_));
        bus_ = std::make_shared<core::EventBus>();

        policy_.max_size = 2;
        policy_.lease_grace_period = std::chrono::milliseconds(2000);
    }

    std::unique_ptr<SandboxPool> MakePool() {
        return std::make_unique<SandboxPool>(registry_, policy_, bus_, false);
    }

    ExecutionRequest Request() {
        return ExecutionRequest{"x", core::ContentType::CODE, context_, EnforcementPlan{},
                                nullptr, In(std::chrono::milliseconds(1000)), nullptr};
    }

    std::shared_ptr<FakeControl> control_;
    std::shared_ptr<BackendRegistry> registry_;
    std::shared_ptr<core::EventBus> bus_;
    core::PoolPolicy policy_;
    core::SecurityContext context_ = core::SecurityContextBuilder().WithComponent("pool_test").Build();
};

// ============================================================================
// LEASING
// ============================================================================

TEST_F(SandboxPoolTest, CreatesOnDemandAndReusesAfterRelease) {
    auto pool = MakePool();

    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "a");
    ASSERT_TRUE(lease.Valid());
    EXPECT_EQ(lease.Owner(), "a");
    EXPECT_EQ(lease.Level(), kLevel);
    auto first_id = lease.InstanceId();

    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.leased, 1u);
    EXPECT_EQ(stats.idle, 0u);
    EXPECT_EQ(stats.total_created, 1u);

    pool->Release(lease);
    EXPECT_FALSE(lease.Valid());
    EXPECT_EQ(pool->Stats(kLevel).idle, 1u);

    auto again = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "b");
    EXPECT_EQ(again.InstanceId(), first_id);
    EXPECT_EQ(control_->created.load(), 1);
}

TEST_F(SandboxPoolTest, ExecuteMovesLeaseToExecuting) {
    auto pool = MakePool();
    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "a");

    auto result = lease.Execute(Request());
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "ok");

    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.executing, 1u);
    EXPECT_EQ(stats.leased, 0u);
}

TEST_F(SandboxPoolTest, EmptyLeaseRejectsUse) {
    Lease lease;
    EXPECT_FALSE(lease);
    EXPECT_THROW(lease.Execute(Request()), std::logic_error);
    EXPECT_THROW(lease.InstanceId(), std::logic_error);
}

TEST_F(SandboxPoolTest, LeaseReleasesOnScopeExit) {
    auto pool = MakePool();
    {
        auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "scoped");
        EXPECT_EQ(pool->Stats(kLevel).leased, 1u);
    }
    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.leased, 0u);
    EXPECT_EQ(stats.idle, 1u);
}

TEST_F(SandboxPoolTest, MovedLeaseKeepsInstance) {
    auto pool = MakePool();
    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "a");
    auto id = lease.InstanceId();

    Lease moved = std::move(lease);
    EXPECT_FALSE(lease.Valid());
    ASSERT_TRUE(moved.Valid());
    EXPECT_EQ(moved.InstanceId(), id);
    EXPECT_EQ(pool->Stats(kLevel).leased, 1u);
}

TEST_F(SandboxPoolTest, UnregisteredLevelCannotBeLeased) {
    auto pool = MakePool();
    EXPECT_THROW(pool->Acquire(core::IsolationLevel::MICRO_VM, In(std::chrono::milliseconds(100)), "a"),
                 core::SandboxCreationError);
}

// ============================================================================
// CAPACITY AND FAIRNESS
// ============================================================================

TEST_F(SandboxPoolTest, ExhaustsAtDeadline) {
    policy_.max_size = 1;
    auto pool = MakePool();

    auto held = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "holder");
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(pool->Acquire(kLevel, In(std::chrono::milliseconds(50)), "late"),
                 core::PoolExhaustedError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(45));

    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.exhausted, 1u);
    EXPECT_EQ(stats.waiters, 0u);
    EXPECT_EQ(stats.leased, 1u);
}

TEST_F(SandboxPoolTest, SlowCreationStopsAtDeadline) {
    control_->create_delay = std::chrono::milliseconds(1500);
    auto pool = MakePool();

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(pool->Acquire(kLevel, In(std::chrono::milliseconds(300)), "slow"),
                 core::DeadlineExceededError);
    auto waited = std::chrono::steady_clock::now() - start;
    EXPECT_GE(waited, std::chrono::milliseconds(290));
    EXPECT_LE(waited, std::chrono::milliseconds(500));

    // The instance finished later is parked for the next caller
    ASSERT_TRUE(WaitFor([&]() { return pool->Stats(kLevel).idle == 1; }, std::chrono::milliseconds(3000)));
    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.creating, 0u);
    EXPECT_EQ(stats.total_created, 1u);

    control_->create_delay = std::chrono::milliseconds(0);
    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(100)), "next");
    EXPECT_TRUE(lease.Valid());
    EXPECT_EQ(control_->created.load(), 1);
}

TEST_F(SandboxPoolTest, CreationGetsRemainingBudget) {
    auto pool = MakePool();
    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(400)), "a");

    ASSERT_TRUE(lease.Valid());
    EXPECT_GT(control_->last_budget_ms.load(), 0);
    EXPECT_LE(control_->last_budget_ms.load(), 400);
}

TEST_F(SandboxPoolTest, ShutdownWaitsForInFlightCreation) {
    control_->create_delay = std::chrono::milliseconds(200);
    auto pool = MakePool();

    EXPECT_THROW(pool->Acquire(kLevel, In(std::chrono::milliseconds(20)), "gone"),
                 core::DeadlineExceededError);
    pool->Shutdown();

    EXPECT_EQ(control_->created.load(), 1);
    EXPECT_EQ(control_->destroyed.load(), 1);
    EXPECT_EQ(pool->Stats(kLevel).idle, 0u);
}

TEST_F(SandboxPoolTest, WaitersAreServedInArrivalOrder) {
    policy_.max_size = 1;
    auto pool = MakePool();
    auto held = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "holder");

    std::mutex order_mutex;
    std::vector<std::string> order;

    auto waiter = [&](const std::string& name) {
        auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(3000)), name);
        {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(lease.Owner());
        }
        pool->Release(lease);
    };

    std::thread first(waiter, "first");
    ASSERT_TRUE(WaitFor([&] { return pool->Stats(kLevel).waiters == 1; }));
    std::thread second(waiter, "second");
    ASSERT_TRUE(WaitFor([&] { return pool->Stats(kLevel).waiters == 2; }));

    pool->Release(held);
    first.join();
    second.join();

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "first");
    EXPECT_EQ(order[1], "second");
    EXPECT_EQ(control_->created.load(), 1);
}

TEST_F(SandboxPoolTest, ConcurrentRequestsNeverExceedMaxSize) {
    policy_.max_size = 10;
    control_->execute_delay = std::chrono::milliseconds(20);
    auto pool = MakePool();

    std::atomic<int> succeeded{0};
    std::atomic<int> exhausted{0};
    std::vector<std::thread> workers;

    for (int i = 0; i < 50; ++i) {
        workers.emplace_back([&, i]() {
            try {
                auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(2000)),
                                           "worker" + std::to_string(i));
                auto result = lease.Execute(Request());
                if (result.success) {
                    succeeded++;
                }
                pool->Release(lease);
            } catch (const core::PoolExhaustedError&) {
                exhausted++;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(succeeded.load(), 50);
    EXPECT_EQ(exhausted.load(), 0);
    EXPECT_LE(control_->max_concurrent.load(), 10);
    EXPECT_LE(control_->created.load(), 10);

    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.total_acquired, 50u);
    EXPECT_EQ(stats.leased + stats.executing + stats.cleaning, 0u);
    EXPECT_EQ(stats.idle, static_cast<std::size_t>(control_->created.load()));
}

// ============================================================================
// RELEASE AND DESTROY
// ============================================================================

TEST_F(SandboxPoolTest, FailedResetDestroysInstance) {
    auto pool = MakePool();
    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "a");

    control_->fail_reset = true;
    pool->Release(lease);

    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.idle, 0u);
    EXPECT_EQ(stats.total_destroyed, 1u);
    EXPECT_EQ(control_->destroyed.load(), 1);
    EXPECT_EQ(bus_->PublishedCount(core::GatewayEventType::SANDBOX_DESTROYED), 1u);
}

TEST_F(SandboxPoolTest, DestroySkipsReset) {
    auto pool = MakePool();
    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "a");
    lease.Execute(Request());

    pool->Destroy(lease, "timeout");
    EXPECT_FALSE(lease.Valid());

    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.idle, 0u);
    EXPECT_EQ(stats.executing, 0u);
    EXPECT_EQ(control_->destroyed.load(), 1);

    auto fresh = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "b");
    EXPECT_EQ(control_->created.load(), 2);
}

TEST_F(SandboxPoolTest, DestroyedCapacityGoesToWaiter) {
    policy_.max_size = 1;
    auto pool = MakePool();
    auto held = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "holder");

    std::string owner;
    std::thread waiter([&]() {
        auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(3000)), "waiter");
        owner = lease.Owner();
    });
    ASSERT_TRUE(WaitFor([&] { return pool->Stats(kLevel).waiters == 1; }));

    pool->Destroy(held);
    waiter.join();

    EXPECT_EQ(owner, "waiter");
    EXPECT_EQ(control_->created.load(), 2);
}

// ============================================================================
// MAINTENANCE
// ============================================================================

TEST_F(SandboxPoolTest, ReapsLeaseThatNeverExecutes) {
    policy_.lease_grace_period = std::chrono::milliseconds(10);
    auto pool = MakePool();

    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "forgetful");
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    pool->RunMaintenance();

    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.leaked_leases, 1u);
    EXPECT_EQ(stats.leased, 0u);
    EXPECT_EQ(control_->destroyed.load(), 1);

    auto result = lease.Execute(Request());
    EXPECT_EQ(result.classification, core::ExitClassification::SANDBOX_CREATION_FAILED);
    EXPECT_EQ(control_->executed.load(), 0);
}

TEST_F(SandboxPoolTest, ExecutingLeaseIsNotReaped) {
    policy_.lease_grace_period = std::chrono::milliseconds(10);
    auto pool = MakePool();

    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "busy");
    lease.Execute(Request());
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    pool->RunMaintenance();

    EXPECT_EQ(pool->Stats(kLevel).leaked_leases, 0u);
    EXPECT_EQ(control_->destroyed.load(), 0);
}

TEST_F(SandboxPoolTest, PrewarmFillsTarget) {
    policy_.max_size = 4;
    policy_.target_sizes[kLevel] = 3;
    auto pool = MakePool();

    pool->Prewarm();
    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.idle, 3u);
    EXPECT_EQ(stats.target_size, 3u);
    EXPECT_EQ(bus_->PublishedCount(core::GatewayEventType::SANDBOX_CREATED), 3u);
}

TEST_F(SandboxPoolTest, TargetIsClampedToMaxSize) {
    policy_.target_sizes[kLevel] = 50;
    auto pool = MakePool();
    EXPECT_EQ(pool->Stats(kLevel).target_size, 2u);
}

TEST_F(SandboxPoolTest, LoweredTargetTrimsIdleInstances) {
    policy_.max_size = 4;
    policy_.target_sizes[kLevel] = 3;
    auto pool = MakePool();
    pool->Prewarm();

    pool->SetTargetSize(kLevel, 1);
    pool->RunMaintenance();

    auto stats = pool->Stats(kLevel);
    EXPECT_EQ(stats.idle, 1u);
    EXPECT_EQ(control_->destroyed.load(), 2);
}

TEST_F(SandboxPoolTest, CountsConsecutiveCreationFailures) {
    auto pool = MakePool();
    control_->fail_creation = true;

    EXPECT_THROW(pool->Acquire(kLevel, In(std::chrono::milliseconds(100)), "a"), core::SandboxCreationError);
    EXPECT_THROW(pool->Acquire(kLevel, In(std::chrono::milliseconds(100)), "a"), core::SandboxCreationError);
    EXPECT_EQ(pool->ConsecutiveCreationFailures(kLevel), 2);
    EXPECT_EQ(pool->Stats(kLevel).creating, 0u);

    control_->fail_creation = false;
    auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(100)), "a");
    EXPECT_TRUE(lease.Valid());
    EXPECT_EQ(pool->ConsecutiveCreationFailures(kLevel), 0);
}

TEST_F(SandboxPoolTest, ShutdownDestroysIdleAndRefusesNewLeases) {
    auto pool = MakePool();
    {
        auto lease = pool->Acquire(kLevel, In(std::chrono::milliseconds(500)), "a");
    }
    ASSERT_EQ(pool->Stats(kLevel).idle, 1u);

    pool->Shutdown();
    EXPECT_EQ(pool->Stats(kLevel).idle, 0u);
    EXPECT_EQ(control_->destroyed.load(), 1);
    EXPECT_THROW(pool->Acquire(kLevel, In(std::chrono::milliseconds(100)), "late"), core::PoolExhaustedError);
}

TEST_F(SandboxPoolTest, MaintenanceThreadReplenishes) {
    policy_.target_sizes[kLevel] = 2;
    policy_.maintenance_interval = std::chrono::milliseconds(10);
    SandboxPool pool(registry_, policy_, bus_, true);

    EXPECT_TRUE(WaitFor([&] { return pool.Stats(kLevel).idle == 2; }));
    pool.Shutdown();
}

TEST(InstanceStateTest, Names) {
    EXPECT_EQ(ToString(InstanceState::IDLE), "idle");
    EXPECT_EQ(ToString(InstanceState::EXECUTING), "executing");
    EXPECT_EQ(ToString(InstanceState::DESTROYED), "destroyed");
}
