/**
 * @file sandbox_pool.hpp
 * @brief Pre-warmed sandbox instances with FIFO leasing
 *
 * The pool keeps idle environments per isolation level so requests do not
 * pay creation latency. Callers acquire an exclusive Lease bounded by the
 * request deadline; waiters are served strictly first-come first-served.
 * The instance table mutex is only held to enqueue and dequeue: backend
 * creation, execution and reset always run outside it. Creation for a
 * request runs on its own thread so the requester can give up at its
 * deadline; an instance finished after that is parked for the next caller.
 *
 * **Instance States**:
 * ```
 *            Acquire            Execute             Release
 *   IDLE ------------> LEASED ----------> EXECUTING ---------> CLEANING --> IDLE
 *                        |                    |                   |
 *                        | grace expired      | Destroy()         | reset failed
 *                        v                    v                   v
 *                                       DESTROYED
 * ```
 *
 * A maintenance thread reaps leaked leases, replenishes idle instances to
 * the target size, grows the target when P99 acquire latency is too high and
 * shrinks it after sustained idleness.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/event_bus.hpp"
#include "warden/core/policy.hpp"
#include "warden/sandbox/sandbox_backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace warden {
namespace sandbox {

/**
 * @enum InstanceState
 * @brief Lifecycle state of a pooled environment
 */
enum class InstanceState {
    IDLE,
    LEASED,
    EXECUTING,
    CLEANING,
    DESTROYED
};

std::string ToString(InstanceState state);

/**
 * @struct PoolStats
 * @brief Snapshot of one level's pool
 */
struct PoolStats {
    core::IsolationLevel level{core::IsolationLevel::CONTAINER};
    std::size_t idle{0};
    std::size_t leased{0};
    std::size_t executing{0};
    std::size_t cleaning{0};
    std::size_t creating{0};
    std::size_t waiters{0};
    std::size_t target_size{0};
    std::uint64_t total_created{0};
    std::uint64_t total_destroyed{0};
    std::uint64_t total_acquired{0};
    std::uint64_t leaked_leases{0};
    std::uint64_t exhausted{0};
    int consecutive_creation_failures{0};
    double p99_acquire_ms{0.0};
};

class SandboxPool;

namespace detail {

/// Pool-owned record for one environment
struct PooledInstance {
    std::uint64_t id{0};
    core::IsolationLevel level{core::IsolationLevel::CONTAINER};
    std::unique_ptr<SandboxEnvironment> environment;
    InstanceState state{InstanceState::IDLE};   ///< Guarded by the pool mutex
    std::string owner;
    std::chrono::steady_clock::time_point leased_at;
    std::chrono::steady_clock::time_point idle_since;
};

} // namespace detail

/**
 * @class Lease
 * @brief Exclusive, move-only right to one pooled environment
 *
 * A lease that goes out of scope still holding its instance releases it
 * back to the pool. The pool must outlive every lease it hands out.
 */
class Lease {
public:
    Lease() = default;
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    bool Valid() const { return instance_ != nullptr; }
    explicit operator bool() const { return Valid(); }

    std::uint64_t InstanceId() const;
    const std::string& EnvironmentId() const;
    core::IsolationLevel Level() const;
    const std::string& Owner() const;

    /**
     * @brief Move to EXECUTING and run the request
     *
     * Returns a SANDBOX_CREATION_FAILED result if the lease was revoked by
     * the leak reaper.
     *
     * @throws std::logic_error on an empty lease
     */
    core::ExecutionResult Execute(const ExecutionRequest& request);

private:
    friend class SandboxPool;

    Lease(SandboxPool* pool, std::shared_ptr<detail::PooledInstance> instance);

    std::shared_ptr<detail::PooledInstance> Take();

    SandboxPool* pool_{nullptr};
    std::shared_ptr<detail::PooledInstance> instance_;
};

/**
 * @class SandboxPool
 * @brief Per-level pools of warm environments
 *
 * **Usage Example**:
 * @code
 * SandboxPool pool(registry, policy.pool, event_bus);
 * pool.Prewarm();
 *
 * auto lease = pool.Acquire(IsolationLevel::CONTAINER, deadline, "factor_mining");
 * auto result = lease.Execute(request);
 * if (result.classification == ExitClassification::TIMEOUT_EXCEEDED) {
 *     pool.Destroy(lease);
 * } else {
 *     pool.Release(lease);
 * }
 * @endcode
 *
 * **Thread Safety**: All public methods are thread-safe.
 */
class SandboxPool {
public:
    SandboxPool(std::shared_ptr<BackendRegistry> registry,
                core::PoolPolicy policy,
                std::shared_ptr<core::EventBus> event_bus = nullptr,
                bool start_maintenance = true);
    ~SandboxPool();

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    /**
     * @brief Lease an environment at a level
     *
     * Takes an idle instance, creates one if capacity allows, or waits in
     * FIFO order until the deadline. Creation gets the time left before the
     * deadline as its budget.
     *
     * @throws core::PoolExhaustedError if nothing became available before the deadline
     * @throws core::DeadlineExceededError if the deadline passed while creating
     * @throws core::SandboxCreationError if creating the needed instance failed
     */
    Lease Acquire(core::IsolationLevel level,
                  std::chrono::steady_clock::time_point deadline,
                  const std::string& owner);

    /// Reset and return to IDLE, or destroy if the reset fails
    void Release(Lease& lease);

    /// Tear down without reset (timeouts and resource breaches)
    void Destroy(Lease& lease, const std::string& reason = "destroyed by caller");

    /// Synchronously create idle instances up to each level's target
    void Prewarm();

    void SetTargetSize(core::IsolationLevel level, std::size_t size);

    PoolStats Stats(core::IsolationLevel level) const;

    int ConsecutiveCreationFailures(core::IsolationLevel level) const;

    /// Replace sizing and cadence (targets are re-read on the next cycle)
    void UpdatePolicy(const core::PoolPolicy& policy);

    /// Run one maintenance cycle now (used by tests and by the thread)
    void RunMaintenance();

    /// Stop maintenance, wait for in-flight creations and destroy every idle instance
    void Shutdown();

private:
    friend class Lease;

    using InstancePtr = std::shared_ptr<detail::PooledInstance>;

    struct Waiter {
        std::string owner;
        InstancePtr granted;       ///< Handed over already LEASED
        bool create_slot{false};   ///< Permission to create a new instance
        std::condition_variable cv;
    };

    /// Creation started on behalf of one Acquire call
    struct PendingCreation {
        std::string owner;
        InstancePtr granted;       ///< Already LEASED to owner
        std::string error;         ///< Creation failure message
        bool done{false};
        bool abandoned{false};     ///< Requester left at its deadline
        std::condition_variable cv;
    };

    struct Creator {
        std::thread thread;
        std::shared_ptr<PendingCreation> pending;
    };

    struct LevelState {
        std::deque<InstancePtr> idle;
        std::map<std::uint64_t, InstancePtr> active;   ///< LEASED, EXECUTING or CLEANING
        std::deque<Waiter*> waiters;
        std::size_t target{0};
        std::size_t creating{0};
        bool trim_requested{false};
        int consecutive_failures{0};
        std::chrono::steady_clock::time_point next_replenish;
        std::chrono::steady_clock::time_point last_busy;
        std::deque<double> acquire_latencies_ms;
        std::uint64_t created{0};
        std::uint64_t destroyed{0};
        std::uint64_t acquired{0};
        std::uint64_t leaked{0};
        std::uint64_t exhausted{0};
    };

    // Helpers suffixed Locked expect mutex_ to be held

    LevelState& StateFor(core::IsolationLevel level);
    std::size_t TotalLocked(const LevelState& state) const;
    bool CanCreateLocked(const LevelState& state) const;

    /**
     * @brief Create an instance outside the lock
     *
     * A creating slot must already be reserved. On failure the slot is
     * released, the failure counted and the exception rethrown.
     */
    InstancePtr CreateInstance(core::IsolationLevel level, std::chrono::milliseconds budget);

    /// Creator thread body: create, then grant to the requester or park
    void CreateForRequest(core::IsolationLevel level,
                          std::chrono::steady_clock::time_point deadline,
                          std::shared_ptr<PendingCreation> pending);

    /// Join creator threads that have delivered their result
    void ReapCreatorsLocked();

    /// Account a freshly created instance against its reserved slot
    void AdoptLocked(LevelState& state, detail::PooledInstance& instance);

    /// Give an instance to the first waiter, or park it as idle
    void HandOffLocked(LevelState& state, const InstancePtr& instance);

    /// Pass freed capacity to the first waiter as a create slot
    void OfferCreateSlotLocked(LevelState& state);

    void GrantLocked(LevelState& state, const InstancePtr& instance, const std::string& owner);
    void RecordLatencyLocked(LevelState& state, std::chrono::steady_clock::time_point start);

    /// Mark DESTROYED and drop from the table; false if already destroyed
    bool RetireLocked(LevelState& state, const InstancePtr& instance);

    /// Destroy the environment and publish; call after RetireLocked, without the lock
    void TearDown(const InstancePtr& instance, const std::string& reason);

    bool MarkExecuting(detail::PooledInstance& instance);

    void ReapLeakedLeases();
    void Replenish();
    void AdjustTargets();
    void MaintenanceLoop();

    void PublishLifecycle(core::GatewayEventType type, core::IsolationLevel level, const std::string& detail);

    std::shared_ptr<BackendRegistry> registry_;
    std::shared_ptr<core::EventBus> event_bus_;

    mutable std::mutex mutex_;
    core::PoolPolicy policy_;
    std::map<core::IsolationLevel, LevelState> levels_;
    std::uint64_t next_instance_id_{1};

    std::vector<Creator> creators_;

    std::thread maintenance_thread_;
    std::condition_variable maintenance_cv_;
    bool stopping_{false};
};

} // namespace sandbox
} // namespace warden
