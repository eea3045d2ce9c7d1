/**
 * @file sandbox_pool.cpp
 * @brief Implementation of the sandbox pool
 *
 * **Hand-off Rules**:
 * - An instance coming back to IDLE goes to the oldest waiter first
 * - Capacity freed by a destroy becomes a create slot for the oldest waiter
 * - New requests only bypass the queue when nobody is waiting
 *
 * @date 2025
 */

#include "warden/sandbox/sandbox_pool.hpp"
#include "warden/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace warden {
namespace sandbox {

namespace {

constexpr std::size_t kLatencyWindow = 256;
constexpr std::size_t kMinLatencySamples = 20;
constexpr auto kMaxReplenishBackoff = std::chrono::seconds(30);

double Percentile(std::deque<double> samples, double fraction) {
    if (samples.empty()) {
        return 0.0;
    }
    std::sort(samples.begin(), samples.end());
    auto rank = static_cast<std::size_t>(std::ceil(fraction * static_cast<double>(samples.size())));
    return samples[std::min(samples.size() - 1, rank == 0 ? 0 : rank - 1)];
}

} // anonymous namespace

std::string ToString(InstanceState state) {
    switch (state) {
        case InstanceState::IDLE: return "idle";
        case InstanceState::LEASED: return "leased";
        case InstanceState::EXECUTING: return "executing";
        case InstanceState::CLEANING: return "cleaning";
        case InstanceState::DESTROYED: return "destroyed";
        default: return "unknown";
    }
}

// ============================================================================
// LEASE
// ============================================================================

Lease::Lease(SandboxPool* pool, std::shared_ptr<detail::PooledInstance> instance)
    : pool_(pool)
    , instance_(std::move(instance)) {
}

Lease::~Lease() {
    if (instance_ && pool_) {
        pool_->Release(*this);
    }
}

Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_)
    , instance_(std::move(other.instance_)) {
    other.pool_ = nullptr;
}

Lease& Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        if (instance_ && pool_) {
            pool_->Release(*this);
        }
        pool_ = other.pool_;
        instance_ = std::move(other.instance_);
        other.pool_ = nullptr;
    }
    return *this;
}

std::uint64_t Lease::InstanceId() const {
    if (!instance_) throw std::logic_error("Empty lease");
    return instance_->id;
}

const std::string& Lease::EnvironmentId() const {
    if (!instance_) throw std::logic_error("Empty lease");
    return instance_->environment->Id();
}

core::IsolationLevel Lease::Level() const {
    if (!instance_) throw std::logic_error("Empty lease");
    return instance_->level;
}

const std::string& Lease::Owner() const {
    if (!instance_) throw std::logic_error("Empty lease");
    return instance_->owner;
}

core::ExecutionResult Lease::Execute(const ExecutionRequest& request) {
    if (!instance_ || !pool_) {
        throw std::logic_error("Execute called on an empty lease");
    }

    if (!pool_->MarkExecuting(*instance_)) {
        return MakeFailure(instance_->level, core::ExitClassification::SANDBOX_CREATION_FAILED,
                           "Lease on " + instance_->environment->Id() + " was revoked before execution");
    }
    return instance_->environment->Execute(request);
}

std::shared_ptr<detail::PooledInstance> Lease::Take() {
    auto instance = std::move(instance_);
    instance_.reset();
    return instance;
}

// ============================================================================
// CONSTRUCTION AND SHUTDOWN
// ============================================================================

SandboxPool::SandboxPool(std::shared_ptr<BackendRegistry> registry,
                         core::PoolPolicy policy,
                         std::shared_ptr<core::EventBus> event_bus,
                         bool start_maintenance)
    : registry_(std::move(registry))
    , event_bus_(std::move(event_bus))
    , policy_(std::move(policy)) {

    if (!registry_) {
        throw std::invalid_argument("SandboxPool requires a backend registry");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto level : registry_->Levels()) {
            StateFor(level);
        }
    }

    if (start_maintenance) {
        maintenance_thread_ = std::thread(&SandboxPool::MaintenanceLoop, this);
    }

    spdlog::debug("[POOL] Initialized (max {} per level, maintenance {})",
                  policy_.max_size, start_maintenance ? "on" : "off");
}

SandboxPool::~SandboxPool() {
    Shutdown();
}

void SandboxPool::Shutdown() {
    std::vector<InstancePtr> retired;
    std::vector<Creator> creators;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        creators.swap(creators_);

        for (const auto& creator : creators) {
            creator.pending->cv.notify_one();
        }
        for (auto& [level, state] : levels_) {
            for (auto* waiter : state.waiters) {
                waiter->cv.notify_one();
            }
            while (!state.idle.empty()) {
                auto instance = state.idle.front();
                if (RetireLocked(state, instance)) {
                    retired.push_back(instance);
                }
            }
        }
    }

    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
    for (auto& creator : creators) {
        if (creator.thread.joinable()) {
            creator.thread.join();
        }
    }

    for (const auto& instance : retired) {
        TearDown(instance, "pool shutdown");
    }
}

// ============================================================================
// ACQUIRE / RELEASE / DESTROY
// ============================================================================

Lease SandboxPool::Acquire(core::IsolationLevel level,
                           std::chrono::steady_clock::time_point deadline,
                           const std::string& owner) {
    const auto start = std::chrono::steady_clock::now();

    if (!registry_->Has(level)) {
        throw core::SandboxCreationError("No sandbox backend registered for " + core::ToString(level));
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (stopping_) {
        throw core::PoolExhaustedError("Sandbox pool is shutting down");
    }

    auto& state = StateFor(level);
    state.last_busy = start;

    bool create = false;
    if (state.waiters.empty()) {
        if (!state.idle.empty()) {
            auto instance = state.idle.front();
            state.idle.pop_front();
            GrantLocked(state, instance, owner);
            RecordLatencyLocked(state, start);
            return Lease(this, instance);
        }
        if (CanCreateLocked(state)) {
            state.creating++;
            create = true;
        }
    }

    if (!create) {
        Waiter waiter;
        waiter.owner = owner;
        state.waiters.push_back(&waiter);

        bool signalled = waiter.cv.wait_until(lock, deadline, [&]() {
            return waiter.granted || waiter.create_slot || stopping_;
        });

        if (waiter.granted) {
            RecordLatencyLocked(state, start);
            return Lease(this, waiter.granted);
        }

        if (!signalled || !waiter.create_slot || std::chrono::steady_clock::now() >= deadline) {
            auto it = std::find(state.waiters.begin(), state.waiters.end(), &waiter);
            if (it != state.waiters.end()) {
                state.waiters.erase(it);
            }
            if (waiter.create_slot) {
                state.creating--;
                OfferCreateSlotLocked(state);
            }
            state.exhausted++;
            RecordLatencyLocked(state, start);
            auto waiting = state.waiters.size();
            lock.unlock();

            spdlog::warn("[POOL] No {} sandbox for {} before the deadline ({} still waiting)",
                         core::ToString(level), owner, waiting);
            throw core::PoolExhaustedError("No " + core::ToString(level) +
                                           " sandbox became available before the deadline");
        }
    }

    if (stopping_ || std::chrono::steady_clock::now() >= deadline) {
        state.creating--;
        OfferCreateSlotLocked(state);
        if (stopping_) {
            throw core::PoolExhaustedError("Sandbox pool is shutting down");
        }
        throw core::DeadlineExceededError("Deadline expired before " + core::ToString(level) +
                                          " sandbox creation could start");
    }

    auto pending = std::make_shared<PendingCreation>();
    pending->owner = owner;
    ReapCreatorsLocked();
    try {
        creators_.push_back(Creator{std::thread(&SandboxPool::CreateForRequest, this, level, deadline, pending),
                                    pending});
    } catch (const std::system_error& e) {
        state.creating--;
        OfferCreateSlotLocked(state);
        throw core::SandboxCreationError(std::string("Cannot start creator thread: ") + e.what());
    }

    pending->cv.wait_until(lock, deadline, [&]() { return pending->done || stopping_; });

    if (pending->granted) {
        RecordLatencyLocked(state, start);
        return Lease(this, pending->granted);
    }
    if (pending->done && !stopping_) {
        throw core::SandboxCreationError(pending->error);
    }

    pending->abandoned = true;
    RecordLatencyLocked(state, start);
    bool stopping = stopping_;
    lock.unlock();

    if (stopping) {
        throw core::PoolExhaustedError("Sandbox pool is shutting down");
    }
    spdlog::warn("[POOL] {} sandbox for {} still being created at the deadline",
                 core::ToString(level), owner);
    throw core::DeadlineExceededError(core::ToString(level) +
                                      " sandbox creation did not finish before the deadline");
}

void SandboxPool::CreateForRequest(core::IsolationLevel level,
                                   std::chrono::steady_clock::time_point deadline,
                                   std::shared_ptr<PendingCreation> pending) {
    auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());

    InstancePtr instance;
    std::string error;
    try {
        instance = CreateInstance(level, budget);
    } catch (const core::SandboxCreationError& e) {
        error = e.what();
    }

    bool retired = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = StateFor(level);

        if (instance) {
            AdoptLocked(state, *instance);
            if (!pending->abandoned && !stopping_) {
                GrantLocked(state, instance, pending->owner);
                pending->granted = instance;
            } else if (stopping_) {
                retired = RetireLocked(state, instance);
            } else {
                spdlog::debug("[POOL] {} finished after its requester left, parking it",
                              instance->environment->Id());
                HandOffLocked(state, instance);
            }
        }

        pending->error = std::move(error);
        pending->done = true;
        pending->cv.notify_one();
    }

    if (retired) {
        TearDown(instance, "pool shutdown");
    }
}

void SandboxPool::ReapCreatorsLocked() {
    auto finished = std::partition(creators_.begin(), creators_.end(),
                                   [](const Creator& creator) { return !creator.pending->done; });
    for (auto it = finished; it != creators_.end(); ++it) {
        if (it->thread.joinable()) {
            it->thread.join();
        }
    }
    creators_.erase(finished, creators_.end());
}

void SandboxPool::Release(Lease& lease) {
    auto instance = lease.Take();
    if (!instance) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (instance->state == InstanceState::DESTROYED) {
            return;
        }
        instance->state = InstanceState::CLEANING;
    }

    bool reset = false;
    try {
        reset = instance->environment->Reset();
    } catch (const std::exception& e) {
        spdlog::warn("[POOL] Reset of {} threw: {}", instance->environment->Id(), e.what());
    }

    bool retired = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = StateFor(instance->level);

        if (!reset || stopping_) {
            retired = RetireLocked(state, instance);
        } else {
            state.active.erase(instance->id);
            HandOffLocked(state, instance);
        }
    }

    if (retired) {
        TearDown(instance, reset ? "pool shutdown" : "reset failed");
    }
}

void SandboxPool::Destroy(Lease& lease, const std::string& reason) {
    auto instance = lease.Take();
    if (!instance) {
        return;
    }

    bool retired = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired = RetireLocked(StateFor(instance->level), instance);
    }

    if (retired) {
        TearDown(instance, reason);
    }
}

bool SandboxPool::MarkExecuting(detail::PooledInstance& instance) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (instance.state != InstanceState::LEASED) {
        return false;
    }
    instance.state = InstanceState::EXECUTING;
    return true;
}

// ============================================================================
// SIZING
// ============================================================================

void SandboxPool::Prewarm() {
    Replenish();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [level, state] : levels_) {
        if (state.target > 0) {
            spdlog::info("[POOL] {}: {}/{} instances warm", core::ToString(level),
                         state.idle.size(), state.target);
        }
    }
}

void SandboxPool::SetTargetSize(core::IsolationLevel level, std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = StateFor(level);
    auto clamped = std::min(size, policy_.max_size);
    if (clamped < state.target) {
        state.trim_requested = true;
    }
    state.target = clamped;
    spdlog::debug("[POOL] {} target size set to {}", core::ToString(level), clamped);
}

void SandboxPool::UpdatePolicy(const core::PoolPolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    policy_ = policy;

    for (auto& [level, state] : levels_) {
        auto it = policy_.target_sizes.find(level);
        auto target = std::min(it != policy_.target_sizes.end() ? it->second : std::size_t{0}, policy_.max_size);
        if (target < state.target) {
            state.trim_requested = true;
        }
        state.target = target;
        OfferCreateSlotLocked(state);
    }
}

PoolStats SandboxPool::Stats(core::IsolationLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats stats;
    stats.level = level;

    auto it = levels_.find(level);
    if (it == levels_.end()) {
        return stats;
    }

    const auto& state = it->second;
    stats.idle = state.idle.size();
    stats.creating = state.creating;
    stats.waiters = state.waiters.size();
    stats.target_size = state.target;
    stats.total_created = state.created;
    stats.total_destroyed = state.destroyed;
    stats.total_acquired = state.acquired;
    stats.leaked_leases = state.leaked;
    stats.exhausted = state.exhausted;
    stats.consecutive_creation_failures = state.consecutive_failures;
    stats.p99_acquire_ms = Percentile(state.acquire_latencies_ms, 0.99);

    for (const auto& [id, instance] : state.active) {
        switch (instance->state) {
            case InstanceState::LEASED: stats.leased++; break;
            case InstanceState::EXECUTING: stats.executing++; break;
            case InstanceState::CLEANING: stats.cleaning++; break;
            default: break;
        }
    }
    return stats;
}

int SandboxPool::ConsecutiveCreationFailures(core::IsolationLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = levels_.find(level);
    return it != levels_.end() ? it->second.consecutive_failures : 0;
}

// ============================================================================
// MAINTENANCE
// ============================================================================

void SandboxPool::RunMaintenance() {
    ReapLeakedLeases();
    Replenish();
    AdjustTargets();
}

void SandboxPool::MaintenanceLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        maintenance_cv_.wait_for(lock, policy_.maintenance_interval, [this]() { return stopping_; });
        if (stopping_) {
            break;
        }

        lock.unlock();
        try {
            RunMaintenance();
        } catch (const std::exception& e) {
            spdlog::error("[POOL] Maintenance cycle failed: {}", e.what());
        }
        lock.lock();
    }
}

void SandboxPool::ReapLeakedLeases() {
    std::vector<InstancePtr> leaked;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();

        for (auto& [level, state] : levels_) {
            std::vector<InstancePtr> expired;
            for (const auto& [id, instance] : state.active) {
                if (instance->state == InstanceState::LEASED &&
                    now - instance->leased_at > policy_.lease_grace_period) {
                    expired.push_back(instance);
                }
            }
            for (const auto& instance : expired) {
                if (RetireLocked(state, instance)) {
                    state.leaked++;
                    leaked.push_back(instance);
                }
            }
        }
    }

    for (const auto& instance : leaked) {
        spdlog::warn("[POOL] Lease on {} held by '{}' never started executing, destroying",
                     instance->environment->Id(), instance->owner);
        TearDown(instance, "leaked lease");
    }
}

void SandboxPool::Replenish() {
    std::vector<core::IsolationLevel> levels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [level, state] : levels_) {
            levels.push_back(level);
        }
    }

    for (auto level : levels) {
        while (true) {
            std::chrono::milliseconds budget{0};
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_) {
                    return;
                }
                auto& state = StateFor(level);
                if (std::chrono::steady_clock::now() < state.next_replenish ||
                    state.idle.size() + state.creating >= state.target ||
                    !CanCreateLocked(state)) {
                    break;
                }
                state.creating++;
                budget = policy_.create_timeout;
            }

            InstancePtr instance;
            try {
                instance = CreateInstance(level, budget);
            } catch (const core::SandboxCreationError&) {
                break;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            auto& state = StateFor(level);
            AdoptLocked(state, *instance);
            HandOffLocked(state, instance);
        }
    }
}

void SandboxPool::AdjustTargets() {
    std::vector<InstancePtr> retired;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();

        for (auto& [level, state] : levels_) {
            if (state.acquire_latencies_ms.size() >= kMinLatencySamples) {
                auto p99 = Percentile(state.acquire_latencies_ms, 0.99);
                auto threshold = static_cast<double>(policy_.grow_latency_threshold.count());
                if (p99 > threshold && state.target < policy_.max_size) {
                    state.target++;
                    state.acquire_latencies_ms.clear();
                    spdlog::info("[POOL] {} P99 acquire latency {:.1f}ms > {:.0f}ms, target -> {}",
                                 core::ToString(level), p99, threshold, state.target);
                }
            }

            bool quiet = state.active.empty() && state.waiters.empty() &&
                         now - state.last_busy >= policy_.shrink_idle_period;

            if (quiet && state.target > policy_.min_size) {
                state.target--;
                state.last_busy = now;
                state.trim_requested = true;
                spdlog::info("[POOL] {} idle for {}s, target -> {}",
                             core::ToString(level), policy_.shrink_idle_period.count(), state.target);
            }

            if (quiet || state.trim_requested) {
                while (state.idle.size() > state.target) {
                    auto instance = state.idle.back();
                    if (RetireLocked(state, instance)) {
                        retired.push_back(instance);
                    }
                }
                state.trim_requested = false;
            }
        }
    }

    for (const auto& instance : retired) {
        TearDown(instance, "pool shrink");
    }
}

// ============================================================================
// INTERNAL HELPERS
// ============================================================================

SandboxPool::LevelState& SandboxPool::StateFor(core::IsolationLevel level) {
    auto it = levels_.find(level);
    if (it != levels_.end()) {
        return it->second;
    }

    auto& state = levels_[level];
    auto target_it = policy_.target_sizes.find(level);
    state.target = std::min(target_it != policy_.target_sizes.end() ? target_it->second : std::size_t{0},
                            policy_.max_size);
    state.next_replenish = std::chrono::steady_clock::now();
    state.last_busy = state.next_replenish;
    return state;
}

std::size_t SandboxPool::TotalLocked(const LevelState& state) const {
    return state.idle.size() + state.active.size() + state.creating;
}

bool SandboxPool::CanCreateLocked(const LevelState& state) const {
    return TotalLocked(state) < policy_.max_size;
}

SandboxPool::InstancePtr SandboxPool::CreateInstance(core::IsolationLevel level,
                                                     std::chrono::milliseconds budget) {
    auto backend = registry_->Get(level);
    std::unique_ptr<SandboxEnvironment> environment;
    std::string error;

    try {
        if (!backend) {
            throw core::SandboxCreationError("No sandbox backend registered for " + core::ToString(level));
        }
        environment = backend->Create(budget);
        if (!environment) {
            throw core::SandboxCreationError(backend->Name() + " returned no environment");
        }
    } catch (const core::SandboxCreationError& e) {
        error = e.what();
    } catch (const std::exception& e) {
        error = std::string("Unexpected sandbox creation failure: ") + e.what();
    }

    if (!environment) {
        int failures = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& state = StateFor(level);
            state.creating--;
            failures = ++state.consecutive_failures;

            auto backoff = policy_.maintenance_interval * (1 << std::min(failures, 6));
            state.next_replenish = std::chrono::steady_clock::now() +
                std::min<std::chrono::steady_clock::duration>(backoff, kMaxReplenishBackoff);

            OfferCreateSlotLocked(state);
        }

        spdlog::error("[POOL] {} sandbox creation failed ({} consecutive): {}",
                      core::ToString(level), failures, error);
        throw core::SandboxCreationError(error);
    }

    auto instance = std::make_shared<detail::PooledInstance>();
    instance->level = level;
    instance->environment = std::move(environment);

    PublishLifecycle(core::GatewayEventType::SANDBOX_CREATED, level, instance->environment->Id());
    return instance;
}

void SandboxPool::AdoptLocked(LevelState& state, detail::PooledInstance& instance) {
    state.creating--;
    state.consecutive_failures = 0;
    state.created++;
    instance.id = next_instance_id_++;
}

void SandboxPool::HandOffLocked(LevelState& state, const InstancePtr& instance) {
    if (!state.waiters.empty()) {
        auto* waiter = state.waiters.front();
        state.waiters.pop_front();
        GrantLocked(state, instance, waiter->owner);
        waiter->granted = instance;
        waiter->cv.notify_one();
        return;
    }

    instance->state = InstanceState::IDLE;
    instance->owner.clear();
    instance->idle_since = std::chrono::steady_clock::now();
    state.idle.push_back(instance);
}

void SandboxPool::OfferCreateSlotLocked(LevelState& state) {
    if (stopping_ || state.waiters.empty() || !CanCreateLocked(state)) {
        return;
    }

    auto* waiter = state.waiters.front();
    state.waiters.pop_front();
    state.creating++;
    waiter->create_slot = true;
    waiter->cv.notify_one();
}

void SandboxPool::GrantLocked(LevelState& state, const InstancePtr& instance, const std::string& owner) {
    instance->state = InstanceState::LEASED;
    instance->owner = owner;
    instance->leased_at = std::chrono::steady_clock::now();
    state.active[instance->id] = instance;
    state.acquired++;
}

void SandboxPool::RecordLatencyLocked(LevelState& state, std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
    state.acquire_latencies_ms.push_back(elapsed.count());
    while (state.acquire_latencies_ms.size() > kLatencyWindow) {
        state.acquire_latencies_ms.pop_front();
    }
}

bool SandboxPool::RetireLocked(LevelState& state, const InstancePtr& instance) {
    if (instance->state == InstanceState::DESTROYED) {
        return false;
    }

    instance->state = InstanceState::DESTROYED;
    state.active.erase(instance->id);

    auto it = std::find(state.idle.begin(), state.idle.end(), instance);
    if (it != state.idle.end()) {
        state.idle.erase(it);
    }

    state.destroyed++;
    OfferCreateSlotLocked(state);
    return true;
}

void SandboxPool::TearDown(const InstancePtr& instance, const std::string& reason) {
    const auto id = instance->environment->Id();

    try {
        instance->environment->Destroy();
    } catch (const std::exception& e) {
        spdlog::error("[POOL] Destroying {} failed: {}", id, e.what());
    }

    spdlog::debug("[POOL] Destroyed {} ({})", id, reason);
    PublishLifecycle(core::GatewayEventType::SANDBOX_DESTROYED, instance->level, id + ": " + reason);
}

void SandboxPool::PublishLifecycle(core::GatewayEventType type,
                                   core::IsolationLevel level,
                                   const std::string& detail) {
    if (!event_bus_) {
        return;
    }

    core::GatewayEvent event;
    event.type = type;
    event.component = "pool";
    event.level = level;
    event.detail = detail;
    event_bus_->Publish(std::move(event));
}

} // namespace sandbox
} // namespace warden
