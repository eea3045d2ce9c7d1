/**
 * @file degradation_ladder.cpp
 * @brief Implementation of the isolation fallback state machine
 *
 * @date 2025
 */

#include "warden/core/degradation_ladder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace warden {
namespace core {

DegradationLadder::DegradationLadder(int failure_threshold, IsolationLevel floor)
    : failure_threshold_(std::max(1, failure_threshold))
    , floor_(floor) {
}

DegradationLadder::State& DegradationLadder::StateFor(IsolationLevel requested) {
    auto it = states_.find(requested);
    if (it == states_.end()) {
        it = states_.emplace(requested, State{requested}).first;
    }
    return it->second;
}

IsolationLevel DegradationLadder::EffectiveLevel(IsolationLevel requested) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(requested);
    return it == states_.end() ? requested : it->second.effective;
}

std::optional<IsolationLevel> DegradationLadder::RecordFailure(IsolationLevel requested) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = StateFor(requested);

    if (++state.consecutive_failures < failure_threshold_) {
        return std::nullopt;
    }

    auto weaker = WeakerLevel(state.effective);
    if (!weaker || IsStronger(floor_, *weaker)) {
        if (!state.exhausted) {
            spdlog::error("[LADDER] {} exhausted at {} after {} failures",
                          ToString(requested), ToString(state.effective),
                          state.consecutive_failures);
        }
        state.exhausted = true;
        return std::nullopt;
    }

    DegradationStep step{requested, state.effective, *weaker, false,
                         std::chrono::system_clock::now()};
    history_.push_back(step);

    spdlog::warn("[LADDER] Degrading {} from {} to {} after {} consecutive creation failures",
                 ToString(requested), ToString(state.effective), ToString(*weaker),
                 state.consecutive_failures);

    state.effective = *weaker;
    state.consecutive_failures = 0;
    return state.effective;
}

void DegradationLadder::RecordSuccess(IsolationLevel requested) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = StateFor(requested);
    state.consecutive_failures = 0;
    state.exhausted = false;
}

bool DegradationLadder::IsExhausted(IsolationLevel requested) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(requested);
    return it != states_.end() && it->second.exhausted;
}

bool DegradationLadder::Reset(IsolationLevel requested) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(requested);
    if (it == states_.end() || (it->second.effective == requested &&
                                it->second.consecutive_failures == 0 &&
                                !it->second.exhausted)) {
        return false;
    }

    history_.push_back({requested, it->second.effective, requested, true,
                        std::chrono::system_clock::now()});
    spdlog::info("[LADDER] Administrative reset of {} (was {})",
                 ToString(requested), ToString(it->second.effective));

    it->second = State{requested};
    return true;
}

int DegradationLadder::ConsecutiveFailures(IsolationLevel requested) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(requested);
    return it == states_.end() ? 0 : it->second.consecutive_failures;
}

void DegradationLadder::SetFailureThreshold(int threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_threshold_ = std::max(1, threshold);
}

std::vector<DegradationStep> DegradationLadder::History() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

} // namespace core
} // namespace warden
