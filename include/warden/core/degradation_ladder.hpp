/**
 * @file degradation_ladder.hpp
 * @brief Per-backend isolation fallback state machine
 *
 * Each requested isolation level owns one ladder state: the level actually
 * used and a count of consecutive creation failures at that level. Crossing
 * the failure threshold moves the state one step weaker. Nothing moves it
 * back up except Reset(), which only an operator triggers.
 *
 * ```
 * MICRO_VM -> USERSPACE_KERNEL -> CONTAINER -> NAMESPACE_SANDBOX -> NONE_AST_ONLY
 *    ^                                                                   |
 *    +------------------------ Reset() (administrative) -----------------+
 * ```
 *
 * @date 2025
 */

#pragma once

#include "warden/core/types.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace warden {
namespace core {

/**
 * @struct DegradationStep
 * @brief One recorded transition
 */
struct DegradationStep {
    IsolationLevel requested;
    IsolationLevel from;
    IsolationLevel to;
    bool reset{false};   ///< Administrative reset rather than degradation
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @class DegradationLadder
 * @brief Monotonic fallback state, one entry per requested level
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class DegradationLadder {
public:
    /**
     * @param failure_threshold Consecutive failures that trigger a step down
     * @param floor Weakest level the ladder may reach
     */
    explicit DegradationLadder(int failure_threshold = 10,
                               IsolationLevel floor = IsolationLevel::NONE_AST_ONLY);

    /// Level to use for a request at the given level
    IsolationLevel EffectiveLevel(IsolationLevel requested) const;

    /**
     * @brief Record a creation failure at the current effective level
     * @return The new effective level if this failure triggered a step down
     */
    std::optional<IsolationLevel> RecordFailure(IsolationLevel requested);

    /// Clear the consecutive failure count after a successful creation
    void RecordSuccess(IsolationLevel requested);

    /// true when the effective level is the floor and keeps failing
    bool IsExhausted(IsolationLevel requested) const;

    /**
     * @brief Administrative reset back to the requested level
     * @return true if the state changed
     */
    bool Reset(IsolationLevel requested);

    int ConsecutiveFailures(IsolationLevel requested) const;

    void SetFailureThreshold(int threshold);

    std::vector<DegradationStep> History() const;

private:
    struct State {
        IsolationLevel effective;
        int consecutive_failures{0};
        bool exhausted{false};
    };

    State& StateFor(IsolationLevel requested);

    mutable std::mutex mutex_;
    std::map<IsolationLevel, State> states_;
    std::vector<DegradationStep> history_;
    int failure_threshold_;
    IsolationLevel floor_;
};

} // namespace core
} // namespace warden
