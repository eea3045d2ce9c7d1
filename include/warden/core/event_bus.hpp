/**
 * @file event_bus.hpp
 * @brief Outbound gateway events and operational alerts
 *
 * Monitoring collaborators subscribe here. Every event carries enough
 * context (component, request, level, violation kind, timing) for an
 * alerting layer to act without querying audit storage.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/types.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace core {

/**
 * @enum GatewayEventType
 * @brief Events published to external consumers
 */
enum class GatewayEventType {
    VALIDATION_REQUESTED,
    VALIDATION_COMPLETED,
    SECURITY_VIOLATION_DETECTED,
    SANDBOX_CREATED,
    SANDBOX_DESTROYED,
    DEGRADATION_TRIGGERED
};

/**
 * @struct GatewayEvent
 * @brief One published event
 */
struct GatewayEvent {
    GatewayEventType type{GatewayEventType::VALIDATION_REQUESTED};
    std::chrono::system_clock::time_point timestamp;
    std::string component;                     ///< Requesting component or "pool"
    std::string request_id;                    ///< Empty for pool-internal events
    std::optional<IsolationLevel> level;       ///< Level involved, if any
    std::optional<IsolationLevel> new_level;   ///< Target level for degradations
    std::optional<ViolationKind> violation;    ///< Violation kind, if any
    std::string detail;
    std::chrono::microseconds elapsed{0};      ///< Timing of the step that produced the event
};

/**
 * @struct Alert
 * @brief Operational alert (degradation, audit sink failure, network abuse)
 */
struct Alert {
    std::string source;                        ///< Raising component
    ViolationKind kind{ViolationKind::AUDIT_WRITE_FAILED};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

/// Callback function types for bus subscribers
using GatewayEventCallback = std::function<void(const GatewayEvent&)>;
using AlertCallback = std::function<void(const Alert&)>;

/**
 * @class EventBus
 * @brief Synchronous fan-out to registered subscribers
 *
 * Subscriber exceptions are logged and never reach the publisher.
 *
 * **Thread Safety**: Subscribe and publish may be called concurrently.
 */
class EventBus {
public:
    EventBus() = default;

    void Subscribe(GatewayEventCallback callback);
    void SubscribeAlerts(AlertCallback callback);

    /// Timestamp is filled in when unset
    void Publish(GatewayEvent event);

    void RaiseAlert(Alert alert);

    /// Events published so far, by type
    std::size_t PublishedCount(GatewayEventType type) const;

private:
    mutable std::mutex mutex_;
    std::vector<GatewayEventCallback> event_callbacks_;
    std::vector<AlertCallback> alert_callbacks_;
    std::vector<std::size_t> published_counts_ = std::vector<std::size_t>(6, 0);
};

std::string ToString(GatewayEventType type);

} // namespace core
} // namespace warden
