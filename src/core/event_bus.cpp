/**
 * @file event_bus.cpp
 * @brief Implementation of the gateway event bus
 *
 * @date 2025
 */

#include "warden/core/event_bus.hpp"

#include <spdlog/spdlog.h>

namespace warden {
namespace core {

void EventBus::Subscribe(GatewayEventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    event_callbacks_.push_back(std::move(callback));
    spdlog::debug("Event subscriber registered");
}

void EventBus::SubscribeAlerts(AlertCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    alert_callbacks_.push_back(std::move(callback));
    spdlog::debug("Alert subscriber registered");
}

void EventBus::Publish(GatewayEvent event) {
    if (event.timestamp == std::chrono::system_clock::time_point{}) {
        event.timestamp = std::chrono::system_clock::now();
    }

    // Copy under lock so callbacks run without holding it
    std::vector<GatewayEventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++published_counts_[static_cast<std::size_t>(event.type)];
        callbacks = event_callbacks_;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(event);
        }
        catch (const std::exception& e) {
            spdlog::error("Event callback error ({}): {}", ToString(event.type), e.what());
        }
    }
}

void EventBus::RaiseAlert(Alert alert) {
    if (alert.timestamp == std::chrono::system_clock::time_point{}) {
        alert.timestamp = std::chrono::system_clock::now();
    }

    spdlog::warn("[ALERT] {} ({}): {}", alert.source, ToString(alert.kind), alert.message);

    std::vector<AlertCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = alert_callbacks_;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(alert);
        }
        catch (const std::exception& e) {
            spdlog::error("Alert callback error: {}", e.what());
        }
    }
}

std::size_t EventBus::PublishedCount(GatewayEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_counts_[static_cast<std::size_t>(type)];
}

std::string ToString(GatewayEventType type) {
    switch (type) {
        case GatewayEventType::VALIDATION_REQUESTED:        return "ValidationRequested";
        case GatewayEventType::VALIDATION_COMPLETED:        return "ValidationCompleted";
        case GatewayEventType::SECURITY_VIOLATION_DETECTED: return "SecurityViolationDetected";
        case GatewayEventType::SANDBOX_CREATED:             return "SandboxCreated";
        case GatewayEventType::SANDBOX_DESTROYED:           return "SandboxDestroyed";
        case GatewayEventType::DEGRADATION_TRIGGERED:       return "DegradationTriggered";
    }
    return "Unknown";
}

} // namespace core
} // namespace warden
