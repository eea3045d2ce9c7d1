/**
 * @file memory_audit_sink.hpp
 * @brief In-memory audit sink with injectable write failures
 * @date 2025
 */

#pragma once

#include "warden/audit/audit_logger.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden {
namespace fakes {

/// Records shared between a MemoryAuditSink and the test that owns it
struct MemoryAuditStore {
    std::mutex mutex;
    std::vector<nlohmann::json> records;
    std::atomic<int> failures_left{0};
    std::atomic<int> attempts{0};

    std::vector<nlohmann::json> Snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return records;
    }

    std::vector<nlohmann::json> OfType(const std::string& event_type) {
        std::vector<nlohmann::json> matching;
        for (const auto& record : Snapshot()) {
            if (record.value("event_type", "") == event_type) {
                matching.push_back(record);
            }
        }
        return matching;
    }
};

class MemoryAuditSink : public audit::AuditSink {
public:
    explicit MemoryAuditSink(std::shared_ptr<MemoryAuditStore> store) : store_(std::move(store)) {}

    void Write(const nlohmann::json& record) override {
        store_->attempts++;
        if (store_->failures_left > 0) {
            store_->failures_left--;
            throw std::runtime_error("disk full");
        }
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->records.push_back(record);
    }

    std::optional<nlohmann::json> LastRecord() const override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        if (store_->records.empty()) {
            return std::nullopt;
        }
        return store_->records.back();
    }

    std::string Describe() const override { return "memory"; }

private:
    std::shared_ptr<MemoryAuditStore> store_;
};

} // namespace fakes
} // namespace warden
