/**
 * @file audit_logger.hpp
 * @brief Tamper-evident, non-blocking audit trail
 *
 * Every gateway decision and network access attempt becomes one audit
 * record. Records are persisted as canonical JSON lines and chained:
 *
 * ```
 *   record[n].prev_signature  == record[n-1].audit_signature
 *   record[n].audit_signature == SHA-256(record[n] without audit_signature)
 * ```
 *
 * Append() only enqueues. A writer thread drains the queue into an
 * AuditSink, retrying with backoff while the sink fails. Events are never
 * dropped while the logger runs.
 *
 * **Record Format** (one line per record, keys sorted):
 * ```json
 * {"audit_signature":"9f2c...","component":"factor_mining","content_hash":"ab12...",
 *  "decision":"rejected","event_type":"GatewayDecision","prev_signature":"00...",
 *  "sequence":42,"timestamp":"2025-03-14T09:26:53.589Z", ...}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "warden/core/event_bus.hpp"
#include "warden/core/policy.hpp"
#include "warden/core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace warden {
namespace audit {

/// Event type names used by the gateway
namespace event_types {
constexpr const char* kGatewayDecision = "GatewayDecision";
constexpr const char* kNetworkAccess = "NetworkAccess";
} // namespace event_types

/**
 * @struct AuditEvent
 * @brief One auditable occurrence (never contains raw content)
 */
struct AuditEvent {
    std::chrono::system_clock::time_point timestamp;   ///< Filled by Append() when unset
    std::string event_type;                            ///< GatewayDecision, NetworkAccess, ...
    std::string source;                                ///< Emitting module
    std::string request_id;

    // Context snapshot
    std::string component;
    std::string user_id;
    std::string session_id;
    std::optional<core::IsolationLevel> requested_level;
    std::optional<core::ResourceBudget> budget;
    std::chrono::milliseconds timeout{0};

    std::string content_hash;
    std::string decision;                              ///< approved, rejected, executed, failed, allowed, denied
    std::chrono::microseconds elapsed{0};

    // Resource usage (executions only)
    std::optional<core::IsolationLevel> effective_level;
    std::chrono::milliseconds wall_time{0};
    std::size_t peak_memory_mb{0};

    std::vector<core::Violation> violations;
    nlohmann::json details = nlohmann::json::object();  ///< Free-form structured details

    /// Copy component, user, session, level, budget and timeout
    void CaptureContext(const core::SecurityContext& context);

    /// Record body without chain fields
    nlohmann::json ToJson() const;
};

/**
 * @class AuditSink
 * @brief Destination for chained records
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    /**
     * @brief Persist one record durably
     * @throws std::runtime_error if the record could not be written
     */
    virtual void Write(const nlohmann::json& record) = 0;

    /// Last persisted record, used to resume the chain after a restart
    virtual std::optional<nlohmann::json> LastRecord() const = 0;

    virtual std::string Describe() const = 0;
};

/**
 * @class FileAuditSink
 * @brief JSON-lines file per UTC day: `<dir>/audit_YYYYMMDD.jsonl`
 */
class FileAuditSink : public AuditSink {
public:
    explicit FileAuditSink(std::filesystem::path directory);

    void Write(const nlohmann::json& record) override;
    std::optional<nlohmann::json> LastRecord() const override;
    std::string Describe() const override;

    /// File a record written at `when` goes to
    std::filesystem::path FileFor(std::chrono::system_clock::time_point when) const;

    /// Audit files in the directory, oldest first
    static std::vector<std::filesystem::path> ListFiles(const std::filesystem::path& directory);

private:
    std::filesystem::path directory_;
};

/**
 * @class AuditLogger
 * @brief Asynchronous hash-chained audit writer
 *
 * **Usage Example**:
 * @code
 * AuditLogger logger(policy.audit);
 * logger.SetAlertCallback([&](const core::Alert& a) { bus.RaiseAlert(a); });
 *
 * AuditEvent event;
 * event.event_type = event_types::kGatewayDecision;
 * event.decision = "rejected";
 * logger.Append(std::move(event));
 *
 * logger.Flush(std::chrono::seconds(1));
 * logger.VerifyAll();
 * @endcode
 *
 * **Thread Safety**: All public methods are thread-safe.
 */
class AuditLogger {
public:
    using AlertCallback = std::function<void(const core::Alert&)>;

    /// Genesis prev_signature of a fresh chain
    static const std::string kGenesisSignature;

    /**
     * @param policy Directory, retry backoff and alert threshold
     * @param sink Destination; a FileAuditSink over policy.directory when null
     */
    explicit AuditLogger(const core::AuditPolicy& policy, std::unique_ptr<AuditSink> sink = nullptr);
    ~AuditLogger();

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    /// Enqueue an event; never blocks on I/O
    void Append(AuditEvent event);

    /**
     * @brief Wait until every appended event is persisted
     * @return false if the queue was not drained before the timeout
     */
    bool Flush(std::chrono::milliseconds timeout);

    /**
     * @brief Verify one audit file
     * @return Number of records verified
     * @throws core::IntegrityError on a missing or wrong signature or a broken chain
     * @throws std::runtime_error if the file does not exist
     */
    static std::size_t VerifyIntegrity(const std::filesystem::path& path);

    /// Verify every audit file in a directory as one continuous chain
    static std::size_t VerifyDirectory(const std::filesystem::path& directory);

    /// VerifyDirectory() over this logger's directory (file sink only)
    std::size_t VerifyAll() const;

    /**
     * @brief Most recently persisted records, newest first
     * @throws std::invalid_argument if n is 0
     */
    std::vector<nlohmann::json> GetRecent(std::size_t n) const;

    /// Retained records of one event type, newest first
    std::vector<nlohmann::json> GetByEventType(const std::string& event_type) const;

    void SetAlertCallback(AlertCallback callback);

    std::size_t PendingCount() const;
    std::uint64_t WrittenCount() const;
    int ConsecutiveFailures() const;

    /// Drain what the sink accepts, then stop the writer
    void Shutdown();

private:
    struct ChainState {
        std::uint64_t sequence{0};
        std::string signature;
    };

    void WriterLoop();

    /// Add chain fields and signature to an event body
    nlohmann::json Seal(const AuditEvent& event, const ChainState& previous) const;

    /// Count a sink failure and alert once per streak
    void RecordFailure(const std::string& error);

    void ResumeChain();

    /// Verify records of one file, continuing from `chain` when set
    static std::size_t VerifyFile(const std::filesystem::path& path, std::optional<ChainState>& chain);

    std::unique_ptr<AuditSink> sink_;
    std::filesystem::path directory_;
    bool file_sink_{false};
    std::chrono::milliseconds retry_backoff_;
    int alert_after_failures_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::deque<AuditEvent> queue_;
    bool writing_{false};
    bool stopping_{false};

    ChainState chain_;                          ///< Touched only by the writer thread
    std::deque<nlohmann::json> recent_;
    std::uint64_t written_{0};
    int consecutive_failures_{0};
    bool alerted_{false};
    AlertCallback alert_callback_;

    std::thread writer_thread_;
};

} // namespace audit
} // namespace warden
