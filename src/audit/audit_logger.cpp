/**
 * @file audit_logger.cpp
 * @brief Implementation of the hash-chained audit writer
 * @date 2025
 */

#include "warden/audit/audit_logger.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace warden {
namespace audit {

using utils::HashUtils;

namespace {

constexpr std::size_t kRecentCapacity = 1000;
constexpr auto kMaxRetryBackoff = std::chrono::seconds(5);
constexpr const char* kFilePrefix = "audit_";
constexpr const char* kFileSuffix = ".jsonl";

std::tm ToUtc(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point when) {
    auto tm = ToUtc(when);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// AUDIT EVENT
// ============================================================================

void AuditEvent::CaptureContext(const core::SecurityContext& context) {
    request_id = context.RequestId();
    component = context.ComponentName();
    user_id = context.UserId();
    session_id = context.SessionId();
    requested_level = context.RequestedLevel();
    budget = context.Budget();
    timeout = context.Timeout();
}

json AuditEvent::ToJson() const {
    json j;
    j["timestamp"] = FormatTimestamp(timestamp);
    j["event_type"] = event_type;
    j["source"] = source;
    j["request_id"] = request_id;
    j["decision"] = decision;
    j["elapsed_us"] = elapsed.count();

    json context = {
        {"component", component},
        {"user_id", user_id},
        {"session_id", session_id},
        {"timeout_ms", timeout.count()}
    };
    if (requested_level) {
        context["requested_level"] = core::ToString(*requested_level);
    }
    if (budget) {
        context["budget"] = {
            {"max_memory_mb", budget->max_memory_mb},
            {"max_cpu_millicores", static_cast<std::int64_t>(budget->max_cpu_cores * 1000.0)},
            {"max_processes", budget->max_processes},
            {"max_wall_time_ms", budget->max_wall_time.count()}
        };
    }
    j["context"] = context;

    if (!content_hash.empty()) {
        j["content_hash"] = content_hash;
    }

    if (effective_level) {
        j["resources"] = {
            {"effective_level", core::ToString(*effective_level)},
            {"wall_time_ms", wall_time.count()},
            {"peak_memory_mb", peak_memory_mb}
        };
    }

    json list = json::array();
    for (const auto& violation : violations) {
        list.push_back(core::ToJson(violation));
    }
    j["violations"] = list;
    j["details"] = details.is_null() ? json::object() : details;
    return j;
}

// ============================================================================
// FILE SINK
// ============================================================================

FileAuditSink::FileAuditSink(fs::path directory)
    : directory_(std::move(directory)) {
}

fs::path FileAuditSink::FileFor(std::chrono::system_clock::time_point when) const {
    auto tm = ToUtc(when);
    std::ostringstream name;
    name << kFilePrefix << std::put_time(&tm, "%Y%m%d") << kFileSuffix;
    return directory_ / name.str();
}

void FileAuditSink::Write(const json& record) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create audit directory " + directory_.string() + ": " + ec.message());
    }

    auto path = FileFor(std::chrono::system_clock::now());
    std::ofstream out(path, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot open audit file " + path.string());
    }

    out << record.dump() << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("Write to audit file " + path.string() + " failed");
    }
}

std::optional<json> FileAuditSink::LastRecord() const {
    auto files = ListFiles(directory_);
    if (files.empty()) {
        return std::nullopt;
    }

    std::ifstream in(files.back());
    std::string line;
    std::string last;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            last = line;
        }
    }
    if (last.empty()) {
        return std::nullopt;
    }

    try {
        return json::parse(last);
    } catch (const json::parse_error& e) {
        spdlog::warn("[AUDIT] Last record of {} is unreadable: {}", files.back().string(), e.what());
        return std::nullopt;
    }
}

std::string FileAuditSink::Describe() const {
    return "file:" + directory_.string();
}

std::vector<fs::path> FileAuditSink::ListFiles(const fs::path& directory) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        auto name = entry.path().filename().string();
        if (entry.is_regular_file() &&
            name.rfind(kFilePrefix, 0) == 0 &&
            name.size() > std::string(kFileSuffix).size() &&
            name.compare(name.size() - std::string(kFileSuffix).size(), std::string::npos, kFileSuffix) == 0) {
            files.push_back(entry.path());
        }
    }

    // audit_YYYYMMDD sorts chronologically
    std::sort(files.begin(), files.end());
    return files;
}

// ============================================================================
// LOGGER
// ============================================================================

const std::string AuditLogger::kGenesisSignature(64, '0');

AuditLogger::AuditLogger(const core::AuditPolicy& policy, std::unique_ptr<AuditSink> sink)
    : sink_(std::move(sink))
    , directory_(policy.directory)
    , retry_backoff_(policy.retry_backoff)
    , alert_after_failures_(std::max(1, policy.alert_after_failures)) {

    if (!sink_) {
        sink_ = std::make_unique<FileAuditSink>(directory_);
        file_sink_ = true;
    }

    chain_.signature = kGenesisSignature;
    ResumeChain();

    writer_thread_ = std::thread(&AuditLogger::WriterLoop, this);
    spdlog::debug("[AUDIT] Writing to {} (sequence {})", sink_->Describe(), chain_.sequence);
}

AuditLogger::~AuditLogger() {
    Shutdown();
}

void AuditLogger::ResumeChain() {
    std::optional<json> last;
    try {
        last = sink_->LastRecord();
    } catch (const std::exception& e) {
        spdlog::warn("[AUDIT] Could not read the previous chain head: {}", e.what());
    }

    if (!last) {
        return;
    }

    auto sequence = last->find("sequence");
    auto signature = last->find("audit_signature");
    if (sequence != last->end() && sequence->is_number_unsigned() &&
        signature != last->end() && signature->is_string()) {
        chain_.sequence = sequence->get<std::uint64_t>();
        chain_.signature = signature->get<std::string>();
    } else {
        spdlog::warn("[AUDIT] Previous chain head lacks sequence or signature, starting a new chain");
    }
}

void AuditLogger::Append(AuditEvent event) {
    if (event.timestamp == std::chrono::system_clock::time_point{}) {
        event.timestamp = std::chrono::system_clock::now();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            spdlog::error("[AUDIT] {} event appended after shutdown (request {})",
                          event.event_type, event.request_id);
            return;
        }
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

bool AuditLogger::Flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_cv_.wait_for(lock, timeout, [this]() {
        return queue_.empty() && !writing_;
    });
}

json AuditLogger::Seal(const AuditEvent& event, const ChainState& previous) const {
    json record = event.ToJson();
    record["sequence"] = previous.sequence + 1;
    record["prev_signature"] = previous.signature;
    record["audit_signature"] = HashUtils::ComputeSHA256(record.dump());
    return record;
}

void AuditLogger::WriterLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            break;
        }

        AuditEvent event = queue_.front();
        writing_ = true;
        lock.unlock();

        json record;
        std::string error;
        try {
            record = Seal(event, chain_);
            sink_->Write(record);
        } catch (const std::exception& e) {
            error = e.what();
        }

        lock.lock();
        writing_ = false;

        if (error.empty()) {
            queue_.pop_front();
            chain_.sequence = record["sequence"].get<std::uint64_t>();
            chain_.signature = record["audit_signature"].get<std::string>();

            recent_.push_back(std::move(record));
            if (recent_.size() > kRecentCapacity) {
                recent_.pop_front();
            }
            written_++;

            if (consecutive_failures_ > 0) {
                spdlog::info("[AUDIT] Sink recovered after {} failed attempts", consecutive_failures_);
            }
            consecutive_failures_ = 0;
            alerted_ = false;

            if (queue_.empty()) {
                drained_cv_.notify_all();
            }
            continue;
        }

        lock.unlock();
        RecordFailure(error);
        lock.lock();

        if (stopping_) {
            spdlog::error("[AUDIT] Shutting down with {} unwritten events: {}", queue_.size(), error);
            break;
        }

        auto backoff = retry_backoff_ * (1 << std::min(consecutive_failures_ - 1, 5));
        queue_cv_.wait_for(lock, std::min<std::chrono::milliseconds>(backoff, kMaxRetryBackoff),
                           [this]() { return stopping_; });
    }

    drained_cv_.notify_all();
}

void AuditLogger::RecordFailure(const std::string& error) {
    AlertCallback callback;
    int failures = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures = ++consecutive_failures_;
        if (failures >= alert_after_failures_ && !alerted_) {
            alerted_ = true;
            callback = alert_callback_;
        }
    }

    spdlog::error("[AUDIT] Write to {} failed ({} consecutive): {}", sink_->Describe(), failures, error);

    if (!callback) {
        return;
    }

    core::Alert alert;
    alert.source = "audit";
    alert.kind = core::ViolationKind::AUDIT_WRITE_FAILED;
    alert.message = "Audit sink " + sink_->Describe() + " failed " + std::to_string(failures) +
                    " consecutive writes: " + error;
    alert.timestamp = std::chrono::system_clock::now();

    try {
        callback(alert);
    } catch (const std::exception& e) {
        spdlog::error("[AUDIT] Alert callback failed: {}", e.what());
    }
}

void AuditLogger::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

// ============================================================================
// VERIFICATION
// ============================================================================

std::size_t AuditLogger::VerifyFile(const fs::path& path, std::optional<ChainState>& chain) {
    if (!fs::exists(path)) {
        throw std::runtime_error("Audit file not found: " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open audit file: " + path.string());
    }

    const auto where = [&path](std::size_t line_number) {
        return path.filename().string() + ":" + std::to_string(line_number);
    };

    std::size_t verified = 0;
    std::size_t line_number = 0;
    std::string line;

    while (std::getline(in, line)) {
        line_number++;
        if (line.empty()) {
            continue;
        }

        json record;
        try {
            record = json::parse(line);
        } catch (const json::parse_error&) {
            throw core::IntegrityError(where(line_number) + ": record is not valid JSON");
        }

        auto signature_it = record.find("audit_signature");
        if (signature_it == record.end() || !signature_it->is_string()) {
            throw core::IntegrityError(where(line_number) + ": missing audit_signature");
        }
        std::string signature = signature_it->get<std::string>();

        json body = record;
        body.erase("audit_signature");
        if (!HashUtils::ConstantTimeEquals(HashUtils::ComputeSHA256(body.dump()), signature)) {
            throw core::IntegrityError(where(line_number) + ": signature mismatch");
        }

        auto sequence_it = record.find("sequence");
        auto prev_it = record.find("prev_signature");
        if (sequence_it == record.end() || !sequence_it->is_number_unsigned() ||
            prev_it == record.end() || !prev_it->is_string()) {
            throw core::IntegrityError(where(line_number) + ": missing chain fields");
        }

        auto sequence = sequence_it->get<std::uint64_t>();
        if (chain) {
            if (sequence != chain->sequence + 1) {
                throw core::IntegrityError(where(line_number) + ": sequence " + std::to_string(sequence) +
                                           " follows " + std::to_string(chain->sequence));
            }
            if (prev_it->get<std::string>() != chain->signature) {
                throw core::IntegrityError(where(line_number) + ": prev_signature does not match the previous record");
            }
        }

        chain = ChainState{sequence, signature};
        verified++;
    }

    return verified;
}

std::size_t AuditLogger::VerifyIntegrity(const fs::path& path) {
    std::optional<ChainState> chain;
    auto count = VerifyFile(path, chain);
    spdlog::debug("[AUDIT] {} verified ({} records)", path.string(), count);
    return count;
}

std::size_t AuditLogger::VerifyDirectory(const fs::path& directory) {
    std::optional<ChainState> chain;
    std::size_t total = 0;

    for (const auto& file : FileAuditSink::ListFiles(directory)) {
        total += VerifyFile(file, chain);
    }

    spdlog::debug("[AUDIT] {} verified ({} records)", directory.string(), total);
    return total;
}

std::size_t AuditLogger::VerifyAll() const {
    if (!file_sink_) {
        throw std::logic_error("VerifyAll requires the file sink, got " + sink_->Describe());
    }
    return VerifyDirectory(directory_);
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<json> AuditLogger::GetRecent(std::size_t n) const {
    if (n == 0) {
        throw std::invalid_argument("GetRecent requires n > 0");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<json> records;
    for (auto it = recent_.rbegin(); it != recent_.rend() && records.size() < n; ++it) {
        records.push_back(*it);
    }
    return records;
}

std::vector<json> AuditLogger::GetByEventType(const std::string& event_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<json> records;
    for (auto it = recent_.rbegin(); it != recent_.rend(); ++it) {
        if (it->value("event_type", "") == event_type) {
            records.push_back(*it);
        }
    }
    return records;
}

void AuditLogger::SetAlertCallback(AlertCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    alert_callback_ = std::move(callback);
}

std::size_t AuditLogger::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::uint64_t AuditLogger::WrittenCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

int AuditLogger::ConsecutiveFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

} // namespace audit
} // namespace warden
