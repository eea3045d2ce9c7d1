/**
 * @file policy.cpp
 * @brief Implementation of policy loading, validation and atomic reload
 *
 * **Document Layout** (every section optional, missing fields keep defaults):
 * ```
 * {
 *   "version": "3",
 *   "validator": { "denied_calls": [...], "allowed_calls": [...], "max_depth": 64,
 *                  "prompt": {...}, "config": {...} },
 *   "isolation": { "ceilings": { "container": { "max_memory_mb": 512 } },
 *                  "oci_runtimes": { "microvm": "kata-fc" },
 *                  "runtime_commands": { "code": ["python3", "-I", "-"] } },
 *   "network":   { "allowed_domains": [...], "denied_ranges": [...] },
 *   "pool":      { "target_sizes": { "container": 2 } },
 *   "gateway":   { "creation_failure_threshold": 10 },
 *   "audit":     { "directory": "./audit_logs" }
 * }
 * ```
 * List fields replace the compiled defaults rather than extending them.
 *
 * @date 2025
 */

#include "warden/core/policy.hpp"
#include "warden/core/errors.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

using json = nlohmann::json;

namespace warden {
namespace core {

namespace {

// ============================================================================
// DEFAULT CAPABILITY SETS
// ============================================================================

const char* kDefaultExpressionPrelude = R"PRELUDE(import math
import statistics

def _series(phase, scale=100.0, n=260):
    value = scale
    out = []
    for i in range(n):
        value *= 1.0 + 0.01 * math.sin(i * 0.37 + phase)
        out.append(round(value, 6))
    return out

open = _series(0.0)
high = [v * 1.01 for v in _series(0.1)]
low = [v * 0.99 for v in _series(0.2)]
close = _series(0.3)
volume = [abs(v) * 1000.0 for v in _series(0.4, 10.0)]
vwap = [(h + l + c) / 3.0 for h, l, c in zip(high, low, close)]
returns = [0.0] + [b / a - 1.0 for a, b in zip(close, close[1:])]

def _tail(x, n=None):
    if n is None:
        return list(x)
    return list(x)[-int(n):]

def mean(x, n=None):
    v = _tail(x, n)
    return sum(v) / len(v)

def std(x, n=None):
    return statistics.pstdev(_tail(x, n))

def ts_mean(x, n):
    return mean(x, n)

def ts_sum(x, n):
    return sum(_tail(x, n))

def ts_std(x, n):
    return std(x, n)

def ts_max(x, n):
    return max(_tail(x, n))

def ts_min(x, n):
    return min(_tail(x, n))

def ts_rank(x, n):
    v = _tail(x, n)
    return sorted(v).index(v[-1]) / max(len(v) - 1, 1)

def delay(x, n):
    n = int(n)
    return list(x)[:-n] if n > 0 else list(x)

def delta(x, n):
    n = int(n)
    return [b - a for a, b in zip(x, list(x)[n:])]

def rank(x):
    v = list(x)
    return sorted(v).index(v[-1]) / max(len(v) - 1, 1)

def scale(x):
    total = sum(abs(v) for v in x) or 1.0
    return [v / total for v in x]

def sign(x):
    if isinstance(x, list):
        return [sign(v) for v in x]
    return (x > 0) - (x < 0)

def log(x):
    if isinstance(x, list):
        return [math.log(v) for v in x]
    return math.log(x)

def decay_linear(x, n):
    v = _tail(x, n)
    weights = range(1, len(v) + 1)
    return sum(a * w for a, w in zip(v, weights)) / sum(weights)

def covariance(x, y, n):
    a, b = _tail(x, n), _tail(y, n)
    ma, mb = mean(a), mean(b)
    return sum((p - ma) * (q - mb) for p, q in zip(a, b)) / len(a)

def correlation(x, y, n):
    denom = std(x, n) * std(y, n)
    return covariance(x, y, n) / denom if denom else 0.0
)PRELUDE";

void ApplyCapabilityDefaults(ValidatorPolicy& v) {
    v.denied_calls = {
        "eval", "exec", "compile", "__import__", "open", "input", "breakpoint",
        "globals", "locals", "vars", "getattr", "setattr", "delattr", "memoryview",
        "os.system", "os.popen", "os.spawnl", "os.execv", "os.fork", "os.remove",
        "subprocess.call", "subprocess.run", "subprocess.Popen", "subprocess.check_output",
        "pickle.load", "pickle.loads", "marshal.loads", "shelve.open",
        "socket.socket", "socket.create_connection", "importlib.import_module",
        "numpy.load", "numpy.loadtxt", "numpy.fromfile", "numpy.memmap", "numpy.save",
        "pandas.read_pickle", "pandas.read_csv", "pandas.read_json", "pandas.read_sql",
        "pandas.read_parquet"
    };

    v.denied_modules = {
        "os", "sys", "subprocess", "socket", "pickle", "marshal", "shelve", "ctypes",
        "multiprocessing", "threading", "_thread", "importlib", "builtins", "shutil",
        "signal", "pty", "requests", "urllib", "http", "ftplib", "smtplib", "telnetlib",
        "asyncio", "io", "pathlib", "tempfile", "glob", "resource", "gc", "inspect"
    };

    v.denied_attributes = {
        "__class__", "__subclasses__", "__globals__", "__builtins__", "__dict__",
        "__code__", "__bases__", "__mro__", "__base__", "__getattribute__",
        "__reduce__", "__reduce_ex__", "__loader__", "__spec__", "__closure__",
        "__self__", "__func__", "__import__", "__wrapped__",
        "f_globals", "f_locals", "f_builtins", "f_back", "f_code",
        "gi_frame", "gi_code", "gi_yieldfrom", "cr_frame", "cr_code", "cr_await",
        "ag_frame", "ag_code", "tb_frame", "tb_next", "co_code", "co_consts",
        "system", "popen", "spawnv", "execv", "execve", "fork", "import_module", "check_output"
    };

    v.allowed_calls = {
        "abs", "min", "max", "sum", "len", "round", "range", "float", "int", "bool",
        "str", "list", "tuple", "dict", "set", "sorted", "reversed", "enumerate", "zip",
        "map", "filter", "any", "all", "pow", "divmod", "isinstance", "print",
        "numpy.array", "numpy.log", "numpy.exp", "numpy.sqrt", "numpy.abs", "numpy.mean",
        "numpy.std", "numpy.sum", "numpy.where", "numpy.sign", "numpy.maximum",
        "numpy.minimum", "numpy.clip", "numpy.nan_to_num", "numpy.zeros", "numpy.ones",
        "numpy.arange", "numpy.cumsum", "numpy.diff", "numpy.percentile",
        "pandas.Series", "pandas.DataFrame", "pandas.concat",
        "math.log", "math.exp", "math.sqrt", "math.floor", "math.ceil", "math.fabs",
        "math.isnan", "math.isfinite",
        "statistics.mean", "statistics.median", "statistics.pstdev", "statistics.stdev"
    };

    v.allowed_modules = {
        "math", "statistics", "numpy", "pandas", "datetime", "collections",
        "itertools", "functools", "typing", "decimal", "fractions", "dataclasses",
        "json", "re", "random", "heapq", "bisect", "operator"
    };

    v.expression_operators = {
        "mean", "std", "rank", "delay", "delta", "ts_mean", "ts_sum", "ts_std",
        "ts_max", "ts_min", "ts_rank", "correlation", "covariance", "scale",
        "decay_linear", "sign", "log"
    };

    v.expression_aliases = {{"np", "numpy"}, {"pd", "pandas"}};

    v.expression_series = {"open", "high", "low", "close", "volume", "vwap", "returns"};

    v.allowed_constants = {
        "math.pi", "math.e", "math.tau", "math.inf", "math.nan",
        "numpy.pi", "numpy.e", "numpy.inf", "numpy.nan", "numpy.newaxis",
        "numpy.float64", "numpy.int64"
    };

    v.injection_markers = {
        "ignore previous instructions", "ignore all previous instructions",
        "disregard the above", "disregard previous", "you are now",
        "system prompt:", "<|im_start|>", "<|im_end|>", "### system",
        "forget your instructions", "reveal your system prompt"
    };

    v.config_denied_patterns = {
        "eval(", "exec(", "__import__", "os.system", "subprocess", "pickle.loads",
        "rm -rf", "drop table", "; --", "$(", "`"
    };
}

void ApplyIsolationDefaults(IsolationPolicy& iso) {
    ResourceBudget vm;
    vm.max_memory_mb = 2048;
    vm.max_cpu_cores = 2.0;
    vm.max_processes = 64;
    vm.max_wall_time = std::chrono::milliseconds(60000);

    ResourceBudget container;
    container.max_memory_mb = 1024;
    container.max_cpu_cores = 2.0;
    container.max_processes = 64;
    container.max_wall_time = std::chrono::milliseconds(60000);

    ResourceBudget ns;
    ns.max_memory_mb = 512;
    ns.max_cpu_cores = 1.0;
    ns.max_processes = 32;
    ns.max_wall_time = std::chrono::milliseconds(30000);

    iso.ceilings = {
        {IsolationLevel::MICRO_VM, vm},
        {IsolationLevel::USERSPACE_KERNEL, container},
        {IsolationLevel::CONTAINER, container},
        {IsolationLevel::NAMESPACE_SANDBOX, ns},
        {IsolationLevel::NONE_AST_ONLY, ns}
    };

    iso.oci_runtimes = {
        {IsolationLevel::MICRO_VM, "kata-fc"},
        {IsolationLevel::USERSPACE_KERNEL, "runsc"},
        {IsolationLevel::CONTAINER, "runc"}
    };

    iso.runtime_commands = {
        {ContentType::CODE, {"python3", "-I", "-"}},
        {ContentType::EXPRESSION, {"python3", "-I", "-"}}
    };

    iso.expression_prelude = kDefaultExpressionPrelude;
}

// ============================================================================
// JSON HELPERS
// ============================================================================

template <typename T>
void ReadField(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        try {
            target = section.at(key).get<T>();
        } catch (const json::exception& e) {
            throw PolicyError(std::string("Invalid policy field '") + key + "': " + e.what());
        }
    }
}

void ReadMillis(const json& section, const char* key, std::chrono::milliseconds& target) {
    long long value = target.count();
    ReadField(section, key, value);
    target = std::chrono::milliseconds(value);
}

void ReadSeconds(const json& section, const char* key, std::chrono::seconds& target) {
    long long value = target.count();
    ReadField(section, key, value);
    target = std::chrono::seconds(value);
}

IsolationLevel LevelKey(const std::string& key) {
    auto level = ParseIsolationLevel(key);
    if (!level) {
        throw PolicyError("Unknown isolation level in policy: " + key);
    }
    return *level;
}

ContentType ContentKey(const std::string& key) {
    auto type = ParseContentType(key);
    if (!type) {
        throw PolicyError("Unknown content type in policy: " + key);
    }
    return *type;
}

ResourceBudget ReadBudget(const json& section, ResourceBudget budget) {
    ReadField(section, "max_memory_mb", budget.max_memory_mb);
    ReadField(section, "max_cpu_cores", budget.max_cpu_cores);
    ReadField(section, "max_processes", budget.max_processes);
    ReadMillis(section, "max_wall_time_ms", budget.max_wall_time);
    return budget;
}

json BudgetToJson(const ResourceBudget& budget) {
    return {
        {"max_memory_mb", budget.max_memory_mb},
        {"max_cpu_cores", budget.max_cpu_cores},
        {"max_processes", budget.max_processes},
        {"max_wall_time_ms", budget.max_wall_time.count()}
    };
}

void CheckDisjoint(const std::set<std::string>& allowed,
                   const std::set<std::string>& denied,
                   const std::string& what) {
    for (const auto& name : allowed) {
        if (denied.count(name)) {
            throw PolicyError("Identifier '" + name + "' is both allowed and denied (" + what + ")");
        }
    }
}

void OverlayDocument(const json& document, PolicySnapshot& snapshot) {
    ReadField(document, "version", snapshot.version);

    if (document.contains("validator")) {
        const auto& v = document.at("validator");
        auto& p = snapshot.validator;
        ReadField(v, "denied_calls", p.denied_calls);
        ReadField(v, "denied_modules", p.denied_modules);
        ReadField(v, "denied_attributes", p.denied_attributes);
        ReadField(v, "allowed_calls", p.allowed_calls);
        ReadField(v, "allowed_modules", p.allowed_modules);
        ReadField(v, "expression_operators", p.expression_operators);
        ReadField(v, "expression_aliases", p.expression_aliases);
        ReadField(v, "expression_series", p.expression_series);
        ReadField(v, "allowed_constants", p.allowed_constants);
        ReadField(v, "max_depth", p.max_depth);
        ReadField(v, "max_nodes", p.max_nodes);
        ReadField(v, "max_complexity", p.max_complexity);
        ReadField(v, "max_imports", p.max_imports);
        ReadField(v, "max_content_bytes", p.max_content_bytes);
        ReadField(v, "max_lines", p.max_lines);
        ReadField(v, "strict_calls", p.strict_calls);
        if (v.contains("prompt")) {
            ReadField(v.at("prompt"), "max_bytes", p.prompt_max_bytes);
            ReadField(v.at("prompt"), "injection_markers", p.injection_markers);
        }
        if (v.contains("config")) {
            ReadField(v.at("config"), "max_bytes", p.config_max_bytes);
            ReadField(v.at("config"), "max_depth", p.config_max_depth);
            ReadField(v.at("config"), "denied_patterns", p.config_denied_patterns);
        }
    }

    if (document.contains("isolation")) {
        const auto& i = document.at("isolation");
        auto& p = snapshot.isolation;
        if (i.contains("ceilings")) {
            for (const auto& [key, value] : i.at("ceilings").items()) {
                auto level = LevelKey(key);
                p.ceilings[level] = ReadBudget(value, snapshot.CeilingFor(level));
            }
        }
        if (i.contains("oci_runtimes")) {
            for (const auto& [key, value] : i.at("oci_runtimes").items()) {
                p.oci_runtimes[LevelKey(key)] = value.get<std::string>();
            }
        }
        if (i.contains("runtime_commands")) {
            for (const auto& [key, value] : i.at("runtime_commands").items()) {
                p.runtime_commands[ContentKey(key)] = value.get<std::vector<std::string>>();
            }
        }
        ReadField(i, "container_binary", p.container_binary);
        ReadField(i, "container_image", p.container_image);
        ReadField(i, "sandbox_user", p.sandbox_user);
        ReadField(i, "egress_network", p.egress_network);
        ReadField(i, "expression_prelude", p.expression_prelude);
        ReadField(i, "max_open_files", p.max_open_files);
        ReadField(i, "max_output_bytes", p.max_output_bytes);
    }

    if (document.contains("network")) {
        const auto& n = document.at("network");
        auto& p = snapshot.network;
        ReadField(n, "allowed_domains", p.allowed_domains);
        ReadField(n, "denied_ranges", p.denied_ranges);
        ReadField(n, "repeat_violation_threshold", p.repeat_violation_threshold);
        ReadSeconds(n, "repeat_violation_window_s", p.repeat_violation_window);
        ReadField(n, "traffic_log_capacity", p.traffic_log_capacity);
    }

    if (document.contains("pool")) {
        const auto& pl = document.at("pool");
        auto& p = snapshot.pool;
        if (pl.contains("target_sizes")) {
            p.target_sizes.clear();
            for (const auto& [key, value] : pl.at("target_sizes").items()) {
                p.target_sizes[LevelKey(key)] = value.get<std::size_t>();
            }
        }
        ReadField(pl, "min_size", p.min_size);
        ReadField(pl, "max_size", p.max_size);
        ReadMillis(pl, "lease_grace_period_ms", p.lease_grace_period);
        ReadMillis(pl, "grow_latency_threshold_ms", p.grow_latency_threshold);
        ReadSeconds(pl, "shrink_idle_period_s", p.shrink_idle_period);
        ReadMillis(pl, "maintenance_interval_ms", p.maintenance_interval);
        ReadMillis(pl, "create_timeout_ms", p.create_timeout);
    }

    if (document.contains("gateway")) {
        const auto& g = document.at("gateway");
        ReadField(g, "creation_failure_threshold", snapshot.gateway.creation_failure_threshold);
        ReadMillis(g, "default_timeout_ms", snapshot.gateway.default_timeout);
        ReadMillis(g, "slow_request_warning_ms", snapshot.gateway.slow_request_warning);
        ReadField(g, "allow_ast_only_fallback", snapshot.gateway.allow_ast_only_fallback);
    }

    if (document.contains("audit")) {
        const auto& a = document.at("audit");
        std::string directory = snapshot.audit.directory.string();
        ReadField(a, "directory", directory);
        snapshot.audit.directory = directory;
        ReadMillis(a, "retry_backoff_ms", snapshot.audit.retry_backoff);
        ReadField(a, "alert_after_failures", snapshot.audit.alert_after_failures);
        ReadField(a, "retention_days", snapshot.audit.retention_days);
    }
}

} // anonymous namespace

// ============================================================================
// POLICY SNAPSHOT
// ============================================================================

PolicySnapshot PolicySnapshot::Defaults() {
    PolicySnapshot snapshot;
    ApplyCapabilityDefaults(snapshot.validator);
    ApplyIsolationDefaults(snapshot.isolation);

    snapshot.network.allowed_domains = {"pypi.org", "files.pythonhosted.org"};
    snapshot.network.denied_ranges = {
        "10.0.0.0/8", "172.16.0.0/12", "192.168.0.0/16", "169.254.0.0/16", "127.0.0.0/8"
    };

    snapshot.pool.target_sizes = {
        {IsolationLevel::CONTAINER, 2},
        {IsolationLevel::NAMESPACE_SANDBOX, 2}
    };

    return snapshot;
}

PolicySnapshot PolicySnapshot::FromJson(const json& document) {
    if (!document.is_object()) {
        throw PolicyError("Policy document must be a JSON object");
    }

    PolicySnapshot snapshot = Defaults();
    try {
        OverlayDocument(document, snapshot);
    } catch (const json::exception& e) {
        throw PolicyError("Malformed policy document: " + std::string(e.what()));
    }

    snapshot.Validate();
    return snapshot;
}

PolicySnapshot PolicySnapshot::LoadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw PolicyError("Cannot open policy file: " + path.string());
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw PolicyError("Policy file is not valid JSON: " + std::string(e.what()));
    }

    auto snapshot = FromJson(document);
    spdlog::info("[POLICY] Loaded policy version {} from {}", snapshot.version, path.string());
    return snapshot;
}

json PolicySnapshot::ToJson() const {
    json ceilings = json::object();
    for (const auto& [level, budget] : isolation.ceilings) {
        ceilings[ToString(level)] = BudgetToJson(budget);
    }

    json runtimes = json::object();
    for (const auto& [level, runtime] : isolation.oci_runtimes) {
        runtimes[ToString(level)] = runtime;
    }

    json commands = json::object();
    for (const auto& [type, argv] : isolation.runtime_commands) {
        commands[ToString(type)] = argv;
    }

    json targets = json::object();
    for (const auto& [level, size] : pool.target_sizes) {
        targets[ToString(level)] = size;
    }

    return {
        {"version", version},
        {"operator_registry_version", operator_registry_version},
        {"validator", {
            {"denied_calls", validator.denied_calls},
            {"denied_modules", validator.denied_modules},
            {"denied_attributes", validator.denied_attributes},
            {"allowed_calls", validator.allowed_calls},
            {"allowed_modules", validator.allowed_modules},
            {"expression_operators", validator.expression_operators},
            {"expression_aliases", validator.expression_aliases},
            {"expression_series", validator.expression_series},
            {"allowed_constants", validator.allowed_constants},
            {"max_depth", validator.max_depth},
            {"max_nodes", validator.max_nodes},
            {"max_complexity", validator.max_complexity},
            {"max_imports", validator.max_imports},
            {"max_content_bytes", validator.max_content_bytes},
            {"max_lines", validator.max_lines},
            {"strict_calls", validator.strict_calls},
            {"prompt", {{"max_bytes", validator.prompt_max_bytes},
                        {"injection_markers", validator.injection_markers}}},
            {"config", {{"max_bytes", validator.config_max_bytes},
                        {"max_depth", validator.config_max_depth},
                        {"denied_patterns", validator.config_denied_patterns}}}
        }},
        {"isolation", {
            {"ceilings", ceilings},
            {"oci_runtimes", runtimes},
            {"runtime_commands", commands},
            {"container_binary", isolation.container_binary},
            {"container_image", isolation.container_image},
            {"sandbox_user", isolation.sandbox_user},
            {"egress_network", isolation.egress_network},
            {"max_open_files", isolation.max_open_files},
            {"max_output_bytes", isolation.max_output_bytes}
        }},
        {"network", {
            {"allowed_domains", network.allowed_domains},
            {"denied_ranges", network.denied_ranges},
            {"repeat_violation_threshold", network.repeat_violation_threshold},
            {"repeat_violation_window_s", network.repeat_violation_window.count()},
            {"traffic_log_capacity", network.traffic_log_capacity}
        }},
        {"pool", {
            {"target_sizes", targets},
            {"min_size", pool.min_size},
            {"max_size", pool.max_size},
            {"lease_grace_period_ms", pool.lease_grace_period.count()},
            {"grow_latency_threshold_ms", pool.grow_latency_threshold.count()},
            {"shrink_idle_period_s", pool.shrink_idle_period.count()},
            {"maintenance_interval_ms", pool.maintenance_interval.count()},
            {"create_timeout_ms", pool.create_timeout.count()}
        }},
        {"gateway", {
            {"creation_failure_threshold", gateway.creation_failure_threshold},
            {"default_timeout_ms", gateway.default_timeout.count()},
            {"slow_request_warning_ms", gateway.slow_request_warning.count()},
            {"allow_ast_only_fallback", gateway.allow_ast_only_fallback}
        }},
        {"audit", {
            {"directory", audit.directory.string()},
            {"retry_backoff_ms", audit.retry_backoff.count()},
            {"alert_after_failures", audit.alert_after_failures},
            {"retention_days", audit.retention_days}
        }}
    };
}

void PolicySnapshot::Validate() const {
    CheckDisjoint(validator.allowed_calls, validator.denied_calls, "calls");
    CheckDisjoint(validator.expression_operators, validator.denied_calls, "expression operators");
    CheckDisjoint(validator.allowed_modules, validator.denied_modules, "modules");
    CheckDisjoint(validator.allowed_constants, validator.denied_calls, "constants");

    for (const auto& range : network.denied_ranges) {
        if (!utils::StringUtils::ParseCIDR(range)) {
            throw PolicyError("Invalid denied range: " + range);
        }
    }

    if (validator.max_depth == 0 || validator.max_nodes == 0 || validator.max_complexity == 0) {
        throw PolicyError("Validator limits must be positive");
    }
    if (gateway.creation_failure_threshold <= 0) {
        throw PolicyError("creation_failure_threshold must be positive");
    }
    if (pool.min_size > pool.max_size) {
        throw PolicyError("pool.min_size exceeds pool.max_size");
    }
    for (const auto& [type, argv] : isolation.runtime_commands) {
        if (argv.empty()) {
            throw PolicyError("Empty runtime command for " + ToString(type));
        }
    }
}

ResourceBudget PolicySnapshot::CeilingFor(IsolationLevel level) const {
    auto it = isolation.ceilings.find(level);
    return it != isolation.ceilings.end() ? it->second : ResourceBudget{};
}

// ============================================================================
// STATIC OPERATOR REGISTRY
// ============================================================================

StaticOperatorRegistry::StaticOperatorRegistry(std::set<std::string> operators)
    : operators_(std::move(operators)) {
}

std::uint64_t StaticOperatorRegistry::Version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

std::set<std::string> StaticOperatorRegistry::Operators() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operators_;
}

void StaticOperatorRegistry::AddOperator(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (operators_.insert(name).second) {
        ++version_;
    }
}

void StaticOperatorRegistry::RemoveOperator(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (operators_.erase(name) > 0) {
        ++version_;
    }
}

// ============================================================================
// POLICY STORE
// ============================================================================

PolicyStore::PolicyStore(PolicySnapshot initial, std::shared_ptr<OperatorRegistry> registry)
    : registry_(std::move(registry))
    , base_(std::move(initial)) {
    auto merged = Merge(base_);
    std::atomic_store(&active_, merged);
    generation_ = 1;
    spdlog::info("[POLICY] Active policy version {} (registry version {})",
                 merged->version, merged->operator_registry_version);
}

std::shared_ptr<const PolicySnapshot> PolicyStore::Current() const {
    auto snapshot = std::atomic_load(&active_);
    if (registry_) {
        auto version = registry_->Version();
        if (version == snapshot->operator_registry_version ||
            version == rejected_registry_version_.load()) {
            return snapshot;
        }
        RefreshOperators();
        snapshot = std::atomic_load(&active_);
    }
    return snapshot;
}

void PolicyStore::Replace(PolicySnapshot next) {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    // Merge validates; on failure the active snapshot stays in place
    auto merged = Merge(next);
    base_ = std::move(next);
    std::atomic_store(&active_, merged);
    ++generation_;

    spdlog::info("[POLICY] Reloaded policy version {} (generation {})",
                 merged->version, generation_.load());
}

std::uint64_t PolicyStore::Generation() const {
    return generation_.load();
}

std::shared_ptr<const PolicySnapshot> PolicyStore::Merge(const PolicySnapshot& base) const {
    PolicySnapshot merged = base;
    if (registry_) {
        merged.operator_registry_version = registry_->Version();
        for (const auto& op : registry_->Operators()) {
            merged.validator.expression_operators.insert(op);
        }
    }
    merged.Validate();
    return std::make_shared<const PolicySnapshot>(std::move(merged));
}

void PolicyStore::RefreshOperators() const {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    auto current = std::atomic_load(&active_);
    if (registry_->Version() == current->operator_registry_version) {
        return;  // Another thread refreshed first
    }

    try {
        auto merged = Merge(base_);
        std::atomic_store(&active_, merged);
        ++generation_;
        spdlog::info("[POLICY] Operator registry advanced to version {}",
                     merged->operator_registry_version);
    } catch (const PolicyError& e) {
        // Keep serving the previous snapshot until the registry moves again
        rejected_registry_version_ = registry_->Version();
        spdlog::error("[POLICY] Rejected operator registry update: {}", e.what());
    }
}

} // namespace core
} // namespace warden
