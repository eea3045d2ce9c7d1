/**
 * @file main.cpp
 * @brief Warden Security Gateway - Command-line interface
 *
 * Entry point for offline checks and one-shot gated execution:
 *
 * - `warden validate --type code --file factor.py` prints the validation result
 * - `warden run --type expression --content "mean(close)" --isolation namespace`
 *   validates, executes and audits
 * - `warden verify-audit [file]` checks the audit hash chain
 *
 * Exit codes: 0 approved/succeeded/verified, 1 rejected/failed/tampered,
 * 2 usage errors.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "warden/audit/audit_logger.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/policy.hpp"
#include "warden/core/security_gateway.hpp"
#include "warden/validators/capability_validator.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;
using warden::core::ToJson;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

/*******************************************************************************
 * Input Handling
 ******************************************************************************/

struct ContentOptions {
    std::string type = "code";
    std::string file;
    std::string content;
};

void AddContentOptions(CLI::App* command, ContentOptions& options) {
    command->add_option("-t,--type", options.type, "Content type: code, prompt, config, expression")
        ->default_val("code");
    auto* file = command->add_option("-f,--file", options.file, "Read content from a file")
        ->check(CLI::ExistingFile);
    auto* content = command->add_option("-c,--content", options.content, "Content given inline");
    file->excludes(content);
}

std::string ReadContent(const ContentOptions& options) {
    if (options.file.empty()) {
        return options.content;
    }

    std::ifstream in(options.file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read " + options.file);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

warden::core::PolicySnapshot LoadPolicy(const std::string& policy_path, const std::string& audit_dir) {
    auto policy = policy_path.empty() ? warden::core::PolicySnapshot::Defaults()
                                      : warden::core::PolicySnapshot::LoadFile(policy_path);
    if (!audit_dir.empty()) {
        policy.audit.directory = audit_dir;
    }
    return policy;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Warden Security Gateway"};
    app.require_subcommand(1);

    std::string policy_path;
    std::string audit_dir;
    bool verbose = false;

    app.add_option("-p,--policy", policy_path, "Policy document (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("--audit-dir", audit_dir, "Audit log directory (overrides the policy)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // validate
    ContentOptions validate_options;
    auto* validate_cmd = app.add_subcommand("validate", "Static capability analysis only");
    AddContentOptions(validate_cmd, validate_options);

    // run
    ContentOptions run_options;
    std::string isolation = "container";
    std::string component = "cli";
    int timeout_ms = 30000;
    std::size_t memory_mb = 512;
    std::vector<std::string> egress;
    std::string user_id;
    std::string session_id;

    auto* run_cmd = app.add_subcommand("run", "Validate, execute in a sandbox and audit");
    AddContentOptions(run_cmd, run_options);
    run_cmd->add_option("-i,--isolation", isolation,
                        "microvm, userspace_kernel, container, namespace, ast_only")
        ->default_val("container");
    run_cmd->add_option("--timeout-ms", timeout_ms, "Request deadline in milliseconds")
        ->default_val(30000)
        ->check(CLI::PositiveNumber);
    run_cmd->add_option("--memory-mb", memory_mb, "Memory budget in MB")
        ->default_val(512)
        ->check(CLI::PositiveNumber);
    run_cmd->add_option("--component", component, "Requesting component name")
        ->default_val("cli");
    run_cmd->add_option("--egress", egress, "Network destination the content needs (repeatable)");
    run_cmd->add_option("--user", user_id, "User on whose behalf the content runs");
    run_cmd->add_option("--session", session_id, "Session id to correlate audit records");

    // verify-audit
    std::string audit_file;
    auto* verify_cmd = app.add_subcommand("verify-audit", "Verify the audit hash chain");
    verify_cmd->add_option("file", audit_file, "Single audit file (default: whole audit directory)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        return app.exit(e);
    } catch (const CLI::CallForAllHelp& e) {
        return app.exit(e);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return kExitUsage;
    }

    // Configure logging level and format
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        auto policy = LoadPolicy(policy_path, audit_dir);

        if (*validate_cmd) {
            auto type = warden::core::ParseContentType(validate_options.type);
            if (!type) {
                spdlog::error("[CLI] Unknown content type '{}'", validate_options.type);
                return kExitUsage;
            }

            auto store = std::make_shared<warden::core::PolicyStore>(std::move(policy));
            warden::validators::CapabilityValidator validator(store);
            auto result = validator.Validate(ReadContent(validate_options), *type);

            std::cout << ToJson(result).dump(2) << std::endl;
            return result.approved ? kExitOk : kExitFailed;
        }

        if (*run_cmd) {
            auto type = warden::core::ParseContentType(run_options.type);
            auto level = warden::core::ParseIsolationLevel(isolation);
            if (!type || !level) {
                spdlog::error("[CLI] Unknown {} '{}'", type ? "isolation level" : "content type",
                              type ? isolation : run_options.type);
                return kExitUsage;
            }

            auto content = ReadContent(run_options);

            warden::core::ResourceBudget budget;
            budget.max_memory_mb = memory_mb;
            budget.max_wall_time = std::chrono::milliseconds(timeout_ms);

            warden::core::SecurityContextBuilder builder;
            builder.WithComponent(component)
                .WithUser(user_id)
                .WithSession(session_id)
                .WithIsolation(*level)
                .WithBudget(budget)
                .WithTimeout(std::chrono::milliseconds(timeout_ms));
            for (const auto& destination : egress) {
                builder.WithEgress(destination);
            }
            auto context = builder.Build();

            warden::core::GatewayComponents components;
            components.policy_store = std::make_shared<warden::core::PolicyStore>(std::move(policy));
            components.start_pool_maintenance = false;

            warden::core::SecurityGateway gateway(std::move(components));
            auto result = gateway.ValidateAndExecute(content, *type, context);
            gateway.Shutdown();

            std::cout << ToJson(result).dump(2) << std::endl;
            return result.Succeeded() ? kExitOk : kExitFailed;
        }

        if (*verify_cmd) {
            std::size_t verified = audit_file.empty()
                ? warden::audit::AuditLogger::VerifyDirectory(policy.audit.directory)
                : warden::audit::AuditLogger::VerifyIntegrity(audit_file);

            spdlog::info("[AUDIT] {} records verified", verified);
            return kExitOk;
        }

    } catch (const warden::core::IntegrityError& e) {
        spdlog::error("[AUDIT] Integrity check failed: {}", e.what());
        return kExitFailed;
    } catch (const warden::core::PolicyError& e) {
        spdlog::error("[CONFIG] Invalid policy ({}): {}", warden::core::ToString(e.Kind()), e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return kExitFailed;
    }

    return kExitUsage;
}
