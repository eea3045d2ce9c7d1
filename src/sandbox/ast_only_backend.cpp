/**
 * @file ast_only_backend.cpp
 * @brief Non-executing environment for the AST-only tier
 * @date 2025
 */

#include "warden/sandbox/ast_only_backend.hpp"

#include <spdlog/spdlog.h>

namespace warden {
namespace sandbox {

AstOnlyEnvironment::AstOnlyEnvironment(std::string id)
    : id_(std::move(id)) {
}

core::ExecutionResult AstOnlyEnvironment::Execute(const ExecutionRequest& request) {
    spdlog::info("[BACKEND] {} not executed for {}: AST-only isolation",
                 core::ToString(request.content_type), request.context.ComponentName());

    core::ExecutionResult result;
    result.success = true;
    result.classification = core::ExitClassification::NOT_EXECUTED;
    result.isolation_level = core::IsolationLevel::NONE_AST_ONLY;
    result.exit_code = 0;
    return result;
}

std::unique_ptr<SandboxEnvironment> AstOnlyBackend::Create(std::chrono::milliseconds /*budget*/) {
    return std::make_unique<AstOnlyEnvironment>("ast-only-" + std::to_string(next_id_++));
}

} // namespace sandbox
} // namespace warden
