/**
 * @file ast_only_backend.hpp
 * @brief Bottom rung of the ladder: static analysis only
 *
 * Environments at this level never run anything. Execute() reports a
 * successful NOT_EXECUTED outcome so approved content still gets a
 * definitive answer when every executing tier is unavailable.
 *
 * @date 2025
 */

#pragma once

#include "warden/sandbox/sandbox_backend.hpp"

#include <atomic>

namespace warden {
namespace sandbox {

class AstOnlyEnvironment : public SandboxEnvironment {
public:
    explicit AstOnlyEnvironment(std::string id);

    const std::string& Id() const override { return id_; }
    core::IsolationLevel Level() const override { return core::IsolationLevel::NONE_AST_ONLY; }

    core::ExecutionResult Execute(const ExecutionRequest& request) override;
    bool Reset() override { return true; }
    void Destroy() override {}

private:
    std::string id_;
};

class AstOnlyBackend : public SandboxBackend {
public:
    core::IsolationLevel Level() const override { return core::IsolationLevel::NONE_AST_ONLY; }
    std::string Name() const override { return "ast-only"; }

    std::unique_ptr<SandboxEnvironment> Create(std::chrono::milliseconds budget) override;

private:
    std::atomic<std::uint64_t> next_id_{1};
};

} // namespace sandbox
} // namespace warden
