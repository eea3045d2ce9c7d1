/**
 * @file capability_validator.hpp
 * @brief Static capability analysis of untrusted content
 *
 * The first line of defense. Code and expressions are parsed into a syntax
 * tree and every call, import and attribute access is classified against the
 * active policy snapshot: denied names are reported as BLACKLIST_DETECTED,
 * anything outside the allow-lists as VALIDATION_FAILED. Prompts are scanned
 * for injection markers and configuration documents for denied patterns.
 * Script found inside a prompt or a configuration string is also held to the
 * code rules.
 *
 * **Guarantees**:
 * - Deterministic and side-effect free; content is never executed
 * - Every violation is collected, not just the first
 * - Malformed input yields a VALIDATION_FAILED result, never an exception
 * - One policy snapshot is read per call
 *
 * @date 2025
 */

#pragma once

#include "warden/core/policy.hpp"
#include "warden/core/types.hpp"
#include "warden/validators/syntax_tree.hpp"

#include <memory>
#include <string>

namespace warden {
namespace validators {

/**
 * @class CapabilityValidator
 * @brief Classifies content against the capability policy
 *
 * **Usage Example**:
 * @code
 * auto store = std::make_shared<core::PolicyStore>(core::PolicySnapshot::Defaults());
 * CapabilityValidator validator(store);
 *
 * auto result = validator.Validate("rank(delta(close, 5))", core::ContentType::EXPRESSION);
 * if (!result.approved) {
 *     for (const auto& v : result.violations) {
 *         spdlog::warn("{}: {}", core::ToString(v.kind), v.detail);
 *     }
 * }
 * @endcode
 *
 * **Thread Safety**: All methods are const and may be called concurrently.
 */
class CapabilityValidator {
public:
    explicit CapabilityValidator(std::shared_ptr<core::PolicyStore> policy);

    /**
     * @brief Validate raw content
     * @param content Untrusted artifact
     * @param type Rules to apply
     * @return Terminal validation result
     */
    core::ValidationResult Validate(const std::string& content, core::ContentType type) const;

    /**
     * @brief Validate a syntax tree built by an external producer
     *
     * Used for expression trees that were parsed upstream. The content hash
     * is computed over the canonical tree dump.
     */
    core::ValidationResult ValidateTree(const Node& tree,
                                        core::ContentType type = core::ContentType::EXPRESSION) const;

    /**
     * @brief Infer the content type from surface features
     *
     * A JSON object or array is CONFIG. Statement keywords, assignments and
     * dynamic-execution markers make CODE. Calls to expression operators or
     * arithmetic over market series make EXPRESSION. Anything else is PROMPT.
     */
    core::ContentType DetectContentType(const std::string& content) const;

private:
    void ValidateScript(const std::string& content, core::ContentType type,
                        const core::PolicySnapshot& policy, core::ValidationResult& result) const;
    void ValidatePrompt(const std::string& content, const core::PolicySnapshot& policy,
                        core::ValidationResult& result) const;
    void ValidateConfig(const std::string& content, const core::PolicySnapshot& policy,
                        core::ValidationResult& result) const;
    core::ContentType DetectContentType(const std::string& content,
                                        const core::PolicySnapshot& policy) const;
    void ValidateEmbeddedCode(const std::string& content, const std::string& origin,
                              const core::PolicySnapshot& policy, core::ValidationResult& result) const;

    std::shared_ptr<core::PolicyStore> policy_;
};

} // namespace validators
} // namespace warden
