/**
 * @file capability_validator.cpp
 * @brief Implementation of static capability analysis
 *
 * **Analysis Pipeline**:
 * ```
 * content ──► size / line bounds ──► parse ──► bind imports + local names
 *                                                   │
 *         ValidationResult ◄── limits ◄── classify calls, imports, attributes
 * ```
 *
 * The tree walk is iterative so hostile trees handed in through
 * ValidateTree() cannot exhaust the stack.
 *
 * @date 2025
 */

#include "warden/validators/capability_validator.hpp"
#include "warden/validators/script_parser.hpp"
#include "warden/utils/hash_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

using json = nlohmann::json;

namespace warden {
namespace validators {

using core::ContentType;
using core::ValidationResult;
using core::ViolationKind;
using utils::StringUtils;

namespace {

constexpr int kBlacklistWeight = 40;
constexpr int kNetworkWeight = 30;
constexpr int kValidationWeight = 15;
constexpr int kStructuralWeight = 10;

const std::set<std::string> kPermittedDunders = {"__name__", "__doc__"};
const std::set<std::string> kPermittedDunderAttributes = {"__name__", "__doc__", "__init__"};

/// Substrings that only occur in executable script
const std::vector<std::string> kCodeMarkers = {
    "eval(", "exec(", "compile(", "__import__", "__builtins__", "__class__", "__globals__",
    "__subclasses__", ".system(", "subprocess.", "lambda:"
};

void AddViolation(ValidationResult& result, ViolationKind kind, std::string detail,
                  std::string subject = {}, int line = 0, int column = 0, int weight = -1) {
    core::Violation violation;
    violation.kind = kind;
    violation.detail = std::move(detail);
    violation.subject = std::move(subject);
    if (line > 0) {
        violation.line = line;
        violation.column = column;
    }
    result.violations.push_back(std::move(violation));

    if (weight < 0) {
        switch (kind) {
            case ViolationKind::BLACKLIST_DETECTED: weight = kBlacklistWeight; break;
            case ViolationKind::NETWORK_VIOLATION:  weight = kNetworkWeight; break;
            default:                                weight = kValidationWeight; break;
        }
    }
    result.risk_score += weight;
}

/// Convert a byte offset into a 1-based line and column
std::pair<int, int> LocateOffset(const std::string& content, std::size_t offset) {
    int line = 1;
    std::size_t line_start = 0;
    for (std::size_t i = 0; i < offset && i < content.size(); ++i) {
        if (content[i] == '\n') {
            ++line;
            line_start = i + 1;
        }
    }
    return {line, static_cast<int>(offset - line_start) + 1};
}

bool IsDunder(const std::string& name) {
    return name.size() > 4 && StringUtils::StartsWith(name, "__") && StringUtils::EndsWith(name, "__");
}

bool IsIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// Length of the dotted identifier at the start of text, 0 if none
std::size_t DottedNameLength(const std::string& text) {
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text[0])) || !IsIdentifierChar(text[0])) {
        return 0;
    }
    std::size_t i = 0;
    while (i < text.size() && (IsIdentifierChar(text[i]) || text[i] == '.')) {
        ++i;
    }
    return i;
}

/// Line opens a statement: keyword form, decorator or plain assignment
bool LooksLikeStatement(const std::string& raw) {
    auto line = StringUtils::Trim(raw);
    if (line.empty() || line[0] == '#') {
        return false;
    }

    for (const char* keyword : {"def ", "async def ", "class ", "import ", "return ", "raise ",
                                "global ", "nonlocal ", "@"}) {
        if (StringUtils::StartsWith(line, keyword)) {
            return true;
        }
    }
    if (StringUtils::StartsWith(line, "from ") && StringUtils::Contains(line, " import ")) {
        return true;
    }
    for (const char* block : {"if ", "elif ", "for ", "async for ", "while ", "with ", "try",
                              "except", "else", "finally"}) {
        if (StringUtils::StartsWith(line, block) && StringUtils::EndsWith(line, ":")) {
            return true;
        }
    }

    auto name = DottedNameLength(line);
    if (name == 0) {
        return false;
    }
    auto rest = StringUtils::Trim(line.substr(name));
    return rest.size() > 1 && rest[0] == '=' && rest[1] != '=';
}

/// Line is a single call statement such as `run(x)` or `obj.method()`
bool LooksLikeCallStatement(const std::string& raw) {
    auto line = StringUtils::Trim(raw);
    auto name = DottedNameLength(line);
    return name > 0 && name < line.size() && line[name] == '(' && line.back() == ')';
}

/**
 * @class TreeAnalyzer
 * @brief Walks one syntax tree and classifies every node against the policy
 */
class TreeAnalyzer {
public:
    TreeAnalyzer(const core::PolicySnapshot& policy, ContentType type, ValidationResult& result)
        : rules_(policy.validator), type_(type), result_(result) {
        if (type_ == ContentType::EXPRESSION) {
            for (const auto& [alias, module] : rules_.expression_aliases) {
                bindings_[alias] = module;
                module_names_.insert(alias);
            }
        }
    }

    void Analyze(const Node& root) {
        CollectBindings(root);
        Walk(root);

        if (type_ == ContentType::EXPRESSION) {
            CheckExpressionShape(root);
        }
        CheckLimits();
    }

private:
    // ------------------------------------------------------------------------
    // Binding pre-pass
    // ------------------------------------------------------------------------

    void CollectBindings(const Node& root) {
        std::vector<const Node*> stack{&root};
        while (!stack.empty()) {
            const Node* node = stack.back();
            stack.pop_back();

            switch (node->kind) {
                case NodeKind::IMPORT:
                    for (const auto& alias : node->children) {
                        auto root_name = alias->text.substr(0, alias->text.find('.'));
                        if (alias->alias.empty()) {
                            bindings_[root_name] = root_name;
                            module_names_.insert(root_name);
                        } else {
                            bindings_[alias->alias] = alias->text;
                            module_names_.insert(alias->alias);
                        }
                    }
                    break;
                case NodeKind::IMPORT_FROM:
                    for (const auto& alias : node->children) {
                        if (alias->text == "*" || StringUtils::StartsWith(node->text, ".")) {
                            continue;
                        }
                        const auto& local = alias->alias.empty() ? alias->text : alias->alias;
                        bindings_[local] = node->text + "." + alias->text;
                    }
                    break;
                case NodeKind::FUNCTION_DEF:
                case NodeKind::CLASS_DEF:
                case NodeKind::EXCEPT_HANDLER:
                    if (!node->text.empty()) {
                        defined_names_.insert(node->text);
                    }
                    break;
                case NodeKind::ARG: {
                    auto name = node->text;
                    name.erase(0, name.find_first_not_of('*'));
                    defined_names_.insert(name);
                    break;
                }
                case NodeKind::ASSIGN:
                    for (std::size_t i = 0; i + 1 < node->children.size(); ++i) {
                        CollectTargets(*node->children[i]);
                    }
                    break;
                case NodeKind::AUG_ASSIGN:
                case NodeKind::ANN_ASSIGN:
                case NodeKind::FOR:
                case NodeKind::COMPREHENSION:
                case NodeKind::NAMED_EXPR:
                    if (!node->children.empty()) {
                        CollectTargets(*node->children.front());
                    }
                    break;
                case NodeKind::WITH_ITEM:
                    if (node->children.size() > 1) {
                        CollectTargets(*node->children[1]);
                    }
                    break;
                case NodeKind::GLOBAL:
                case NodeKind::NONLOCAL:
                    for (const auto& child : node->children) {
                        defined_names_.insert(child->text);
                    }
                    break;
                default:
                    break;
            }

            for (const auto& child : node->children) {
                stack.push_back(child.get());
            }
        }
    }

    void CollectTargets(const Node& target) {
        switch (target.kind) {
            case NodeKind::NAME:
                defined_names_.insert(target.text);
                break;
            case NodeKind::TUPLE:
            case NodeKind::LIST:
            case NodeKind::STARRED:
                for (const auto& child : target.children) {
                    CollectTargets(*child);
                }
                break;
            default:
                break;  // attribute and subscript targets bind nothing new
        }
    }

    // ------------------------------------------------------------------------
    // Classification walk
    // ------------------------------------------------------------------------

    void Walk(const Node& root) {
        std::vector<std::pair<const Node*, std::size_t>> stack{{&root, 1}};

        while (!stack.empty()) {
            auto [node, depth] = stack.back();
            stack.pop_back();

            ++result_.metrics.node_count;
            result_.metrics.max_depth = std::max(result_.metrics.max_depth, depth);

            Classify(*node);

            for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
                stack.emplace_back(it->get(), depth + 1);
            }
        }
    }

    void Classify(const Node& node) {
        switch (node.kind) {
            case NodeKind::IMPORT:
                for (const auto& alias : node.children) {
                    CheckImport(alias->text, *alias);
                }
                break;

            case NodeKind::IMPORT_FROM:
                CheckFromImport(node);
                break;

            case NodeKind::CALL:
                CheckCall(node);
                break;

            case NodeKind::NAME:
                CheckName(node);
                break;

            case NodeKind::ATTRIBUTE:
                CheckAttribute(node);
                break;

            case NodeKind::SUBSCRIPT:
                CheckSubscript(node);
                break;

            case NodeKind::STRING:
            case NodeKind::JOINED_STRING:
                RecordDestination(node.text);
                break;

            // Decision points
            case NodeKind::IF:
            case NodeKind::FOR:
            case NodeKind::WHILE:
            case NodeKind::EXCEPT_HANDLER:
            case NodeKind::IF_EXP:
                ++result_.metrics.complexity;
                break;
            case NodeKind::BOOL_OP:
                result_.metrics.complexity += node.children.size() > 1 ? node.children.size() - 1 : 0;
                break;
            case NodeKind::COMPREHENSION:
                // target, iter, then one child per `if` clause
                result_.metrics.complexity += 1 + (node.children.size() > 2 ? node.children.size() - 2 : 0);
                break;

            default:
                break;
        }
    }

    // ------------------------------------------------------------------------
    // Imports
    // ------------------------------------------------------------------------

    /// Longest denied module that is a dotted prefix of name
    std::optional<std::string> DeniedModule(const std::string& name) const {
        auto parts = StringUtils::Split(name, '.');
        std::string prefix;
        for (const auto& part : parts) {
            prefix += prefix.empty() ? part : "." + part;
            if (rules_.denied_modules.count(prefix)) {
                return prefix;
            }
        }
        return std::nullopt;
    }

    bool IsAllowedModule(const std::string& name) const {
        auto parts = StringUtils::Split(name, '.');
        std::string prefix;
        for (const auto& part : parts) {
            prefix += prefix.empty() ? part : "." + part;
            if (rules_.allowed_modules.count(prefix)) {
                return true;
            }
        }
        return false;
    }

    void CheckImport(const std::string& module, const Node& at) {
        imported_roots_.insert(module.substr(0, module.find('.')));

        if (auto denied = DeniedModule(module)) {
            AddViolation(result_, ViolationKind::BLACKLIST_DETECTED,
                         "Import of restricted module '" + module + "'",
                         *denied, at.line, at.column);
        }

        if (type_ == ContentType::EXPRESSION) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Imports are not permitted in expressions", module, at.line, at.column);
        } else if (!DeniedModule(module) && !IsAllowedModule(module)) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Module '" + module + "' is not on the allow-list",
                         module, at.line, at.column);
        }
    }

    void CheckFromImport(const Node& node) {
        if (StringUtils::StartsWith(node.text, ".")) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Relative imports are not permitted", node.text, node.line, node.column);
            return;
        }

        CheckImport(node.text, node);

        for (const auto& alias : node.children) {
            if (alias->text == "*") {
                AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                             "Wildcard import from '" + node.text + "'",
                             node.text, alias->line, alias->column);
                continue;
            }

            auto qualified = node.text + "." + alias->text;
            if (rules_.denied_calls.count(qualified)) {
                AddViolation(result_, ViolationKind::BLACKLIST_DETECTED,
                             "Import of restricted function '" + qualified + "'",
                             qualified, alias->line, alias->column);
            }
        }
    }

    // ------------------------------------------------------------------------
    // Calls and names
    // ------------------------------------------------------------------------

    /// Dotted name of a callee after alias resolution, std::nullopt for computed receivers
    std::optional<std::string> Resolve(const Node& callee, const Node** root) const {
        std::vector<const std::string*> attributes;
        const Node* current = &callee;
        while (current->kind == NodeKind::ATTRIBUTE && !current->children.empty()) {
            attributes.push_back(&current->text);
            current = current->children.front().get();
        }
        if (current->kind != NodeKind::NAME) {
            return std::nullopt;
        }
        *root = current;

        auto it = bindings_.find(current->text);
        std::string name = it != bindings_.end() ? it->second : current->text;
        for (auto attr = attributes.rbegin(); attr != attributes.rend(); ++attr) {
            name += "." + **attr;
        }
        return name;
    }

    bool IsAllowedCall(const std::string& name) const {
        return rules_.allowed_calls.count(name) > 0 || rules_.expression_operators.count(name) > 0;
    }

    void CheckCall(const Node& call) {
        if (call.children.empty()) {
            return;
        }

        const Node* root = nullptr;
        const Node& callee = *call.children.front();
        auto name = Resolve(callee, &root);
        CoverChain(callee);

        if (!name) {
            // Method on a computed value: f(x).y(), [..].z()
            if (type_ == ContentType::EXPRESSION) {
                AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                             "Call on a computed value is not permitted in expressions",
                             {}, call.line, call.column);
            } else if (rules_.strict_calls) {
                AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                             "Call target could not be resolved", {}, call.line, call.column);
            }
            return;
        }

        if (rules_.denied_calls.count(*name)) {
            reported_roots_.insert(root);
            AddViolation(result_, ViolationKind::BLACKLIST_DETECTED,
                         "Call to restricted function '" + *name + "'",
                         *name, call.line, call.column);
            return;
        }

        bool qualified = name->find('.') != std::string::npos;
        bool module_receiver = IsModuleBound(root->text);
        bool local_receiver = defined_names_.count(root->text) > 0 && !module_receiver;

        if (qualified && !local_receiver) {
            if (auto denied = DeniedModule(*name)) {
                reported_roots_.insert(root);
                AddViolation(result_, ViolationKind::BLACKLIST_DETECTED,
                             "Call into restricted module '" + *denied + "'",
                             *name, call.line, call.column);
                return;
            }
        }

        if (IsAllowedCall(*name)) {
            return;
        }

        if (type_ == ContentType::EXPRESSION) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Call to '" + *name + "' is not an allowed expression operator",
                         *name, call.line, call.column);
            return;
        }

        // Code: imported members must be allow-listed, even with strict_calls off
        if (module_receiver) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Call to '" + *name + "' is not on the allow-list",
                         *name, call.line, call.column);
            return;
        }

        // Local definitions and methods on values are fine
        if (defined_names_.count(root->text) || qualified) {
            return;
        }
        if (rules_.strict_calls) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Call to '" + *name + "' is not on the allow-list",
                         *name, call.line, call.column);
        }
    }

    void CheckName(const Node& node) {
        if (reported_roots_.count(&node)) {
            return;
        }

        // The expression prelude rebinds market series such as `open`
        bool series = type_ == ContentType::EXPRESSION && rules_.expression_series.count(node.text) > 0;
        if (!series && rules_.denied_calls.count(node.text)) {
            AddViolation(result_, ViolationKind::BLACKLIST_DETECTED,
                         "Reference to restricted builtin '" + node.text + "'",
                         node.text, node.line, node.column);
            return;
        }

        if (IsDunder(node.text) && !kPermittedDunders.count(node.text)) {
            AddViolation(result_, ViolationKind::BLACKLIST_DETECTED,
                         "Reference to special name '" + node.text + "'",
                         node.text, node.line, node.column);
            return;
        }

        if (covered_.count(&node) || !IsModuleBound(node.text)) {
            return;
        }
        const auto& target = bindings_.at(node.text);
        if (module_names_.count(node.text)) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Module '" + target + "' used as a value",
                         target, node.line, node.column);
            return;
        }
        CheckMemberReference(target, node);
    }

    void CheckAttribute(const Node& node) {
        if (rules_.denied_attributes.count(node.text)
            || (IsDunder(node.text) && !kPermittedDunderAttributes.count(node.text))) {
            AddViolation(result_, ViolationKind::BLACKLIST_DETECTED,
                         "Access to restricted attribute '" + node.text + "'",
                         node.text, node.line, node.column);
        }

        if (covered_.count(&node)) {
            return;
        }
        const Node* root = nullptr;
        auto name = Resolve(node, &root);
        if (!name || !IsModuleBound(root->text)) {
            return;
        }
        CoverChain(node);
        CheckMemberReference(*name, node);
    }

    /// Module member used as a value rather than called, e.g. `g = np.genfromtxt`
    void CheckMemberReference(const std::string& name, const Node& at) {
        if (rules_.denied_calls.count(name)) {
            AddViolation(result_, ViolationKind::BLACKLIST_DETECTED,
                         "Reference to restricted function '" + name + "'",
                         name, at.line, at.column);
        } else if (!IsAllowedCall(name) && !rules_.allowed_constants.count(name)) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Reference to '" + name + "' is not on the allow-list",
                         name, at.line, at.column);
        }
    }

    /// String keys reach the same objects attribute access does: f_builtins['__import__']
    void CheckSubscript(const Node& node) {
        if (node.children.size() < 2 || node.children[1]->kind != NodeKind::STRING) {
            return;
        }
        const auto& key = node.children[1]->text;
        bool builtin = rules_.denied_calls.count(key) > 0 && !rules_.expression_series.count(key);
        if (builtin || (IsDunder(key) && !kPermittedDunderAttributes.count(key))) {
            AddViolation(result_, ViolationKind::BLACKLIST_DETECTED,
                         "Subscript by restricted name '" + key + "'",
                         key, node.line, node.column);
        }
    }

    bool IsModuleBound(const std::string& name) const {
        return bindings_.count(name) > 0;
    }

    /// Mark a callee or reference chain so its inner nodes are not judged as values
    void CoverChain(const Node& head) {
        const Node* current = &head;
        covered_.insert(current);
        while (current->kind == NodeKind::ATTRIBUTE && !current->children.empty()) {
            current = current->children.front().get();
            covered_.insert(current);
        }
    }

    void RecordDestination(const std::string& literal) {
        auto text = StringUtils::Trim(literal);
        if (text.empty() || text.size() > 2048) {
            return;
        }

        std::string destination;
        if (StringUtils::IsURL(text)) {
            destination = StringUtils::ExtractHost(text);
        } else if (StringUtils::IsIPv4Address(text) || StringUtils::IsDomain(text)) {
            destination = StringUtils::ToLower(text);
        }

        auto& found = result_.referenced_destinations;
        if (!destination.empty() && std::find(found.begin(), found.end(), destination) == found.end()) {
            found.push_back(destination);
        }
    }

    // ------------------------------------------------------------------------
    // Shape and limits
    // ------------------------------------------------------------------------

    void CheckExpressionShape(const Node& root) {
        if (root.kind != NodeKind::MODULE) {
            if (!IsExpressionKind(root.kind)) {
                AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                             "Expression tree must be rooted at an expression",
                             ToString(root.kind), root.line, root.column);
            }
            return;
        }

        if (root.children.empty()) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED, "Expression is empty");
            return;
        }

        const auto& first = *root.children.front();
        if (first.kind != NodeKind::EXPR_STMT) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Expression content must be a single expression, found " + ToString(first.kind),
                         ToString(first.kind), first.line, first.column);
        }
        if (root.children.size() > 1) {
            const auto& extra = *root.children[1];
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Expression content must be a single expression, found "
                             + std::to_string(root.children.size()) + " statements",
                         {}, extra.line, extra.column);
        }
    }

    void CheckLimits() {
        result_.metrics.import_count = imported_roots_.size();
        const auto& m = result_.metrics;

        if (m.max_depth > rules_.max_depth) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Syntax tree depth " + std::to_string(m.max_depth) + " exceeds limit "
                             + std::to_string(rules_.max_depth),
                         {}, 0, 0, kStructuralWeight);
        }
        if (m.node_count > rules_.max_nodes) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Syntax tree has " + std::to_string(m.node_count) + " nodes, limit "
                             + std::to_string(rules_.max_nodes),
                         {}, 0, 0, kStructuralWeight);
        }
        if (m.complexity > rules_.max_complexity) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         "Complexity " + std::to_string(m.complexity) + " exceeds limit "
                             + std::to_string(rules_.max_complexity),
                         {}, 0, 0, kStructuralWeight);
        }
        if (m.import_count > rules_.max_imports) {
            AddViolation(result_, ViolationKind::VALIDATION_FAILED,
                         std::to_string(m.import_count) + " distinct imports exceed limit "
                             + std::to_string(rules_.max_imports),
                         {}, 0, 0, kStructuralWeight);
        }
    }

    const core::ValidatorPolicy& rules_;
    ContentType type_;
    ValidationResult& result_;

    std::map<std::string, std::string> bindings_;   ///< local name -> qualified target
    std::set<std::string> module_names_;            ///< local names bound to modules
    std::set<std::string> defined_names_;           ///< names assigned or defined in the content
    std::set<std::string> imported_roots_;
    std::set<const Node*> reported_roots_;          ///< callee names already reported by CheckCall
    std::set<const Node*> covered_;                 ///< callee and reference chain nodes
};

void Finalize(ValidationResult& result, std::chrono::steady_clock::time_point start) {
    result.approved = result.violations.empty();
    result.risk_score = result.approved ? 0 : std::min(result.risk_score, 100);
    result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

} // anonymous namespace

// ============================================================================
// CAPABILITY VALIDATOR
// ============================================================================

CapabilityValidator::CapabilityValidator(std::shared_ptr<core::PolicyStore> policy)
    : policy_(std::move(policy)) {
}

ValidationResult CapabilityValidator::Validate(const std::string& content, ContentType type) const {
    auto start = std::chrono::steady_clock::now();
    auto policy = policy_->Current();

    ValidationResult result;
    result.content_type = type;
    result.detected_type = type;
    result.content_hash = utils::HashUtils::ComputeSHA256(content);

    if (StringUtils::IsBlank(content)) {
        AddViolation(result, ViolationKind::VALIDATION_FAILED, "Content is empty", {}, 1, 1);
    } else {
        result.detected_type = DetectContentType(content, *policy);
        if (result.detected_type != type) {
            spdlog::debug("[VALIDATOR] declared {} but content looks like {}",
                          core::ToString(type), core::ToString(result.detected_type));
        }

        // EXPRESSION rules are strictly narrower than CODE rules
        switch (type) {
            case ContentType::CODE:
            case ContentType::EXPRESSION:
                ValidateScript(content, type, *policy, result);
                break;
            case ContentType::PROMPT:
                ValidatePrompt(content, *policy, result);
                if (result.detected_type == ContentType::CODE) {
                    ValidateEmbeddedCode(content, "prompt", *policy, result);
                }
                break;
            case ContentType::CONFIG:
                ValidateConfig(content, *policy, result);
                break;
        }
    }

    Finalize(result, start);

    spdlog::debug("[VALIDATOR] {} {} approved={} violations={} risk={} ({}us)",
                  core::ToString(type), result.content_hash.substr(0, 12), result.approved,
                  result.violations.size(), result.risk_score, result.elapsed.count());
    return result;
}

ValidationResult CapabilityValidator::ValidateTree(const Node& tree, ContentType type) const {
    auto start = std::chrono::steady_clock::now();
    auto policy = policy_->Current();

    ValidationResult result;
    result.content_type = type;
    result.detected_type = type;
    result.content_hash = utils::HashUtils::ComputeSHA256(tree.Dump());

    TreeAnalyzer analyzer(*policy, type, result);
    analyzer.Analyze(tree);

    Finalize(result, start);

    spdlog::debug("[VALIDATOR] tree {} approved={} violations={} ({}us)",
                  result.content_hash.substr(0, 12), result.approved,
                  result.violations.size(), result.elapsed.count());
    return result;
}

void CapabilityValidator::ValidateScript(const std::string& content, ContentType type,
                                         const core::PolicySnapshot& policy,
                                         ValidationResult& result) const {
    const auto& rules = policy.validator;

    // Bounds first: oversized input is never parsed
    if (content.size() > rules.max_content_bytes) {
        AddViolation(result, ViolationKind::VALIDATION_FAILED,
                     "Content size " + std::to_string(content.size()) + " bytes exceeds limit "
                         + std::to_string(rules.max_content_bytes),
                     {}, 0, 0, kStructuralWeight);
        return;
    }
    auto lines = StringUtils::CountLines(content);
    if (lines > rules.max_lines) {
        AddViolation(result, ViolationKind::VALIDATION_FAILED,
                     "Content has " + std::to_string(lines) + " lines, limit "
                         + std::to_string(rules.max_lines),
                     {}, 0, 0, kStructuralWeight);
        return;
    }

    NodePtr tree;
    try {
        tree = ScriptParser().ParseModule(content);
    } catch (const ParseError& e) {
        AddViolation(result, ViolationKind::VALIDATION_FAILED,
                     std::string("Syntax error: ") + e.what(), {}, e.Line(), e.Column());
        return;
    }

    TreeAnalyzer analyzer(policy, type, result);
    analyzer.Analyze(*tree);
}

void CapabilityValidator::ValidatePrompt(const std::string& content,
                                         const core::PolicySnapshot& policy,
                                         ValidationResult& result) const {
    const auto& rules = policy.validator;

    if (content.size() > rules.prompt_max_bytes) {
        AddViolation(result, ViolationKind::VALIDATION_FAILED,
                     "Prompt size " + std::to_string(content.size()) + " bytes exceeds limit "
                         + std::to_string(rules.prompt_max_bytes),
                     {}, 0, 0, kStructuralWeight);
        return;
    }

    auto lowered = StringUtils::ToLower(content);
    for (const auto& marker : rules.injection_markers) {
        auto needle = StringUtils::ToLower(marker);
        if (needle.empty()) {
            continue;
        }

        for (auto pos = lowered.find(needle); pos != std::string::npos;
             pos = lowered.find(needle, pos + needle.size())) {
            auto [line, column] = LocateOffset(content, pos);
            AddViolation(result, ViolationKind::BLACKLIST_DETECTED,
                         "Prompt injection marker '" + marker + "' at offset " + std::to_string(pos),
                         marker, line, column);
        }
    }
}

void CapabilityValidator::ValidateConfig(const std::string& content,
                                         const core::PolicySnapshot& policy,
                                         ValidationResult& result) const {
    const auto& rules = policy.validator;

    if (content.size() > rules.config_max_bytes) {
        AddViolation(result, ViolationKind::VALIDATION_FAILED,
                     "Config size " + std::to_string(content.size()) + " bytes exceeds limit "
                         + std::to_string(rules.config_max_bytes),
                     {}, 0, 0, kStructuralWeight);
        return;
    }

    json document;
    try {
        document = json::parse(content);
    } catch (const json::parse_error& e) {
        auto [line, column] = LocateOffset(content, e.byte > 0 ? e.byte - 1 : 0);
        AddViolation(result, ViolationKind::VALIDATION_FAILED,
                     "Config is not valid JSON: " + std::string(e.what()), {}, line, column);
        return;
    }

    std::vector<std::string> patterns;
    for (const auto& pattern : rules.config_denied_patterns) {
        patterns.push_back(StringUtils::ToLower(pattern));
    }

    auto scan = [&](const std::string& text, const std::string& path) {
        auto lowered = StringUtils::ToLower(text);
        for (std::size_t i = 0; i < patterns.size(); ++i) {
            if (!patterns[i].empty() && StringUtils::Contains(lowered, patterns[i])) {
                AddViolation(result, ViolationKind::BLACKLIST_DETECTED,
                             "Denied pattern '" + rules.config_denied_patterns[i] + "' at " + path,
                             rules.config_denied_patterns[i]);
            }
        }
    };

    std::size_t max_depth = 0;
    std::vector<std::tuple<const json*, std::size_t, std::string>> stack{{&document, 1, "$"}};
    while (!stack.empty()) {
        auto [node, depth, path] = stack.back();
        stack.pop_back();
        max_depth = std::max(max_depth, depth);
        ++result.metrics.node_count;

        if (node->is_object()) {
            for (auto it = node->begin(); it != node->end(); ++it) {
                auto child_path = path + "." + it.key();
                scan(it.key(), child_path);
                stack.emplace_back(&it.value(), depth + 1, child_path);
            }
        } else if (node->is_array()) {
            for (std::size_t i = 0; i < node->size(); ++i) {
                stack.emplace_back(&(*node)[i], depth + 1, path + "[" + std::to_string(i) + "]");
            }
        } else if (node->is_string()) {
            const auto& text = node->get<std::string>();
            scan(text, path);
            if (DetectContentType(text, policy) == ContentType::CODE) {
                ValidateEmbeddedCode(text, path, policy, result);
            }
        }
    }
    result.metrics.max_depth = max_depth;

    if (max_depth > rules.config_max_depth) {
        AddViolation(result, ViolationKind::VALIDATION_FAILED,
                     "Config nesting depth " + std::to_string(max_depth) + " exceeds limit "
                         + std::to_string(rules.config_max_depth),
                     {}, 0, 0, kStructuralWeight);
    }
}

void CapabilityValidator::ValidateEmbeddedCode(const std::string& content, const std::string& origin,
                                               const core::PolicySnapshot& policy,
                                               ValidationResult& result) const {
    const auto& rules = policy.validator;
    if (content.size() > rules.max_content_bytes) {
        return;  // already bounded by the prompt or config size limit
    }

    // Whole content first, then line by line for script mixed with prose
    std::vector<NodePtr> trees;
    try {
        trees.push_back(ScriptParser().ParseModule(content));
    } catch (const ParseError&) {
        for (const auto& line : StringUtils::Split(content, '\n')) {
            auto statement = StringUtils::Trim(line);
            if (statement.empty()) {
                continue;
            }
            try {
                trees.push_back(ScriptParser().ParseModule(statement));
            } catch (const ParseError&) {
                continue;  // prose
            }
        }
    }

    for (const auto& tree : trees) {
        ValidationResult scratch;
        scratch.content_type = ContentType::CODE;
        TreeAnalyzer analyzer(policy, ContentType::CODE, scratch);
        analyzer.Analyze(*tree);

        for (auto& violation : scratch.violations) {
            violation.detail = "Code in " + origin + ": " + violation.detail;
            result.violations.push_back(std::move(violation));
        }
        result.risk_score += scratch.risk_score;

        auto& found = result.referenced_destinations;
        for (auto& destination : scratch.referenced_destinations) {
            if (std::find(found.begin(), found.end(), destination) == found.end()) {
                found.push_back(std::move(destination));
            }
        }
    }
}

ContentType CapabilityValidator::DetectContentType(const std::string& content) const {
    return DetectContentType(content, *policy_->Current());
}

ContentType CapabilityValidator::DetectContentType(const std::string& content,
                                                   const core::PolicySnapshot& policy) const {
    auto trimmed = StringUtils::Trim(content);
    if (trimmed.empty()) {
        return ContentType::PROMPT;
    }

    if ((trimmed.front() == '{' || trimmed.front() == '[') && json::accept(trimmed)) {
        return ContentType::CONFIG;
    }

    auto lines = StringUtils::Split(trimmed, '\n');
    for (const auto& marker : kCodeMarkers) {
        if (StringUtils::Contains(trimmed, marker)) {
            return ContentType::CODE;
        }
    }
    if (std::any_of(lines.begin(), lines.end(), LooksLikeStatement)) {
        return ContentType::CODE;
    }

    // Identifiers with the character that follows them
    const auto& rules = policy.validator;
    bool operator_call = false;
    bool series = false;
    for (std::size_t i = 0; i < trimmed.size();) {
        if (!IsIdentifierChar(trimmed[i]) || std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            ++i;
            continue;
        }
        std::size_t end = i;
        while (end < trimmed.size() && IsIdentifierChar(trimmed[end])) {
            ++end;
        }
        auto word = trimmed.substr(i, end - i);
        std::size_t next = trimmed.find_first_not_of(" \t", end);

        if (next != std::string::npos && trimmed[next] == '(' && rules.expression_operators.count(word)) {
            operator_call = true;
        }
        if (rules.expression_series.count(word)) {
            series = true;
        }
        i = end;
    }
    bool arithmetic = trimmed.find_first_of("+-*/()") != std::string::npos;
    if (operator_call || (series && arithmetic)) {
        return ContentType::EXPRESSION;
    }

    if (std::all_of(lines.begin(), lines.end(), [](const std::string& line) {
            return StringUtils::IsBlank(line) || LooksLikeCallStatement(line);
        })) {
        return ContentType::CODE;
    }
    return ContentType::PROMPT;
}

} // namespace validators
} // namespace warden
