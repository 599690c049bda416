#pragma once

#include "core/types.hpp"
#include "policy/policy_types.hpp"

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace rlsengine {

/// A row as seen by the in-process evaluator: column name -> value
using Row = std::unordered_map<std::string, AttributeValue>;

// ============================================================================
// Compiled predicate tree
// ============================================================================

struct CompiledNode;

struct ConstantNode {
    bool value;
};

struct ColumnPredicate {
    std::string condition_id;
    std::string column;
    ConditionOperator op;
    AttributeValue operand;     // Normalized: array for IN/NOT_IN, pair for BETWEEN
};

struct ExpressionNode {
    std::string condition_id;
    std::string sql;
};

struct GroupNode {
    GroupLogic logic;
    std::vector<CompiledNode> children;     // Never constants after folding
};

struct CompiledNode {
    std::variant<ConstantNode, ColumnPredicate, ExpressionNode, GroupNode> node;
};

/**
 * @brief Output of compiling one ConditionGroup for one user
 *
 * Renders to a SQL fragment for query injection and evaluates against
 * in-memory rows for access checks. Expression fragments are opaque to the
 * row evaluator, so evaluate() is three-valued.
 */
class CompiledPredicate {
public:
    CompiledPredicate(CompiledNode root, std::set<std::string> columns)
        : root_(std::move(root)), columns_(std::move(columns)) {}

    /// Constant truth value when the tree folded away entirely
    [[nodiscard]] std::optional<bool> constant_value() const;

    [[nodiscard]] bool is_always_true() const { return constant_value() == true; }
    [[nodiscard]] bool is_always_false() const { return constant_value() == false; }

    /// SQL boolean expression (no leading WHERE)
    [[nodiscard]] std::string to_sql() const;

    /// true/false, or nullopt when the outcome hinges on an expression fragment
    [[nodiscard]] std::optional<bool> evaluate(const Row& row) const;

    /// Columns referenced by surviving column predicates
    [[nodiscard]] const std::set<std::string>& columns() const { return columns_; }

    [[nodiscard]] const CompiledNode& root() const { return root_; }

private:
    CompiledNode root_;
    std::set<std::string> columns_;
};

/**
 * @brief Condition Compiler - ConditionGroup + user -> CompiledPredicate
 *
 * Value resolution:
 * - static:     the literal value
 * - dynamic:    user attribute; missing/null resolves to "unknown"
 * - expression: verbatim trusted SQL, never interpreted
 *
 * Against an unknown value IS_NULL folds to true, IS_NOT_NULL to false and
 * every other operator to false. Literal shape mismatches (BETWEEN without a
 * pair, ordering on booleans, ...) fold to false rather than erroring.
 *
 * Thread-safety: stateless, all functions are pure.
 */
class ConditionCompiler {
public:
    [[nodiscard]] static CompiledPredicate compile(
        const ConditionGroup& group,
        const UserSecurityContext& user);

    /// Resolve a condition's right-hand value (nullopt = unknown)
    [[nodiscard]] static std::optional<AttributeValue> resolve_value(
        const RlsCondition& condition,
        const UserSecurityContext& user);

    [[nodiscard]] static std::optional<AttributeValue> resolve_attribute(
        const AttributeRef& attribute,
        const UserSecurityContext& user);

    /// Whether a non-null operand has the shape the operator needs
    [[nodiscard]] static bool operand_fits(ConditionOperator op, const AttributeValue& operand);

    /// Render a scalar JSON value as a SQL literal
    [[nodiscard]] static std::string sql_literal(const AttributeValue& value);

private:
    static CompiledNode compile_group(const ConditionGroup& group,
                                      const UserSecurityContext& user);
    static CompiledNode compile_condition(const RlsCondition& condition,
                                          const UserSecurityContext& user);
    static CompiledNode build_predicate(const RlsCondition& condition,
                                        const AttributeValue& operand);
};

} // namespace rlsengine
