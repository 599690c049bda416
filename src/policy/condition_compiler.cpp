#include "policy/condition_compiler.hpp"
#include "policy/policy_constants.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace rlsengine {

// ============================================================================
// Value helpers
// ============================================================================

namespace {

CompiledNode constant(bool value) {
    return CompiledNode{ConstantNode{value}};
}

bool is_scalar(const AttributeValue& v) {
    return v.is_string() || v.is_number() || v.is_boolean();
}

template <typename T>
int three_way(T x, T y) {
    return (x < y) ? -1 : (x > y ? 1 : 0);
}

/// Integers compare exactly across the signed and unsigned ranges
int compare_integers(const AttributeValue& a, const AttributeValue& b) {
    const bool a_unsigned = a.is_number_unsigned();
    const bool b_unsigned = b.is_number_unsigned();
    if (!a_unsigned && !b_unsigned) {
        return three_way(a.get<int64_t>(), b.get<int64_t>());
    }
    if (a_unsigned && b_unsigned) {
        return three_way(a.get<uint64_t>(), b.get<uint64_t>());
    }
    if (a_unsigned) {
        const auto y = b.get<int64_t>();
        return y < 0 ? 1 : three_way(a.get<uint64_t>(), static_cast<uint64_t>(y));
    }
    const auto x = a.get<int64_t>();
    return x < 0 ? -1 : three_way(static_cast<uint64_t>(x), b.get<uint64_t>());
}

/// Three-way compare for number/number and string/string, nullopt otherwise
std::optional<int> compare_values(const AttributeValue& a, const AttributeValue& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_number_integer() && b.is_number_integer()) {
            return compare_integers(a, b);
        }
        const auto x = a.get<double>();
        const auto y = b.get<double>();
        return (x < y) ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        const int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
        return (c < 0) ? -1 : (c > 0 ? 1 : 0);
    }
    return std::nullopt;
}

bool values_equal(const AttributeValue& a, const AttributeValue& b) {
    if (a.is_boolean() && b.is_boolean()) {
        return a.get<bool>() == b.get<bool>();
    }
    const auto cmp = compare_values(a, b);
    return cmp.has_value() && *cmp == 0;
}

bool contains_equal(const AttributeValue& list, const AttributeValue& v) {
    for (const auto& item : list) {
        if (values_equal(item, v)) return true;
    }
    return false;
}

std::string escape_like(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 4);
    for (const char c : s) {
        if (c == '%' || c == '_' || c == '\\') result += '\\';
        result += c;
    }
    return result;
}

// ============================================================================
// SQL rendering
// ============================================================================

std::string render_in_list(const AttributeValue& list) {
    std::string out;
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) out += ", ";
        out += ConditionCompiler::sql_literal(list[i]);
    }
    return out;
}

std::string render_predicate(const ColumnPredicate& p) {
    const auto& col = p.column;
    switch (p.op) {
        case ConditionOperator::EQUALS:
            return std::format("{} = {}", col, ConditionCompiler::sql_literal(p.operand));
        case ConditionOperator::NOT_EQUALS:
            return std::format("{} <> {}", col, ConditionCompiler::sql_literal(p.operand));
        case ConditionOperator::IN:
            if (p.operand.empty()) return std::string(policy::kSqlFalse);
            return std::format("{} IN ({})", col, render_in_list(p.operand));
        case ConditionOperator::NOT_IN:
            if (p.operand.empty()) return std::string(policy::kSqlTrue);
            return std::format("{} NOT IN ({})", col, render_in_list(p.operand));
        case ConditionOperator::CONTAINS:
            return std::format("{} LIKE {} ESCAPE '\\'", col,
                utils::quote_sql_literal("%" + escape_like(p.operand.get<std::string>()) + "%"));
        case ConditionOperator::STARTS_WITH:
            return std::format("{} LIKE {} ESCAPE '\\'", col,
                utils::quote_sql_literal(escape_like(p.operand.get<std::string>()) + "%"));
        case ConditionOperator::GREATER_THAN:
            return std::format("{} > {}", col, ConditionCompiler::sql_literal(p.operand));
        case ConditionOperator::LESS_THAN:
            return std::format("{} < {}", col, ConditionCompiler::sql_literal(p.operand));
        case ConditionOperator::BETWEEN:
            return std::format("{} BETWEEN {} AND {}", col,
                ConditionCompiler::sql_literal(p.operand[0]),
                ConditionCompiler::sql_literal(p.operand[1]));
        case ConditionOperator::IS_NULL:
            return std::format("{} IS NULL", col);
        case ConditionOperator::IS_NOT_NULL:
            return std::format("{} IS NOT NULL", col);
    }
    return std::string(policy::kSqlFalse);
}

std::string render(const CompiledNode& n) {
    if (const auto* k = std::get_if<ConstantNode>(&n.node)) {
        return std::string(k->value ? policy::kSqlTrue : policy::kSqlFalse);
    }
    if (const auto* p = std::get_if<ColumnPredicate>(&n.node)) {
        return render_predicate(*p);
    }
    if (const auto* e = std::get_if<ExpressionNode>(&n.node)) {
        return "(" + e->sql + ")";
    }

    const auto& g = std::get<GroupNode>(n.node);
    const std::string sep = g.logic == GroupLogic::AND ? " AND " : " OR ";
    std::string out;
    for (size_t i = 0; i < g.children.size(); ++i) {
        if (i > 0) out += sep;
        const auto& child = g.children[i];
        if (std::holds_alternative<GroupNode>(child.node)) {
            out += "(" + render(child) + ")";
        } else {
            out += render(child);
        }
    }
    return out;
}

// ============================================================================
// Row evaluation
// ============================================================================

bool evaluate_predicate(const ColumnPredicate& p, const Row& row) {
    const auto it = row.find(p.column);
    const bool is_null = it == row.end() || it->second.is_null();

    if (p.op == ConditionOperator::IS_NULL) return is_null;
    if (p.op == ConditionOperator::IS_NOT_NULL) return !is_null;
    if (is_null) return false;

    const auto& v = it->second;
    switch (p.op) {
        case ConditionOperator::EQUALS:
            return values_equal(v, p.operand);
        case ConditionOperator::NOT_EQUALS:
            return !values_equal(v, p.operand);
        case ConditionOperator::IN:
            return contains_equal(p.operand, v);
        case ConditionOperator::NOT_IN:
            return !contains_equal(p.operand, v);
        case ConditionOperator::CONTAINS:
            return v.is_string() &&
                   v.get_ref<const std::string&>().find(
                       p.operand.get_ref<const std::string&>()) != std::string::npos;
        case ConditionOperator::STARTS_WITH:
            return v.is_string() &&
                   v.get_ref<const std::string&>().starts_with(
                       p.operand.get_ref<const std::string&>());
        case ConditionOperator::GREATER_THAN: {
            const auto cmp = compare_values(v, p.operand);
            return cmp.has_value() && *cmp > 0;
        }
        case ConditionOperator::LESS_THAN: {
            const auto cmp = compare_values(v, p.operand);
            return cmp.has_value() && *cmp < 0;
        }
        case ConditionOperator::BETWEEN: {
            const auto lo = compare_values(v, p.operand[0]);
            const auto hi = compare_values(v, p.operand[1]);
            return lo.has_value() && hi.has_value() && *lo >= 0 && *hi <= 0;
        }
        default:
            return false;
    }
}

std::optional<bool> evaluate_node(const CompiledNode& n, const Row& row) {
    if (const auto* k = std::get_if<ConstantNode>(&n.node)) return k->value;
    if (const auto* p = std::get_if<ColumnPredicate>(&n.node)) return evaluate_predicate(*p, row);
    if (std::holds_alternative<ExpressionNode>(n.node)) return std::nullopt;

    // Kleene logic: a decisive child wins over an indeterminate one
    const auto& g = std::get<GroupNode>(n.node);
    const bool decisive = g.logic == GroupLogic::OR;
    bool indeterminate = false;
    for (const auto& child : g.children) {
        const auto v = evaluate_node(child, row);
        if (!v.has_value()) {
            indeterminate = true;
        } else if (*v == decisive) {
            return decisive;
        }
    }
    if (indeterminate) return std::nullopt;
    return !decisive;
}

void collect_columns(const CompiledNode& n, std::set<std::string>& out) {
    if (const auto* p = std::get_if<ColumnPredicate>(&n.node)) {
        out.insert(p->column);
    } else if (const auto* g = std::get_if<GroupNode>(&n.node)) {
        for (const auto& child : g->children) collect_columns(child, out);
    }
}

} // anonymous namespace

// ============================================================================
// CompiledPredicate
// ============================================================================

std::optional<bool> CompiledPredicate::constant_value() const {
    if (const auto* k = std::get_if<ConstantNode>(&root_.node)) return k->value;
    return std::nullopt;
}

std::string CompiledPredicate::to_sql() const {
    return render(root_);
}

std::optional<bool> CompiledPredicate::evaluate(const Row& row) const {
    return evaluate_node(root_, row);
}

// ============================================================================
// ConditionCompiler
// ============================================================================

CompiledPredicate ConditionCompiler::compile(
    const ConditionGroup& group,
    const UserSecurityContext& user) {

    CompiledNode root = compile_group(group, user);
    std::set<std::string> columns;
    collect_columns(root, columns);
    return CompiledPredicate(std::move(root), std::move(columns));
}

std::optional<AttributeValue> ConditionCompiler::resolve_value(
    const RlsCondition& condition,
    const UserSecurityContext& user) {

    if (const auto* s = std::get_if<StaticValue>(&condition.source)) {
        if (s->value.is_null()) return std::nullopt;
        return s->value;
    }
    if (const auto* d = std::get_if<DynamicValue>(&condition.source)) {
        return resolve_attribute(d->attribute, user);
    }
    return AttributeValue(std::get<ExpressionValue>(condition.source).sql);
}

std::optional<AttributeValue> ConditionCompiler::resolve_attribute(
    const AttributeRef& attribute,
    const UserSecurityContext& user) {

    auto lookup = [&user](const std::string& key) -> std::optional<AttributeValue> {
        const auto it = user.attributes.find(key);
        if (it == user.attributes.end() || it->second.is_null()) return std::nullopt;
        return it->second;
    };

    if (const auto* custom = std::get_if<CustomAttribute>(&attribute)) {
        return lookup(custom->name);
    }

    const auto builtin = std::get<BuiltinAttribute>(attribute);
    switch (builtin) {
        case BuiltinAttribute::USER_ID:
            if (user.user_id.empty()) return std::nullopt;
            return AttributeValue(user.user_id);
        case BuiltinAttribute::USERNAME:
            if (user.username.empty()) return std::nullopt;
            return AttributeValue(user.username);
        case BuiltinAttribute::EMAIL:
            if (!user.email) return std::nullopt;
            return AttributeValue(*user.email);
        case BuiltinAttribute::ROLE: {
            AttributeValue roles = AttributeValue::array();
            for (const auto& role : user.sorted_roles()) roles.push_back(role);
            return roles;
        }
        case BuiltinAttribute::DEPARTMENT:
        case BuiltinAttribute::REGION:
        case BuiltinAttribute::TEAM:
            return lookup(std::string(builtin_attribute_to_string(builtin)));
    }
    return std::nullopt;
}

std::string ConditionCompiler::sql_literal(const AttributeValue& value) {
    if (value.is_string()) return utils::quote_sql_literal(value.get_ref<const std::string&>());
    if (value.is_boolean()) return value.get<bool>() ? "TRUE" : "FALSE";
    if (value.is_number()) return value.dump();
    return "NULL";
}

CompiledNode ConditionCompiler::compile_group(
    const ConditionGroup& group,
    const UserSecurityContext& user) {

    // Vacuous truth: an empty group allows
    if (group.empty()) return constant(true);

    const bool is_and = group.logic == GroupLogic::AND;
    std::vector<CompiledNode> children;
    children.reserve(group.conditions.size() + group.groups.size());

    // Returns true when the child short-circuits the whole group
    auto absorb = [&](CompiledNode child) {
        if (const auto* k = std::get_if<ConstantNode>(&child.node)) {
            return k->value != is_and;
        }
        children.push_back(std::move(child));
        return false;
    };

    for (const auto& condition : group.conditions) {
        if (absorb(compile_condition(condition, user))) return constant(!is_and);
    }
    for (const auto& nested : group.groups) {
        if (absorb(compile_group(nested, user))) return constant(!is_and);
    }

    if (children.empty()) return constant(is_and);
    if (children.size() == 1) return std::move(children.front());
    return CompiledNode{GroupNode{group.logic, std::move(children)}};
}

CompiledNode ConditionCompiler::compile_condition(
    const RlsCondition& condition,
    const UserSecurityContext& user) {

    if (const auto* expr = std::get_if<ExpressionValue>(&condition.source)) {
        if (utils::trim(expr->sql).empty()) return constant(false);
        return CompiledNode{ExpressionNode{condition.id, expr->sql}};
    }

    if (std::holds_alternative<DynamicValue>(condition.source)) {
        const auto resolved = resolve_value(condition, user);
        if (!resolved) {
            // Unknown: only IS_NULL holds
            return constant(condition.op == ConditionOperator::IS_NULL);
        }
        return build_predicate(condition, *resolved);
    }

    return build_predicate(condition, std::get<StaticValue>(condition.source).value);
}

bool ConditionCompiler::operand_fits(ConditionOperator op, const AttributeValue& operand) {
    switch (op) {
        case ConditionOperator::IS_NULL:
        case ConditionOperator::IS_NOT_NULL:
            return true;
        case ConditionOperator::EQUALS:
        case ConditionOperator::NOT_EQUALS:
            return is_scalar(operand);
        case ConditionOperator::GREATER_THAN:
        case ConditionOperator::LESS_THAN:
            return operand.is_number() || operand.is_string();
        case ConditionOperator::CONTAINS:
        case ConditionOperator::STARTS_WITH:
            return operand.is_string();
        case ConditionOperator::IN:
        case ConditionOperator::NOT_IN:
            if (!operand.is_array()) return is_scalar(operand);
            return std::all_of(operand.begin(), operand.end(),
                               [](const AttributeValue& item) { return is_scalar(item); });
        case ConditionOperator::BETWEEN:
            return operand.is_array() && operand.size() == 2 &&
                   compare_values(operand[0], operand[1]).has_value();
    }
    return false;
}

CompiledNode ConditionCompiler::build_predicate(
    const RlsCondition& condition,
    const AttributeValue& operand) {

    if (condition.column.empty()) return constant(false);
    if (is_null_check(condition.op)) {
        return CompiledNode{ColumnPredicate{condition.id, condition.column, condition.op, nullptr}};
    }
    if (!operand_fits(condition.op, operand)) return constant(false);

    ColumnPredicate p{condition.id, condition.column, condition.op, operand};
    const bool membership = condition.op == ConditionOperator::IN ||
                            condition.op == ConditionOperator::NOT_IN;
    if (membership && !operand.is_array()) {
        p.operand = AttributeValue::array({operand});
    }
    return CompiledNode{std::move(p)};
}

} // namespace rlsengine
