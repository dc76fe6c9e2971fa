//! # Node Utilities Implementation

#include "ast/node_util.hpp"

#include <algorithm>

namespace deadprop::ast {

auto collect_ancestors(const Node& n) -> std::vector<const Node*> {
    std::vector<const Node*> path;
    for (const Node* p = n.parent(); p != nullptr; p = p->parent()) {
        path.push_back(p);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

// ============================================================================
// Operator Classification
// ============================================================================

auto is_compound_assignment_op(const Node& n) -> bool {
    switch (n.token()) {
    case Token::AssignBitOr:
    case Token::AssignBitXor:
    case Token::AssignBitAnd:
    case Token::AssignLsh:
    case Token::AssignRsh:
    case Token::AssignUrsh:
    case Token::AssignAdd:
    case Token::AssignSub:
    case Token::AssignMul:
    case Token::AssignExponent:
    case Token::AssignDiv:
    case Token::AssignMod:
    case Token::AssignOr:
    case Token::AssignAnd:
    case Token::AssignCoalesce:
        return true;
    default:
        return false;
    }
}

auto is_assignment_op(const Node& n) -> bool {
    return n.is_assign() || is_compound_assignment_op(n);
}

auto is_object_lit_key(const Node& n) -> bool {
    const Node* parent = n.parent();
    if (!parent || !parent->is_object_lit()) {
        return false;
    }
    return n.is_string_key() || n.is_getter_def() || n.is_setter_def() ||
           n.is_member_function_def();
}

auto is_declaration_statement(const Node& n) -> bool {
    if (!n.is_function() && !n.is_class()) {
        return false;
    }
    const Node* parent = n.parent();
    if (!parent || !(parent->is_script() || parent->is_block())) {
        return false;
    }
    const Node* name = n.first_child();
    return name && name->is_name() && !name->str().empty();
}

// ============================================================================
// Expression Result Usage
// ============================================================================

auto is_expression_result_used(const Node& expr, AncestorChain ancestors) -> bool {
    const Node* parent = ancestors.parent();
    if (!parent) {
        return false;
    }

    switch (parent->token()) {
    case Token::Block:
    case Token::Script:
    case Token::ExprResult:
        return false;
    case Token::Cast:
        return is_expression_result_used(*parent, ancestors.pop());
    case Token::Hook:
    case Token::And:
    case Token::Or:
    case Token::Coalesce:
        // The condition is always consumed; the value arms only if the whole is
        return &expr == parent->first_child() || is_expression_result_used(*parent, ancestors.pop());
    case Token::Comma:
        return &expr != parent->first_child() && is_expression_result_used(*parent, ancestors.pop());
    case Token::For:
        // Only the condition of `for (init; cond; incr)` is consumed
        return parent->second_child() == &expr;
    default:
        return true;
    }
}

// ============================================================================
// Annotation Resolution
// ============================================================================

auto get_best_jsdoc_info(const Node& n) -> const JSDocInfo* {
    if (const JSDocInfo* info = n.jsdoc_info()) {
        return info;
    }

    const Node* parent = n.parent();
    if (!parent || n.is_expr_result()) {
        return nullptr;
    }

    if (parent->is_getter_def() || parent->is_setter_def() || parent->is_member_function_def()) {
        return get_best_jsdoc_info(*parent);
    }
    if (parent->is_name() || parent->is_assign()) {
        return get_best_jsdoc_info(*parent);
    }
    if (is_object_lit_key(*parent)) {
        return parent->jsdoc_info();
    }
    if (parent->is_function()) {
        return get_best_jsdoc_info(*parent);
    }
    if (parent->is_name_declaration() && parent->has_one_child()) {
        return parent->jsdoc_info();
    }
    if ((parent->is_hook() && parent->first_child() != &n) || parent->is_or() ||
        parent->is_and() || (parent->is_comma() && parent->first_child() != &n)) {
        return get_best_jsdoc_info(*parent);
    }
    if (parent->is_cast()) {
        return get_best_jsdoc_info(*parent);
    }
    return nullptr;
}

// ============================================================================
// Name Resolution
// ============================================================================

auto get_best_lvalue(const Node& n) -> const Node* {
    const Node* parent = n.parent();
    if (!parent) {
        return nullptr;
    }

    if (is_declaration_statement(n)) {
        return n.first_child();
    }
    if (parent->is_name()) {
        return parent;
    }
    if (parent->is_assign()) {
        return parent->first_child();
    }
    if (is_object_lit_key(*parent)) {
        return parent;
    }
    if ((parent->is_hook() && parent->first_child() != &n) || parent->is_or() ||
        parent->is_and() || (parent->is_comma() && parent->first_child() != &n)) {
        return get_best_lvalue(*parent);
    }
    if (parent->is_cast()) {
        return get_best_lvalue(*parent);
    }
    return nullptr;
}

auto get_best_lvalue_name(const Node* lvalue) -> std::optional<std::string> {
    if (!lvalue || !lvalue->parent()) {
        return std::nullopt;
    }

    if (is_object_lit_key(*lvalue)) {
        const Node* owner = get_best_lvalue(*lvalue->parent());
        if (!owner) {
            return std::nullopt;
        }
        auto owner_name = get_best_lvalue_name(owner);
        if (!owner_name) {
            return std::nullopt;
        }
        return *owner_name + "." + lvalue->str();
    }
    return lvalue->qualified_name();
}

} // namespace deadprop::ast
