//! # Tree Construction Helpers Implementation

#include "ast/ir.hpp"

#include <sstream>

namespace deadprop::ast::ir {

// ============================================================================
// Annotations and positions
// ============================================================================

auto jsdoc(NodePtr node, const JSDocInfo& info) -> NodePtr {
    node->set_jsdoc_info(info);
    return node;
}

auto private_(NodePtr node) -> NodePtr {
    return jsdoc(std::move(node), JSDocInfo::with_visibility(Visibility::Private));
}

auto at(NodePtr node, uint32_t line, uint32_t column) -> NodePtr {
    node->set_span(SourceSpan::at(line, column));
    return node;
}

auto empty() -> NodePtr {
    return make_box<Node>(Token::Empty);
}

// ============================================================================
// Statements
// ============================================================================

auto expr_result(NodePtr expr) -> NodePtr {
    return detail::make(Token::ExprResult, "", std::move(expr));
}

auto return_(NodePtr value) -> NodePtr {
    return detail::make(Token::Return, "", std::move(value));
}

auto return_void() -> NodePtr {
    return make_box<Node>(Token::Return);
}

static auto declaration(Token token, std::string id, NodePtr value) -> NodePtr {
    auto decl_name = make_box<Node>(Token::Name, std::move(id));
    if (value) {
        decl_name->add_child(std::move(value));
    }
    return detail::make(token, "", std::move(decl_name));
}

auto var(std::string id, NodePtr value) -> NodePtr {
    return declaration(Token::Var, std::move(id), std::move(value));
}

auto let(std::string id, NodePtr value) -> NodePtr {
    return declaration(Token::Let, std::move(id), std::move(value));
}

auto const_(std::string id, NodePtr value) -> NodePtr {
    return declaration(Token::Const, std::move(id), std::move(value));
}

auto if_(NodePtr cond, NodePtr then_block) -> NodePtr {
    return detail::make(Token::If, "", std::move(cond), std::move(then_block));
}

auto if_else(NodePtr cond, NodePtr then_block, NodePtr else_block) -> NodePtr {
    return detail::make(Token::If, "", std::move(cond), std::move(then_block),
                        std::move(else_block));
}

auto for_(NodePtr init, NodePtr cond, NodePtr incr, NodePtr body) -> NodePtr {
    return detail::make(Token::For, "", std::move(init), std::move(cond), std::move(incr),
                        std::move(body));
}

auto for_in(NodePtr target, NodePtr object, NodePtr body) -> NodePtr {
    return detail::make(Token::ForIn, "", std::move(target), std::move(object), std::move(body));
}

auto while_(NodePtr cond, NodePtr body) -> NodePtr {
    return detail::make(Token::While, "", std::move(cond), std::move(body));
}

// ============================================================================
// Expressions
// ============================================================================

auto name(std::string id) -> NodePtr {
    return make_box<Node>(Token::Name, std::move(id));
}

auto this_() -> NodePtr {
    return make_box<Node>(Token::This);
}

auto string(std::string value) -> NodePtr {
    return make_box<Node>(Token::StringLit, std::move(value));
}

auto number(double value) -> NodePtr {
    std::ostringstream oss;
    oss << value;
    return make_box<Node>(Token::Number, oss.str());
}

auto null() -> NodePtr {
    return make_box<Node>(Token::Null);
}

auto true_() -> NodePtr {
    return make_box<Node>(Token::True);
}

auto getprop(NodePtr target, std::string prop) -> NodePtr {
    return detail::make(Token::GetProp, std::move(prop), std::move(target));
}

auto qname(const std::string& dotted) -> NodePtr {
    size_t dot = dotted.find('.');
    NodePtr result;
    std::string head = dotted.substr(0, dot);
    result = head == "this" ? this_() : name(head);

    while (dot != std::string::npos) {
        size_t next = dotted.find('.', dot + 1);
        std::string part =
            dotted.substr(dot + 1, next == std::string::npos ? std::string::npos : next - dot - 1);
        result = getprop(std::move(result), std::move(part));
        dot = next;
    }
    return result;
}

auto getelem(NodePtr target, NodePtr key) -> NodePtr {
    return detail::make(Token::GetElem, "", std::move(target), std::move(key));
}

auto assign(NodePtr target, NodePtr value) -> NodePtr {
    return detail::make(Token::Assign, "", std::move(target), std::move(value));
}

auto binary(Token op, NodePtr left, NodePtr right) -> NodePtr {
    return detail::make(op, "", std::move(left), std::move(right));
}

auto unary(Token op, NodePtr operand) -> NodePtr {
    return detail::make(op, "", std::move(operand));
}

auto inc(NodePtr operand) -> NodePtr {
    return unary(Token::Inc, std::move(operand));
}

auto dec(NodePtr operand) -> NodePtr {
    return unary(Token::Dec, std::move(operand));
}

auto hook(NodePtr cond, NodePtr then_value, NodePtr else_value) -> NodePtr {
    return detail::make(Token::Hook, "", std::move(cond), std::move(then_value),
                        std::move(else_value));
}

auto and_(NodePtr left, NodePtr right) -> NodePtr {
    return binary(Token::And, std::move(left), std::move(right));
}

auto or_(NodePtr left, NodePtr right) -> NodePtr {
    return binary(Token::Or, std::move(left), std::move(right));
}

auto comma(NodePtr left, NodePtr right) -> NodePtr {
    return binary(Token::Comma, std::move(left), std::move(right));
}

auto cast(NodePtr value) -> NodePtr {
    return unary(Token::Cast, std::move(value));
}

// ============================================================================
// Functions, classes and object literals
// ============================================================================

auto function(std::string id, NodePtr body) -> NodePtr {
    return detail::make(Token::Function, "", name(std::move(id)), make_box<Node>(Token::ParamList),
                        std::move(body));
}

auto empty_function() -> NodePtr {
    return function("", block());
}

auto member_function(std::string id, NodePtr fn) -> NodePtr {
    return detail::make(Token::MemberFunctionDef, std::move(id), std::move(fn));
}

auto static_member_function(std::string id, NodePtr fn) -> NodePtr {
    auto member = member_function(std::move(id), std::move(fn));
    member->set_static_member(true);
    return member;
}

auto getter(std::string id, NodePtr fn) -> NodePtr {
    return detail::make(Token::GetterDef, std::move(id), std::move(fn));
}

auto setter(std::string id, NodePtr fn) -> NodePtr {
    return detail::make(Token::SetterDef, std::move(id), std::move(fn));
}

auto string_key(std::string key, NodePtr value) -> NodePtr {
    return detail::make(Token::StringKey, std::move(key), std::move(value));
}

auto computed_prop(NodePtr key, NodePtr value) -> NodePtr {
    return detail::make(Token::ComputedProp, "", std::move(key), std::move(value));
}

} // namespace deadprop::ast::ir
