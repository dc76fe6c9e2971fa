//! # Tree Construction Helpers
//!
//! Small factory functions for building syntax trees in code, used by
//! tests and by hosts that translate another front end's tree into deadprop
//! nodes.
//!
//! ## Example
//!
//! ```cpp
//! using namespace deadprop::ast::ir;
//!
//! // /** @private */ this.cache_ = null;
//! // The annotation belongs to the assignment, not the statement.
//! auto file = script("foo.js", expr_result(private_(assign(getprop(this_(), "cache_"), null()))));
//! ```
//!
//! Functions that take child nodes are variadic and take ownership of them.

#ifndef DEADPROP_AST_IR_HPP
#define DEADPROP_AST_IR_HPP

#include "ast/node.hpp"

#include <string>

namespace deadprop::ast::ir {

namespace detail {

template <typename... Children> auto make(Token token, std::string str, Children... children) -> NodePtr {
    auto node = make_box<Node>(token, std::move(str));
    (node->add_child(std::move(children)), ...);
    return node;
}

} // namespace detail

// ============================================================================
// Annotations and positions
// ============================================================================

/// Attaches `info` to `node` and returns it.
auto jsdoc(NodePtr node, const JSDocInfo& info) -> NodePtr;

/// Attaches `@private` to `node`.
auto private_(NodePtr node) -> NodePtr;

/// Sets a point span on `node` and returns it.
auto at(NodePtr node, uint32_t line, uint32_t column) -> NodePtr;

// ============================================================================
// Structure
// ============================================================================

template <typename... Stmts> auto root(Stmts... scripts) -> NodePtr {
    return detail::make(Token::Root, "", std::move(scripts)...);
}

template <typename... Stmts> auto script(std::string source_name, Stmts... stmts) -> NodePtr {
    return detail::make(Token::Script, std::move(source_name), std::move(stmts)...);
}

template <typename... Stmts> auto block(Stmts... stmts) -> NodePtr {
    return detail::make(Token::Block, "", std::move(stmts)...);
}

auto empty() -> NodePtr;

// ============================================================================
// Statements
// ============================================================================

auto expr_result(NodePtr expr) -> NodePtr;
auto return_(NodePtr value) -> NodePtr;
auto return_void() -> NodePtr;

/// `var name = value;` (pass null `value` for no initializer).
auto var(std::string name, NodePtr value) -> NodePtr;
auto let(std::string name, NodePtr value) -> NodePtr;
auto const_(std::string name, NodePtr value) -> NodePtr;

auto if_(NodePtr cond, NodePtr then_block) -> NodePtr;
auto if_else(NodePtr cond, NodePtr then_block, NodePtr else_block) -> NodePtr;
auto for_(NodePtr init, NodePtr cond, NodePtr incr, NodePtr body) -> NodePtr;
auto for_in(NodePtr target, NodePtr object, NodePtr body) -> NodePtr;
auto while_(NodePtr cond, NodePtr body) -> NodePtr;

// ============================================================================
// Expressions
// ============================================================================

auto name(std::string id) -> NodePtr;
auto this_() -> NodePtr;
auto string(std::string value) -> NodePtr;
auto number(double value) -> NodePtr;
auto null() -> NodePtr;
auto true_() -> NodePtr;

auto getprop(NodePtr target, std::string prop) -> NodePtr;

/// Builds a `Name`/`GetProp` chain from a dotted name (`a.b.c`).
auto qname(const std::string& dotted) -> NodePtr;

auto getelem(NodePtr target, NodePtr key) -> NodePtr;

template <typename... Args> auto call(NodePtr callee, Args... args) -> NodePtr {
    return detail::make(Token::Call, "", std::move(callee), std::move(args)...);
}

template <typename... Args> auto new_(NodePtr callee, Args... args) -> NodePtr {
    return detail::make(Token::New, "", std::move(callee), std::move(args)...);
}

auto assign(NodePtr target, NodePtr value) -> NodePtr;

/// Binary operator node, including compound assignments (`Token::AssignAdd`).
auto binary(Token op, NodePtr left, NodePtr right) -> NodePtr;

auto unary(Token op, NodePtr operand) -> NodePtr;
auto inc(NodePtr operand) -> NodePtr;
auto dec(NodePtr operand) -> NodePtr;

auto hook(NodePtr cond, NodePtr then_value, NodePtr else_value) -> NodePtr;
auto and_(NodePtr left, NodePtr right) -> NodePtr;
auto or_(NodePtr left, NodePtr right) -> NodePtr;
auto comma(NodePtr left, NodePtr right) -> NodePtr;
auto cast(NodePtr value) -> NodePtr;

// ============================================================================
// Functions, classes and object literals
// ============================================================================

/// `function name() { body }`; an empty `name` makes it anonymous.
auto function(std::string name, NodePtr body) -> NodePtr;

/// Anonymous `function() {}`.
auto empty_function() -> NodePtr;

/// `class name { members }`; an empty `name` makes it anonymous.
template <typename... Members> auto class_(std::string name, Members... members) -> NodePtr {
    auto cls = make_box<Node>(Token::Class);
    cls->add_child(name.empty() ? empty() : ir::name(std::move(name)));
    cls->add_child(empty());
    cls->add_child(detail::make(Token::ClassMembers, "", std::move(members)...));
    return cls;
}

/// `name() { ... }` inside a class body or object literal.
auto member_function(std::string name, NodePtr fn) -> NodePtr;

/// `static name() { ... }` inside a class body.
auto static_member_function(std::string name, NodePtr fn) -> NodePtr;

auto getter(std::string name, NodePtr fn) -> NodePtr;
auto setter(std::string name, NodePtr fn) -> NodePtr;
auto string_key(std::string key, NodePtr value) -> NodePtr;
auto computed_prop(NodePtr key, NodePtr value) -> NodePtr;

template <typename... Entries> auto object_lit(Entries... entries) -> NodePtr {
    return detail::make(Token::ObjectLit, "", std::move(entries)...);
}

} // namespace deadprop::ast::ir

#endif // DEADPROP_AST_IR_HPP
