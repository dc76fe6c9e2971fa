//! # Node Utilities
//!
//! Structural queries over the syntax tree used by the analysis passes.
//!
//! ## Resolvers
//!
//! | Function                      | Answers                                          |
//! |-------------------------------|--------------------------------------------------|
//! | `get_best_jsdoc_info`         | Nearest annotation that applies to a declaration |
//! | `get_best_lvalue`             | The name a function/class value is bound to      |
//! | `get_best_lvalue_name`        | Dotted form of that binding                      |
//! | `is_expression_result_used`   | Whether an expression's value is consumed        |
//!
//! The resolvers are best-effort: "no information" is returned as a null
//! pointer or `std::nullopt`, never as an error.

#ifndef DEADPROP_AST_NODE_UTIL_HPP
#define DEADPROP_AST_NODE_UTIL_HPP

#include "ast/node.hpp"

#include <optional>
#include <span>
#include <string>

namespace deadprop::ast {

// ============================================================================
// Ancestor Chain
// ============================================================================

/// The ancestors of a node, passed explicitly to context-sensitive queries.
///
/// Built from a root-first path (root, ..., parent). `parent()` is the last
/// element; `pop()` yields the chain of the parent itself.
class AncestorChain {
public:
    AncestorChain() = default;
    explicit AncestorChain(std::span<const Node* const> root_first) : path_(root_first) {}

    /// Nearest ancestor, or null at the root.
    [[nodiscard]] auto parent() const -> const Node* {
        return path_.empty() ? nullptr : path_.back();
    }

    /// Ancestor `depth` levels up (0 = parent, 1 = grandparent), or null.
    [[nodiscard]] auto at(size_t depth) const -> const Node* {
        return depth < path_.size() ? path_[path_.size() - 1 - depth] : nullptr;
    }

    /// The chain of this chain's parent.
    [[nodiscard]] auto pop() const -> AncestorChain {
        return path_.empty() ? AncestorChain() : AncestorChain(path_.first(path_.size() - 1));
    }

    [[nodiscard]] auto size() const -> size_t {
        return path_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return path_.empty();
    }

private:
    std::span<const Node* const> path_;
};

/// Collects the root-first ancestor path of `n` by following parent links.
/// Intended for callers outside a traversal (tests, tools).
[[nodiscard]] auto collect_ancestors(const Node& n) -> std::vector<const Node*>;

// ============================================================================
// Operator Classification
// ============================================================================

/// `=` or any compound assignment (`+=`, `||=`, ...).
[[nodiscard]] auto is_assignment_op(const Node& n) -> bool;

/// Compound assignment only (`+=`, `-=`, `**=`, `&&=`, `??=`, ...).
[[nodiscard]] auto is_compound_assignment_op(const Node& n) -> bool;

/// `STRING_KEY`, `GETTER_DEF`, `SETTER_DEF` or `MEMBER_FUNCTION_DEF` whose
/// parent is an object literal.
[[nodiscard]] auto is_object_lit_key(const Node& n) -> bool;

/// `function f() {}` or `class C {}` in statement position with a name.
[[nodiscard]] auto is_declaration_statement(const Node& n) -> bool;

// ============================================================================
// Expression Result Usage
// ============================================================================

/// Whether the value of `expr` is consumed by its context.
///
/// `ancestors` must be the ancestor chain of `expr` (its parent last).
/// Expressions directly under a block or expression statement are unused;
/// the value positions of `?:`, `&&`, `||`, `,` and casts defer to their
/// enclosing expression; in a `for` header only the condition is used.
[[nodiscard]] auto is_expression_result_used(const Node& expr, AncestorChain ancestors) -> bool;

// ============================================================================
// Annotation and Name Resolution
// ============================================================================

/// The annotation that best applies to `n`: its own, or one inherited from
/// the assignment, variable declaration, object-literal key or member
/// definition that introduces it. Null when there is none.
[[nodiscard]] auto get_best_jsdoc_info(const Node& n) -> const JSDocInfo*;

/// The node naming the binding of a function or class value:
/// the declared name, the variable it initializes, the left side of the
/// assignment it is the value of, or the object-literal key. Null when
/// anonymous.
[[nodiscard]] auto get_best_lvalue(const Node& n) -> const Node*;

/// Dotted name of an l-value found by `get_best_lvalue()`. Object-literal
/// keys are prefixed with the name of the literal's own binding
/// (`ns.Foo` for `ns = {Foo: ...}`). Nullopt if `lvalue` is null or unnamed.
[[nodiscard]] auto get_best_lvalue_name(const Node* lvalue) -> std::optional<std::string>;

} // namespace deadprop::ast

#endif // DEADPROP_AST_NODE_UTIL_HPP
