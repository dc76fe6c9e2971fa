//! # Syntax Tree Nodes
//!
//! A `Node` is one element of a JavaScript syntax tree: a token, an optional
//! string payload (names, property names, literal values), an optional doc
//! annotation, a source span, and an ordered list of owned children.
//!
//! ## Ownership
//!
//! Parents own their children through `Box<Node>`. Every child keeps a raw
//! back-pointer to its parent and to its next sibling; both are maintained
//! by `add_child()` and never dangle while the tree is alive.
//!
//! ## Example
//!
//! ```cpp
//! auto prop = make_box<Node>(Token::GetProp, "cache_");
//! prop->add_child(make_box<Node>(Token::This));
//! prop->qualified_name(); // "this.cache_"
//! ```

#ifndef DEADPROP_AST_NODE_HPP
#define DEADPROP_AST_NODE_HPP

#include "ast/jsdoc.hpp"
#include "ast/token.hpp"
#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deadprop::ast {

class Node {
public:
    explicit Node(Token token) : token_(token) {}
    Node(Token token, std::string str) : token_(token), string_(std::move(str)) {}

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // ------------------------------------------------------------------------
    // Payload
    // ------------------------------------------------------------------------

    [[nodiscard]] auto token() const -> Token {
        return token_;
    }

    /// The string payload: identifier for `Name`, property for `GetProp`,
    /// key for object-literal and class members, value for `StringLit`,
    /// source name for `Script`.
    [[nodiscard]] auto str() const -> const std::string& {
        return string_;
    }

    void set_str(std::string str) {
        string_ = std::move(str);
    }

    [[nodiscard]] auto span() const -> const SourceSpan& {
        return span_;
    }

    void set_span(const SourceSpan& span) {
        span_ = span;
    }

    /// The annotation attached directly to this node, or null.
    [[nodiscard]] auto jsdoc_info() const -> const JSDocInfo* {
        return jsdoc_ ? &*jsdoc_ : nullptr;
    }

    void set_jsdoc_info(const JSDocInfo& info) {
        jsdoc_ = info;
    }

    /// Static class member (`static foo() {}`).
    [[nodiscard]] auto is_static_member() const -> bool {
        return is_static_;
    }

    void set_static_member(bool value) {
        is_static_ = value;
    }

    // ------------------------------------------------------------------------
    // Structure
    // ------------------------------------------------------------------------

    [[nodiscard]] auto parent() const -> Node* {
        return parent_;
    }

    [[nodiscard]] auto next() const -> Node* {
        return next_;
    }

    [[nodiscard]] auto first_child() const -> Node* {
        return children_.empty() ? nullptr : children_.front().get();
    }

    [[nodiscard]] auto second_child() const -> Node* {
        return children_.size() < 2 ? nullptr : children_[1].get();
    }

    [[nodiscard]] auto last_child() const -> Node* {
        return children_.empty() ? nullptr : children_.back().get();
    }

    [[nodiscard]] auto child_at(size_t index) const -> Node* {
        return index < children_.size() ? children_[index].get() : nullptr;
    }

    [[nodiscard]] auto children() const -> const std::vector<Box<Node>>& {
        return children_;
    }

    [[nodiscard]] auto child_count() const -> size_t {
        return children_.size();
    }

    [[nodiscard]] auto has_children() const -> bool {
        return !children_.empty();
    }

    [[nodiscard]] auto has_one_child() const -> bool {
        return children_.size() == 1;
    }

    [[nodiscard]] auto has_more_than_one_child() const -> bool {
        return children_.size() > 1;
    }

    /// Appends `child`, taking ownership, and returns a pointer to it.
    auto add_child(Box<Node> child) -> Node*;

    // ------------------------------------------------------------------------
    // Kind predicates
    // ------------------------------------------------------------------------

    [[nodiscard]] auto is(Token token) const -> bool {
        return token_ == token;
    }

    [[nodiscard]] auto is_script() const -> bool { return token_ == Token::Script; }
    [[nodiscard]] auto is_block() const -> bool { return token_ == Token::Block; }
    [[nodiscard]] auto is_empty() const -> bool { return token_ == Token::Empty; }
    [[nodiscard]] auto is_expr_result() const -> bool { return token_ == Token::ExprResult; }
    [[nodiscard]] auto is_name() const -> bool { return token_ == Token::Name; }
    [[nodiscard]] auto is_this() const -> bool { return token_ == Token::This; }
    [[nodiscard]] auto is_get_prop() const -> bool { return token_ == Token::GetProp; }
    [[nodiscard]] auto is_call() const -> bool { return token_ == Token::Call; }
    [[nodiscard]] auto is_assign() const -> bool { return token_ == Token::Assign; }
    [[nodiscard]] auto is_inc() const -> bool { return token_ == Token::Inc; }
    [[nodiscard]] auto is_dec() const -> bool { return token_ == Token::Dec; }
    [[nodiscard]] auto is_function() const -> bool { return token_ == Token::Function; }
    [[nodiscard]] auto is_class() const -> bool { return token_ == Token::Class; }
    [[nodiscard]] auto is_class_members() const -> bool { return token_ == Token::ClassMembers; }
    [[nodiscard]] auto is_object_lit() const -> bool { return token_ == Token::ObjectLit; }
    [[nodiscard]] auto is_string_key() const -> bool { return token_ == Token::StringKey; }
    [[nodiscard]] auto is_getter_def() const -> bool { return token_ == Token::GetterDef; }
    [[nodiscard]] auto is_setter_def() const -> bool { return token_ == Token::SetterDef; }
    [[nodiscard]] auto is_string_lit() const -> bool { return token_ == Token::StringLit; }
    [[nodiscard]] auto is_hook() const -> bool { return token_ == Token::Hook; }
    [[nodiscard]] auto is_and() const -> bool { return token_ == Token::And; }
    [[nodiscard]] auto is_or() const -> bool { return token_ == Token::Or; }
    [[nodiscard]] auto is_comma() const -> bool { return token_ == Token::Comma; }
    [[nodiscard]] auto is_cast() const -> bool { return token_ == Token::Cast; }

    [[nodiscard]] auto is_member_function_def() const -> bool {
        return token_ == Token::MemberFunctionDef;
    }

    /// `var`, `let` or `const`.
    [[nodiscard]] auto is_name_declaration() const -> bool {
        return token_ == Token::Var || token_ == Token::Let || token_ == Token::Const;
    }

    // ------------------------------------------------------------------------
    // Names
    // ------------------------------------------------------------------------

    /// Dotted name of a `Name`/`This`/`Super`/`GetProp` chain
    /// (`a.b.c`, `this.x`), or nullopt for any other shape.
    [[nodiscard]] auto qualified_name() const -> std::optional<std::string>;

    /// True if this node is a qualified name spelling exactly `name`.
    [[nodiscard]] auto matches_qualified_name(std::string_view name) const -> bool;

    /// Short description for diagnostics and invariant messages: `GETPROP cache_ 3:5`.
    [[nodiscard]] auto to_string() const -> std::string;

private:
    Token token_;
    std::string string_;
    SourceSpan span_;
    std::optional<JSDocInfo> jsdoc_;
    bool is_static_ = false;

    Node* parent_ = nullptr;
    Node* next_ = nullptr;
    std::vector<Box<Node>> children_;
};

using NodePtr = Box<Node>;

} // namespace deadprop::ast

#endif // DEADPROP_AST_NODE_HPP
