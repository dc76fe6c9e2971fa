//! # Node Traversal
//!
//! Depth-first traversal driving a `Callback`:
//!
//! - `should_traverse(t, n, parent)` is called before the children of `n`;
//!   returning false skips `n` and its subtree.
//! - `visit(t, n, parent)` is called after the children (post-order).
//!
//! During both calls `ancestors()` is the chain from the root to `parent`
//! and `source_name()` is the name of the enclosing script.

#ifndef DEADPROP_COMPILER_NODE_TRAVERSAL_HPP
#define DEADPROP_COMPILER_NODE_TRAVERSAL_HPP

#include "ast/node_util.hpp"
#include "compiler/compiler.hpp"

#include <string>
#include <vector>

namespace deadprop::compiler {

class NodeTraversal {
public:
    class Callback {
    public:
        virtual ~Callback() = default;

        virtual auto should_traverse(NodeTraversal& t, const ast::Node& n, const ast::Node* parent)
            -> bool {
            (void)t;
            (void)n;
            (void)parent;
            return true;
        }

        virtual void visit(NodeTraversal& t, const ast::Node& n, const ast::Node* parent) = 0;
    };

    NodeTraversal(Compiler& compiler, Callback& callback)
        : compiler_(compiler), callback_(callback) {}

    void traverse(const ast::Node& root);

    /// Convenience for a one-off traversal.
    static void traverse(Compiler& compiler, const ast::Node& root, Callback& callback) {
        NodeTraversal(compiler, callback).traverse(root);
    }

    [[nodiscard]] auto ancestors() const -> ast::AncestorChain {
        return ast::AncestorChain(ancestors_);
    }

    [[nodiscard]] auto source_name() const -> const std::string& {
        return source_name_;
    }

    [[nodiscard]] auto compiler() -> Compiler& {
        return compiler_;
    }

    /// Reports a finding of `type` at `n`, formatting the message with `args`.
    void report(const ast::Node& n, const diag::DiagnosticType& type,
                std::vector<std::string> args = {});

private:
    void traverse_branch(const ast::Node& n, const ast::Node* parent);

    Compiler& compiler_;
    Callback& callback_;
    std::vector<const ast::Node*> ancestors_;
    std::string source_name_;
};

} // namespace deadprop::compiler

#endif // DEADPROP_COMPILER_NODE_TRAVERSAL_HPP
