#include "compiler/node_traversal.hpp"

namespace deadprop::compiler {

void NodeTraversal::traverse(const ast::Node& root) {
    // Traversal may start below the root; seed the chain with the real ancestors.
    ancestors_ = ast::collect_ancestors(root);
    source_name_.clear();
    for (const ast::Node* a : ancestors_) {
        if (a->is_script()) {
            source_name_ = a->str();
        }
    }
    traverse_branch(root, root.parent());
}

void NodeTraversal::traverse_branch(const ast::Node& n, const ast::Node* parent) {
    if (n.is_script()) {
        source_name_ = n.str();
    }

    if (!callback_.should_traverse(*this, n, parent)) {
        return;
    }

    ancestors_.push_back(&n);
    for (const auto& child : n.children()) {
        traverse_branch(*child, &n);
    }
    ancestors_.pop_back();

    callback_.visit(*this, n, parent);
}

void NodeTraversal::report(const ast::Node& n, const diag::DiagnosticType& type,
                           std::vector<std::string> args) {
    diag::JsError error;
    error.type = &type;
    error.description = type.format_message(args);
    error.source_name = source_name_;
    error.line = n.span().start.line;
    error.column = n.span().start.column;
    error.level = type.default_level();
    compiler_.report(std::move(error));
}

} // namespace deadprop::compiler
