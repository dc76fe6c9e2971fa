#include "lint/check_unused_private_properties.hpp"

#include "log/log.hpp"

#include <type_traits>

namespace deadprop::lint {

const diag::DiagnosticType CheckUnusedPrivateProperties::UNUSED_PRIVATE_PROPERTY =
    diag::DiagnosticType::disabled("JSC_UNUSED_PRIVATE_PROPERTY",
                                   "Private property {0} is never read");

auto CheckUnusedPrivateProperties::group() -> const diag::DiagnosticGroup& {
    static const diag::DiagnosticGroup group("unusedPrivateMembers", {&UNUSED_PRIVATE_PROPERTY});
    return group;
}

// ============================================================================
// Node Kinds
// ============================================================================

auto classify_node(const ast::Node& n) -> std::optional<PassNode> {
    switch (n.token()) {
    case ast::Token::Script:
        return FileBoundary{&n};
    case ast::Token::GetProp:
        return PropertyReference{&n};
    case ast::Token::MemberFunctionDef:
        return MethodDeclaration{&n};
    case ast::Token::ObjectLit:
        return ObjectLiteral{&n};
    case ast::Token::Call:
        return CallSite{&n};
    case ast::Token::Function:
        return FunctionDecl{&n};
    case ast::Token::Class:
        return ClassDecl{&n};
    default:
        return std::nullopt;
    }
}

// ============================================================================
// Classification Helpers
// ============================================================================

auto is_private_prop_decl(const ast::Node& n) -> bool {
    const ast::JSDocInfo* info = ast::get_best_jsdoc_info(n);
    return info != nullptr && info->visibility == ast::Visibility::Private;
}

auto is_checkable_private_prop_decl(const ast::Node& n) -> bool {
    const ast::JSDocInfo* info = ast::get_best_jsdoc_info(n);
    return info != nullptr && info->visibility == ast::Visibility::Private && !info->has_typedef &&
           !info->is_interface;
}

auto is_pinning_property_use(const ast::Node& n, ast::AncestorChain ancestors) -> bool {
    const ast::Node* parent = ancestors.parent();
    if (!parent) {
        throw InvariantError("property reference without a parent: " + n.to_string());
    }

    if (&n != parent->first_child()) {
        return true;
    }
    // Stub declaration `this.x;`
    if (parent->is_expr_result()) {
        return false;
    }
    if (parent->is_assign()) {
        return false;
    }
    // `this.x += 1` reads and writes; only the write matters unless the
    // result feeds a larger expression, as in `y = (this.x += 1)`.
    if (ast::is_assignment_op(*parent) || parent->is_inc() || parent->is_dec()) {
        return ast::is_expression_result_used(*parent, ancestors.pop());
    }
    return true;
}

auto get_prop_name(const ast::Node& n) -> const std::string& {
    if (!n.is_get_prop() && !n.is_member_function_def()) {
        throw InvariantError("unexpected node type: " + n.to_string());
    }
    return n.str();
}

// ============================================================================
// CheckUnusedPrivateProperties
// ============================================================================

CheckUnusedPrivateProperties::CheckUnusedPrivateProperties(compiler::Compiler& compiler)
    : compiler_(compiler), registry_(compiler.options().registry_scope) {
    compiler_.register_group(group());
}

void CheckUnusedPrivateProperties::process(const ast::Node& root) {
    registry_.clear();
    file_.reset();
    compiler::NodeTraversal::traverse(compiler_, root, *this);
}

auto CheckUnusedPrivateProperties::should_traverse(compiler::NodeTraversal& t, const ast::Node& n,
                                                   const ast::Node* parent) -> bool {
    (void)parent;
    if (n.is_script()) {
        DEADPROP_LOG_TRACE("lint", "Entering " << t.source_name());
        file_.emplace();
        registry_.enter_file();
    }
    return true;
}

void CheckUnusedPrivateProperties::visit(compiler::NodeTraversal& t, const ast::Node& n,
                                         const ast::Node* parent) {
    (void)parent;
    if (auto kind = classify_node(n)) {
        handle(t, current_file(), *kind);
    }
}

auto CheckUnusedPrivateProperties::current_file() -> FileContext& {
    // Trees without a script node still get one context for the whole run.
    if (!file_) {
        file_.emplace();
    }
    return *file_;
}

void CheckUnusedPrivateProperties::handle(compiler::NodeTraversal& t, FileContext& file,
                                          const PassNode& kind) {
    std::visit(
        [&](const auto& k) {
            using T = std::decay_t<decltype(k)>;

            if constexpr (std::is_same_v<T, FileBoundary>) {
                report_unused(t, file);
            } else if constexpr (std::is_same_v<T, PropertyReference>) {
                visit_property_reference(t, file, *k.node);
            } else if constexpr (std::is_same_v<T, MethodDeclaration>) {
                if (is_checkable_private_prop_decl(*k.node)) {
                    file.candidates.push_back(k.node);
                }
            } else if constexpr (std::is_same_v<T, ObjectLiteral>) {
                visit_object_literal(file, *k.node);
            } else if constexpr (std::is_same_v<T, CallSite>) {
                visit_call(file, *k.node);
            } else if constexpr (std::is_same_v<T, FunctionDecl>) {
                const ast::JSDocInfo* info = ast::get_best_jsdoc_info(*k.node);
                if (info && (info->is_constructor || info->is_interface)) {
                    record_constructor_or_interface(*k.node);
                }
            } else if constexpr (std::is_same_v<T, ClassDecl>) {
                record_constructor_or_interface(*k.node);
            } else {
                static_assert(std::is_same_v<T, void>, "unhandled PassNode alternative");
            }
        },
        kind);
}

void CheckUnusedPrivateProperties::visit_property_reference(compiler::NodeTraversal& t,
                                                            FileContext& file,
                                                            const ast::Node& n) {
    if (is_pinning_property_use(n, t.ancestors()) || !is_candidate_property_definition(n)) {
        file.used_names.insert(n.str());
    } else if (is_checkable_private_prop_decl(n)) {
        DEADPROP_LOG_TRACE("lint", "Candidate " << n.to_string());
        file.candidates.push_back(&n);
    }
}

void CheckUnusedPrivateProperties::visit_object_literal(FileContext& file, const ast::Node& n) {
    // Any key may reflect on a class property.
    for (const auto& child : n.children()) {
        if (child->is_string_key() || child->is_getter_def() || child->is_setter_def() ||
            child->is_member_function_def()) {
            file.used_names.insert(child->str());
        }
    }
}

void CheckUnusedPrivateProperties::visit_call(FileContext& file, const ast::Node& n) {
    if (!n.has_more_than_one_child()) {
        return;
    }
    const ast::Node* callee = n.first_child();
    if (!compiler_.coding_convention().is_property_rename_function(*callee)) {
        return;
    }
    const ast::Node* prop_name = callee->next();
    if (prop_name->is_string_lit()) {
        file.used_names.insert(prop_name->str());
    }
}

void CheckUnusedPrivateProperties::record_constructor_or_interface(const ast::Node& n) {
    auto class_name = ast::get_best_lvalue_name(ast::get_best_lvalue(n));
    if (!class_name) {
        // Static members of an anonymous class are never candidates.
        DEADPROP_LOG_DEBUG("lint", "Unnamed class or constructor at " << n.to_string());
        return;
    }
    DEADPROP_LOG_TRACE("lint", "Registered " << *class_name);
    registry_.add(*class_name);
}

auto CheckUnusedPrivateProperties::is_candidate_property_definition(const ast::Node& n) const
    -> bool {
    if (!n.is_get_prop()) {
        throw InvariantError("expected GETPROP, found " + n.to_string());
    }
    const ast::Node* target = n.first_child();
    if (!target) {
        throw InvariantError("GETPROP without a target: " + n.to_string());
    }

    if (target->is_this()) {
        return true;
    }
    if (auto qname = target->qualified_name(); qname && registry_.contains(*qname)) {
        return true;
    }
    return target->is_get_prop() && target->str() == "prototype";
}

void CheckUnusedPrivateProperties::report_unused(compiler::NodeTraversal& t,
                                                 const FileContext& file) {
    size_t reported = 0;
    for (const ast::Node* candidate : file.candidates) {
        const std::string& prop_name = get_prop_name(*candidate);
        if (file.used_names.count(prop_name) == 0) {
            t.report(*candidate, UNUSED_PRIVATE_PROPERTY, {prop_name});
            ++reported;
        }
    }
    DEADPROP_LOG_DEBUG("lint", t.source_name() << ": " << file.candidates.size()
                                               << " candidate(s), " << reported << " unused");
}

} // namespace deadprop::lint
