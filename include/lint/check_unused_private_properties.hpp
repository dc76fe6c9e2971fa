//! # Unused Private Property Check
//!
//! Reports `@private` properties and methods that are never read in the
//! script that declares them.
//!
//! ## Protocol
//!
//! | Event         | Action                                                  |
//! |---------------|---------------------------------------------------------|
//! | enter SCRIPT  | fresh `FileContext` (used names = {"constructor"})       |
//! | GETPROP       | candidate definition, or a use of its name              |
//! | MEMBER_FN_DEF | candidate when checkable-private                        |
//! | OBJECTLIT     | every key is a use                                      |
//! | CALL          | `JSCompiler_renameProperty("x", ...)` style: "x" is a use |
//! | FUNCTION      | constructors/interfaces are registered by name          |
//! | CLASS         | registered by name                                      |
//! | exit SCRIPT   | report candidates whose name was never used             |
//!
//! Uses are tracked by name only: a read of `a.foo` keeps every private
//! `foo` in the script alive.
//!
//! ## Definition Sites
//!
//! `this.x`, `Registered.x` and `Anything.prototype.x` are definition sites.
//! They are still uses when their value is consumed; only stub declarations
//! (`this.x;`), plain assignments (`this.x = v`) and compound updates whose
//! result is discarded (`this.x += 1;`, `this.x++;`) are not.

#ifndef DEADPROP_LINT_CHECK_UNUSED_PRIVATE_PROPERTIES_HPP
#define DEADPROP_LINT_CHECK_UNUSED_PRIVATE_PROPERTIES_HPP

#include "compiler/node_traversal.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace deadprop::lint {

using compiler::RegistryScope;

// ============================================================================
// Node Kinds
// ============================================================================

/// `target.name`
struct PropertyReference {
    const ast::Node* node;
};

/// `name() {}` in a class body or object literal.
struct MethodDeclaration {
    const ast::Node* node;
};

struct ObjectLiteral {
    const ast::Node* node;
};

struct CallSite {
    const ast::Node* node;
};

struct FunctionDecl {
    const ast::Node* node;
};

struct ClassDecl {
    const ast::Node* node;
};

/// A script, seen when leaving it.
struct FileBoundary {
    const ast::Node* node;
};

using PassNode = std::variant<PropertyReference, MethodDeclaration, ObjectLiteral, CallSite,
                              FunctionDecl, ClassDecl, FileBoundary>;

/// The kind of `n` this check reacts to, or nullopt for any other node.
[[nodiscard]] auto classify_node(const ast::Node& n) -> std::optional<PassNode>;

// ============================================================================
// Per-File State
// ============================================================================

struct FileContext {
    FileContext() : used_names{"constructor"} {}

    /// Names proven read somewhere in the file.
    std::unordered_set<std::string> used_names;

    /// Definition sites in encounter order.
    std::vector<const ast::Node*> candidates;
};

/// Qualified names of constructors and interfaces.
class ClassRegistry {
public:
    explicit ClassRegistry(RegistryScope scope = RegistryScope::WholeCompilation) : scope_(scope) {}

    [[nodiscard]] auto scope() const -> RegistryScope {
        return scope_;
    }

    void add(const std::string& qualified_name) {
        names_.insert(qualified_name);
    }

    [[nodiscard]] auto contains(const std::string& qualified_name) const -> bool {
        return names_.count(qualified_name) > 0;
    }

    /// Called on entering a script; forgets names in `PerFile` scope.
    void enter_file() {
        if (scope_ == RegistryScope::PerFile) {
            names_.clear();
        }
    }

    void clear() {
        names_.clear();
    }

    [[nodiscard]] auto size() const -> size_t {
        return names_.size();
    }

private:
    RegistryScope scope_;
    std::unordered_set<std::string> names_;
};

// ============================================================================
// Classification Helpers
// ============================================================================

/// Best annotation marks `n` private.
[[nodiscard]] auto is_private_prop_decl(const ast::Node& n) -> bool;

/// Private, and neither a typedef nor an interface member.
[[nodiscard]] auto is_checkable_private_prop_decl(const ast::Node& n) -> bool;

/// Whether the reference `n` (which must be a GETPROP) proves its property is
/// read. `ancestors` is the chain of `n`.
[[nodiscard]] auto is_pinning_property_use(const ast::Node& n, ast::AncestorChain ancestors) -> bool;

/// Property name of a candidate. Throws `InvariantError` for nodes that are
/// neither GETPROP nor MEMBER_FUNCTION_DEF.
[[nodiscard]] auto get_prop_name(const ast::Node& n) -> const std::string&;

// ============================================================================
// The Check
// ============================================================================

class CheckUnusedPrivateProperties : public compiler::CompilerPass,
                                     public compiler::NodeTraversal::Callback {
public:
    /// Off unless enabled through `unusedPrivateMembers` or its key.
    static const diag::DiagnosticType UNUSED_PRIVATE_PROPERTY;

    /// Group name: `unusedPrivateMembers`.
    static auto group() -> const diag::DiagnosticGroup&;

    explicit CheckUnusedPrivateProperties(compiler::Compiler& compiler);

    [[nodiscard]] auto name() const -> std::string override {
        return "CheckUnusedPrivateProperties";
    }

    void process(const ast::Node& root) override;

    auto should_traverse(compiler::NodeTraversal& t, const ast::Node& n, const ast::Node* parent)
        -> bool override;
    void visit(compiler::NodeTraversal& t, const ast::Node& n, const ast::Node* parent) override;

    /// Whether `n` (which must be a GETPROP) is a definition site.
    [[nodiscard]] auto is_candidate_property_definition(const ast::Node& n) const -> bool;

    [[nodiscard]] auto registry() const -> const ClassRegistry& {
        return registry_;
    }

private:
    void handle(compiler::NodeTraversal& t, FileContext& file, const PassNode& kind);

    void visit_property_reference(compiler::NodeTraversal& t, FileContext& file,
                                  const ast::Node& n);
    void visit_object_literal(FileContext& file, const ast::Node& n);
    void visit_call(FileContext& file, const ast::Node& n);
    void record_constructor_or_interface(const ast::Node& n);
    void report_unused(compiler::NodeTraversal& t, const FileContext& file);

    auto current_file() -> FileContext&;

    compiler::Compiler& compiler_;
    ClassRegistry registry_;
    std::optional<FileContext> file_;
};

} // namespace deadprop::lint

#endif // DEADPROP_LINT_CHECK_UNUSED_PRIVATE_PROPERTIES_HPP
