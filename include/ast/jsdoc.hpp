//! # Doc Annotations
//!
//! Resolved JSDoc metadata attached to declarations. Only the facts the
//! lint passes consume are kept: visibility and the declaration flavor.

#ifndef DEADPROP_AST_JSDOC_HPP
#define DEADPROP_AST_JSDOC_HPP

namespace deadprop::ast {

/// Declared visibility. `Inherited` means no explicit annotation.
enum class Visibility {
    Private,
    Package,
    Protected,
    Public,
    Inherited,
};

/// Returns the lower-case annotation name ("private", "inherited", ...).
const char* visibility_name(Visibility visibility);

/// Annotation metadata for one declaration.
struct JSDocInfo {
    Visibility visibility = Visibility::Inherited;
    bool is_constructor = false; ///< `@constructor`
    bool is_interface = false;   ///< `@interface` or `@record`
    bool has_typedef = false;    ///< `@typedef`

    /// `@private`, `@protected`, ... with no other flags.
    [[nodiscard]] static auto with_visibility(Visibility v) -> JSDocInfo {
        JSDocInfo info;
        info.visibility = v;
        return info;
    }

    /// `@constructor`
    [[nodiscard]] static auto constructor_decl() -> JSDocInfo {
        JSDocInfo info;
        info.is_constructor = true;
        return info;
    }

    /// `@interface`
    [[nodiscard]] static auto interface_decl() -> JSDocInfo {
        JSDocInfo info;
        info.is_interface = true;
        return info;
    }
};

} // namespace deadprop::ast

#endif // DEADPROP_AST_JSDOC_HPP
