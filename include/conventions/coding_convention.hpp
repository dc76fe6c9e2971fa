//! # Coding Conventions
//!
//! A coding convention answers project-specific questions about the source,
//! such as which call expressions are property-rename (reflection) helpers.
//!
//! | Convention                | Rename functions                                   |
//! |---------------------------|----------------------------------------------------|
//! | `DefaultCodingConvention` | `JSCompiler_renameProperty`, `$jscomp.reflectProperty` |
//! | `ClosureCodingConvention` | the default ones plus `goog.reflect.objectProperty` |

#ifndef DEADPROP_CONVENTIONS_CODING_CONVENTION_HPP
#define DEADPROP_CONVENTIONS_CODING_CONVENTION_HPP

#include "ast/node.hpp"

#include <string>
#include <string_view>

namespace deadprop::conventions {

class CodingConvention {
public:
    virtual ~CodingConvention() = default;

    /// Convention name as used in configuration ("default", "closure").
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /// Whether `callee` (the first child of a call) names a function that
    /// takes a property name as a string and returns its renamed form.
    [[nodiscard]] virtual auto is_property_rename_function(const ast::Node& callee) const
        -> bool = 0;
};

class DefaultCodingConvention : public CodingConvention {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "default";
    }

    [[nodiscard]] auto is_property_rename_function(const ast::Node& callee) const -> bool override;
};

class ClosureCodingConvention : public DefaultCodingConvention {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "closure";
    }

    [[nodiscard]] auto is_property_rename_function(const ast::Node& callee) const -> bool override;
};

/// Creates the convention named `name`, or null if there is none.
[[nodiscard]] auto make_coding_convention(std::string_view name) -> Box<CodingConvention>;

} // namespace deadprop::conventions

#endif // DEADPROP_CONVENTIONS_CODING_CONVENTION_HPP
