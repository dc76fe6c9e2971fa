#include "conventions/coding_convention.hpp"

namespace deadprop::conventions {

namespace {
constexpr std::string_view RENAME_PROPERTY_FN = "JSCompiler_renameProperty";
constexpr std::string_view REFLECT_PROPERTY_FN = "$jscomp.reflectProperty";
constexpr std::string_view GOOG_OBJECT_PROPERTY_FN = "goog.reflect.objectProperty";
} // namespace

auto DefaultCodingConvention::is_property_rename_function(const ast::Node& callee) const -> bool {
    return callee.matches_qualified_name(RENAME_PROPERTY_FN) ||
           callee.matches_qualified_name(REFLECT_PROPERTY_FN);
}

auto ClosureCodingConvention::is_property_rename_function(const ast::Node& callee) const -> bool {
    return DefaultCodingConvention::is_property_rename_function(callee) ||
           callee.matches_qualified_name(GOOG_OBJECT_PROPERTY_FN);
}

auto make_coding_convention(std::string_view name) -> Box<CodingConvention> {
    if (name == "default") {
        return make_box<DefaultCodingConvention>();
    }
    if (name == "closure") {
        return make_box<ClosureCodingConvention>();
    }
    return nullptr;
}

} // namespace deadprop::conventions
