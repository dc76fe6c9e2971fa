#include "compiler/compiler.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace deadprop::compiler {

// ============================================================================
// PassManager
// ============================================================================

void PassManager::run(const ast::Node& root) {
    for (auto& pass : passes_) {
        DEADPROP_LOG_DEBUG("pass", "Running " << pass->name());
        try {
            pass->process(root);
        } catch (const InvariantError& e) {
            DEADPROP_LOG_ERROR("pass", pass->name() << " failed: " << e.what());
            throw;
        }
        DEADPROP_LOG_TRACE("pass", "Finished " << pass->name());
    }
}

// ============================================================================
// Compiler
// ============================================================================

Compiler::Compiler(AnalysisOptions options, diag::ErrorManager& errors)
    : options_(std::move(options)), errors_(errors),
      convention_(conventions::make_coding_convention(options_.coding_convention)) {
    check_state(convention_ != nullptr,
                "unknown coding convention '" + options_.coding_convention + "'");
    errors_.set_format(options_.diagnostic_format);
}

void Compiler::register_group(const diag::DiagnosticGroup& group) {
    if (std::find(groups_.begin(), groups_.end(), &group) == groups_.end()) {
        groups_.push_back(&group);
    }
}

auto Compiler::check_level(const diag::DiagnosticType& type) const -> diag::CheckLevel {
    if (auto level = options_.check_level(type.key())) {
        return *level;
    }
    for (const auto* group : groups_) {
        if (group->contains(type)) {
            if (auto level = options_.check_level(group->name())) {
                return *level;
            }
        }
    }
    return type.default_level();
}

void Compiler::report(diag::JsError error) {
    check_state(error.type != nullptr, "reported error has no diagnostic type");
    error.level = check_level(*error.type);
    if (error.level == diag::CheckLevel::Off) {
        DEADPROP_LOG_TRACE("diag", "Dropping disabled " << error.to_string());
        return;
    }
    errors_.report(std::move(error));
}

void Compiler::process(const ast::Node& root) {
    DEADPROP_LOG_INFO("pass", "Processing with " << passes_.size() << " pass(es), registry-scope="
                                                  << registry_scope_name(options_.registry_scope));
    passes_.run(root);
    errors_.generate_report();
}

} // namespace deadprop::compiler
