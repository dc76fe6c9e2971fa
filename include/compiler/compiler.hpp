//! # Compiler Context
//!
//! Shared state of one analysis run: the options, the active coding
//! convention, the known diagnostic groups and the error manager that
//! receives findings.
//!
//! ## Check Level Resolution
//!
//! For a finding of type `T`, the effective level is the first of:
//!
//! 1. an override for `T.key()` in `AnalysisOptions::check_levels`,
//! 2. an override for a registered group containing `T`,
//! 3. `T.default_level()`.
//!
//! Findings that resolve to `Off` never reach the error manager.

#ifndef DEADPROP_COMPILER_COMPILER_HPP
#define DEADPROP_COMPILER_COMPILER_HPP

#include "compiler/compiler_pass.hpp"
#include "compiler/options.hpp"
#include "conventions/coding_convention.hpp"
#include "diag/error_manager.hpp"

#include <vector>

namespace deadprop::compiler {

class Compiler {
public:
    /// Throws `InvariantError` if `options.coding_convention` names no
    /// known convention.
    Compiler(AnalysisOptions options, diag::ErrorManager& errors);

    Compiler(const Compiler&) = delete;
    Compiler& operator=(const Compiler&) = delete;

    [[nodiscard]] auto options() const -> const AnalysisOptions& {
        return options_;
    }

    [[nodiscard]] auto coding_convention() const -> const conventions::CodingConvention& {
        return *convention_;
    }

    [[nodiscard]] auto error_manager() -> diag::ErrorManager& {
        return errors_;
    }

    [[nodiscard]] auto passes() -> PassManager& {
        return passes_;
    }

    /// Makes `group` available for level overrides. Groups are registered
    /// by the passes that own their types.
    void register_group(const diag::DiagnosticGroup& group);

    [[nodiscard]] auto check_level(const diag::DiagnosticType& type) const -> diag::CheckLevel;

    /// Assigns the effective level to `error` and forwards it unless `Off`.
    void report(diag::JsError error);

    /// Runs every added pass over `root`, then lets the error manager
    /// produce its report.
    void process(const ast::Node& root);

private:
    AnalysisOptions options_;
    diag::ErrorManager& errors_;
    Box<conventions::CodingConvention> convention_;
    std::vector<const diag::DiagnosticGroup*> groups_;
    PassManager passes_;
};

} // namespace deadprop::compiler

#endif // DEADPROP_COMPILER_COMPILER_HPP
