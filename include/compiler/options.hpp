//! # Analysis Options
//!
//! Host-facing configuration of a `Compiler` run.
//!
//! ## Configuration File
//!
//! ```toml
//! [analysis]
//! registry-scope = "per-file"        # or "whole-compilation" (default)
//! coding-convention = "closure"      # or "default" (default)
//! diagnostic-format = "json"         # or "text" (default)
//!
//! [checks]
//! unusedPrivateMembers = "warning"   # group name or diagnostic key
//! ```
//!
//! Unknown keys and sections are ignored with a warning. Invalid values make
//! loading fail.

#ifndef DEADPROP_COMPILER_OPTIONS_HPP
#define DEADPROP_COMPILER_OPTIONS_HPP

#include "common.hpp"
#include "diag/diagnostic_type.hpp"
#include "diag/emitter.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace deadprop::compiler {

/// How long registered constructor/interface names stay known.
enum class RegistryScope {
    WholeCompilation, ///< Kept for the whole `process()` run
    PerFile,          ///< Cleared on entering every script
};

[[nodiscard]] auto registry_scope_name(RegistryScope scope) -> const char*;
[[nodiscard]] auto parse_registry_scope(std::string_view s) -> std::optional<RegistryScope>;

struct AnalysisOptions {
    RegistryScope registry_scope = RegistryScope::WholeCompilation;

    /// Name of the coding convention ("default" or "closure").
    std::string coding_convention = "default";

    diag::DiagnosticFormat diagnostic_format = diag::DiagnosticFormat::Text;

    /// Level overrides keyed by diagnostic key or group name.
    std::map<std::string, diag::CheckLevel> check_levels;

    void set_check_level(const std::string& key_or_group, diag::CheckLevel level) {
        check_levels[key_or_group] = level;
    }

    /// The override registered for `key_or_group`, if any.
    [[nodiscard]] auto check_level(const std::string& key_or_group) const
        -> std::optional<diag::CheckLevel>;
};

/// Parses options from configuration text. `origin` names the text in
/// error messages.
[[nodiscard]] auto parse_analysis_options(std::string_view text, const std::string& origin = "<string>")
    -> Result<AnalysisOptions, std::string>;

/// Loads options from a `deadprop.toml` file.
[[nodiscard]] auto load_analysis_options(const std::filesystem::path& path)
    -> Result<AnalysisOptions, std::string>;

} // namespace deadprop::compiler

#endif // DEADPROP_COMPILER_OPTIONS_HPP
