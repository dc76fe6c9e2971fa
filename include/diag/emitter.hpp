//! # Diagnostic Emitter
//!
//! Renders reported findings for humans or tools.
//!
//! ## Text Output
//!
//! ```text
//! warning[JSC_UNUSED_PRIVATE_PROPERTY]: Private property cache_ is never read
//!   --> foo.js:3:5
//!      |
//!    3 |     this.cache_ = null;
//!      |     ^
//!      |
//! ```
//!
//! The snippet is shown only when the source text of the file was registered
//! with `set_source_content()`.
//!
//! ## JSON Output
//!
//! One object per line:
//! `{"severity":"warning","code":"JSC_...","message":"...","span":{"file":"foo.js","line":3,"column":5}}`

#pragma once

#include "diag/diagnostic_type.hpp"

#include <iostream>
#include <string>
#include <unordered_map>

namespace deadprop::diag {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
};

/// Output format for rendered diagnostics.
enum class DiagnosticFormat {
    Text, ///< Human-readable text output (default)
    JSON  ///< Machine-readable JSON, one object per line
};

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

    void set_format(DiagnosticFormat format) {
        format_ = format;
    }

    [[nodiscard]] auto format() const -> DiagnosticFormat {
        return format_;
    }

    /// Registers the text of `path` so findings in it get a source snippet.
    void set_source_content(const std::string& path, const std::string& content);

    /// Renders one finding. `Off` findings are never passed here.
    void emit(const JsError& error);

    /// Renders the closing "N error(s), M warning(s)" line (text format only).
    void emit_summary(size_t errors, size_t warnings);

private:
    std::ostream& out_;
    bool use_colors_ = true;
    DiagnosticFormat format_ = DiagnosticFormat::Text;
    std::unordered_map<std::string, std::string> source_files_; // path -> content

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_text(const JsError& error);
    void emit_json(const JsError& error);
    void emit_source_snippet(const JsError& error);

    std::string get_source_line(const std::string& path, uint32_t line) const;
    static std::string escape_json_string(const std::string& s);
};

/// Check if stderr is a terminal that supports colors.
bool terminal_supports_colors();

} // namespace deadprop::diag
