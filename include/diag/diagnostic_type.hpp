//! # Diagnostic Types
//!
//! A `DiagnosticType` is the stable identity of one kind of finding: a key
//! (`JSC_UNUSED_PRIVATE_PROPERTY`), a message template with positional
//! `{0}`..`{n}` placeholders, and a default `CheckLevel`.
//!
//! A `JsError` is one concrete finding produced from a type: formatted
//! message, location and the level it was reported at.
//!
//! ## Check Levels
//!
//! | Level     | Effect                                    |
//! |-----------|-------------------------------------------|
//! | `Off`     | Finding is dropped                        |
//! | `Warning` | Reported, does not fail the build         |
//! | `Error`   | Reported and counted as an error          |
//!
//! Types created with `DiagnosticType::disabled()` default to `Off` and only
//! surface when the host raises their level.

#ifndef DEADPROP_DIAG_DIAGNOSTIC_TYPE_HPP
#define DEADPROP_DIAG_DIAGNOSTIC_TYPE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deadprop::diag {

// ============================================================================
// Check Level
// ============================================================================

enum class CheckLevel {
    Off,
    Warning,
    Error,
};

/// Returns "off", "warning" or "error".
const char* check_level_name(CheckLevel level);

/// Parses "off", "warning"/"warn" or "error" (lower case). Nullopt otherwise.
auto parse_check_level(std::string_view s) -> std::optional<CheckLevel>;

// ============================================================================
// Diagnostic Type
// ============================================================================

class DiagnosticType {
public:
    DiagnosticType(std::string key, std::string format, CheckLevel default_level)
        : key_(std::move(key)), format_(std::move(format)), default_level_(default_level) {}

    /// A type that is off unless the host enables it.
    static auto disabled(std::string key, std::string format) -> DiagnosticType {
        return {std::move(key), std::move(format), CheckLevel::Off};
    }

    static auto warning(std::string key, std::string format) -> DiagnosticType {
        return {std::move(key), std::move(format), CheckLevel::Warning};
    }

    static auto error(std::string key, std::string format) -> DiagnosticType {
        return {std::move(key), std::move(format), CheckLevel::Error};
    }

    [[nodiscard]] auto key() const -> const std::string& {
        return key_;
    }

    [[nodiscard]] auto format() const -> const std::string& {
        return format_;
    }

    [[nodiscard]] auto default_level() const -> CheckLevel {
        return default_level_;
    }

    /// Substitutes `{i}` with `args[i]`. Placeholders without an argument are
    /// kept verbatim.
    [[nodiscard]] auto format_message(const std::vector<std::string>& args) const -> std::string;

    bool operator==(const DiagnosticType& other) const {
        return key_ == other.key_;
    }

private:
    std::string key_;
    std::string format_;
    CheckLevel default_level_;
};

// ============================================================================
// Diagnostic Group
// ============================================================================

/// A named set of diagnostic types whose level can be configured together.
class DiagnosticGroup {
public:
    DiagnosticGroup(std::string name, std::vector<const DiagnosticType*> types)
        : name_(std::move(name)), types_(std::move(types)) {}

    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto types() const -> const std::vector<const DiagnosticType*>& {
        return types_;
    }

    [[nodiscard]] auto contains(const DiagnosticType& type) const -> bool;

private:
    std::string name_;
    std::vector<const DiagnosticType*> types_;
};

// ============================================================================
// Reported Finding
// ============================================================================

struct JsError {
    const DiagnosticType* type = nullptr; ///< Never null for reported errors
    std::string description;              ///< Formatted message
    std::string source_name;              ///< Script the finding is in
    uint32_t line = 0;                    ///< 1-based, 0 if unknown
    uint32_t column = 0;                  ///< 1-based, 0 if unknown
    CheckLevel level = CheckLevel::Warning;

    /// `foo.js:3:5: WARNING - [JSC_KEY] message`
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace deadprop::diag

#endif // DEADPROP_DIAG_DIAGNOSTIC_TYPE_HPP
