//! # Common Definitions
//!
//! This module provides common types and utilities used throughout
//! deadprop. It establishes the foundational abstractions that all
//! other components depend on.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Library version constants
//! - **Source Locations**: Types for tracking source code positions
//! - **Result Type**: Error handling for fallible I/O
//! - **Invariant Checks**: `check_state` for contract violations
//! - **Smart Pointers**: `Box<T>` alias for unique ownership
//!
//! ## Design Philosophy
//!
//! - **Findings are not errors**: diagnostics about user code never throw
//! - **Fallible I/O returns `Result<T, E>`**
//! - **Contract violations throw `InvariantError`** and are never swallowed
//! - **Explicit Ownership**: `Box<T>` for unique ownership

#ifndef DEADPROP_COMMON_HPP
#define DEADPROP_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace deadprop {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 1;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Source Location Types
// ============================================================================

/// A position in source code.
///
/// # Fields
///
/// - `line`: 1-based line number (0 when unknown)
/// - `column`: 1-based column number (0 when unknown)
/// - `offset`: 0-based byte offset from file start
/// - `length`: Length of the source element in bytes
struct SourceLocation {
    /// Line number (1-based).
    uint32_t line = 0;

    /// Column number (1-based).
    uint32_t column = 0;

    /// Byte offset from start of file (0-based).
    uint32_t offset = 0;

    /// Length of the source element in bytes.
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
///
/// The file a span belongs to is not stored here; it is the source name of
/// the enclosing script node.
struct SourceSpan {
    /// Start location of the span.
    SourceLocation start;

    /// End location of the span.
    SourceLocation end;

    /// Creates a span covering a single point.
    [[nodiscard]] static auto at(uint32_t line, uint32_t column) -> SourceSpan {
        SourceLocation loc{line, column, 0, 0};
        return {loc, loc};
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<AnalysisOptions, std::string> opts = load_analysis_options(path);
/// if (is_ok(opts)) {
///     auto& value = unwrap(opts);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Invariant Checks
// ============================================================================

/// Raised when a component is handed input that breaks its contract
/// (for example, a property-name lookup on a node that has no name).
///
/// These indicate a bug in the caller or the tree builder, not a problem in
/// the analyzed code, and abort the current pass invocation.
class InvariantError : public std::logic_error {
public:
    explicit InvariantError(const std::string& what) : std::logic_error(what) {}
};

/// Throws `InvariantError` with `message` if `condition` is false.
inline void check_state(bool condition, const std::string& message) {
    if (!condition) {
        throw InvariantError(message);
    }
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer (like Rust's `Box<T>`).
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace deadprop

#endif // DEADPROP_COMMON_HPP
