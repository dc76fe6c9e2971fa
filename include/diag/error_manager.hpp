//! # Error Managers
//!
//! Sinks for findings produced by the analysis passes.
//!
//! | Manager                  | Behavior                                      |
//! |--------------------------|-----------------------------------------------|
//! | `CollectingErrorManager` | Keeps every finding in report order           |
//! | `PrintingErrorManager`   | Collects and renders through an emitter       |
//!
//! Findings at `CheckLevel::Off` are filtered before they reach a manager.

#ifndef DEADPROP_DIAG_ERROR_MANAGER_HPP
#define DEADPROP_DIAG_ERROR_MANAGER_HPP

#include "diag/diagnostic_type.hpp"
#include "diag/emitter.hpp"

#include <vector>

namespace deadprop::diag {

// ============================================================================
// Error Manager Interface
// ============================================================================

class ErrorManager {
public:
    virtual ~ErrorManager() = default;

    /// Records one finding.
    virtual void report(JsError error) = 0;

    [[nodiscard]] virtual auto errors() const -> std::vector<JsError> = 0;
    [[nodiscard]] virtual auto warnings() const -> std::vector<JsError> = 0;

    [[nodiscard]] virtual auto error_count() const -> size_t = 0;
    [[nodiscard]] virtual auto warning_count() const -> size_t = 0;

    /// Selects how findings are rendered. Managers that do not render ignore it.
    virtual void set_format(DiagnosticFormat /*format*/) {}

    /// Called once after all passes ran.
    virtual void generate_report() {}
};

// ============================================================================
// Collecting Error Manager
// ============================================================================

class CollectingErrorManager : public ErrorManager {
public:
    void report(JsError error) override;

    [[nodiscard]] auto errors() const -> std::vector<JsError> override;
    [[nodiscard]] auto warnings() const -> std::vector<JsError> override;
    [[nodiscard]] auto error_count() const -> size_t override;
    [[nodiscard]] auto warning_count() const -> size_t override;

    /// Every finding, errors and warnings interleaved, in report order.
    [[nodiscard]] auto all() const -> const std::vector<JsError>& {
        return reported_;
    }

    void clear() {
        reported_.clear();
    }

private:
    std::vector<JsError> reported_;
};

// ============================================================================
// Printing Error Manager
// ============================================================================

/// Renders each finding as it arrives and a summary in `generate_report()`.
class PrintingErrorManager : public CollectingErrorManager {
public:
    explicit PrintingErrorManager(DiagnosticEmitter& emitter) : emitter_(emitter) {}

    void report(JsError error) override;
    void set_format(DiagnosticFormat format) override;
    void generate_report() override;

private:
    DiagnosticEmitter& emitter_;
};

} // namespace deadprop::diag

#endif // DEADPROP_DIAG_ERROR_MANAGER_HPP
