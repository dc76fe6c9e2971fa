#include "diag/error_manager.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace deadprop::diag {

void CollectingErrorManager::report(JsError error) {
    reported_.push_back(std::move(error));
}

auto CollectingErrorManager::errors() const -> std::vector<JsError> {
    std::vector<JsError> result;
    for (const auto& e : reported_) {
        if (e.level == CheckLevel::Error) {
            result.push_back(e);
        }
    }
    return result;
}

auto CollectingErrorManager::warnings() const -> std::vector<JsError> {
    std::vector<JsError> result;
    for (const auto& e : reported_) {
        if (e.level == CheckLevel::Warning) {
            result.push_back(e);
        }
    }
    return result;
}

auto CollectingErrorManager::error_count() const -> size_t {
    return static_cast<size_t>(std::count_if(reported_.begin(), reported_.end(), [](const JsError& e) {
        return e.level == CheckLevel::Error;
    }));
}

auto CollectingErrorManager::warning_count() const -> size_t {
    return static_cast<size_t>(std::count_if(reported_.begin(), reported_.end(), [](const JsError& e) {
        return e.level == CheckLevel::Warning;
    }));
}

void PrintingErrorManager::report(JsError error) {
    DEADPROP_LOG_DEBUG("diag", "Reporting " << error.to_string());
    emitter_.emit(error);
    CollectingErrorManager::report(std::move(error));
}

void PrintingErrorManager::set_format(DiagnosticFormat format) {
    emitter_.set_format(format);
}

void PrintingErrorManager::generate_report() {
    DEADPROP_LOG_INFO("diag", "Reported " << error_count() << " error(s), " << warning_count()
                                          << " warning(s)");
    emitter_.emit_summary(error_count(), warning_count());
}

} // namespace deadprop::diag
