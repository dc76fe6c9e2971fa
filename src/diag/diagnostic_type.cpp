//! # Diagnostic Types Implementation

#include "diag/diagnostic_type.hpp"

#include <cctype>

namespace deadprop::diag {

namespace {

constexpr size_t kMaxPlaceholderDigits = 9;

} // namespace

const char* check_level_name(CheckLevel level) {
    switch (level) {
    case CheckLevel::Off:
        return "off";
    case CheckLevel::Warning:
        return "warning";
    case CheckLevel::Error:
        return "error";
    }
    return "???";
}

auto parse_check_level(std::string_view s) -> std::optional<CheckLevel> {
    if (s == "off")
        return CheckLevel::Off;
    if (s == "warning" || s == "warn")
        return CheckLevel::Warning;
    if (s == "error")
        return CheckLevel::Error;
    return std::nullopt;
}

auto DiagnosticType::format_message(const std::vector<std::string>& args) const -> std::string {
    std::string result;
    result.reserve(format_.size() + 32);

    size_t i = 0;
    while (i < format_.size()) {
        if (format_[i] == '{') {
            size_t close = format_.find('}', i + 1);
            if (close != std::string::npos && close > i + 1) {
                auto digits = std::string_view(format_).substr(i + 1, close - i - 1);
                // Longer runs cannot name an argument and would overflow stoul.
                bool numeric = digits.size() <= kMaxPlaceholderDigits;
                for (char c : digits) {
                    if (!std::isdigit(static_cast<unsigned char>(c))) {
                        numeric = false;
                        break;
                    }
                }
                if (numeric) {
                    size_t index = std::stoul(std::string(digits));
                    if (index < args.size()) {
                        result += args[index];
                    } else {
                        result.append(format_, i, close - i + 1);
                    }
                    i = close + 1;
                    continue;
                }
            }
        }
        result += format_[i];
        ++i;
    }

    return result;
}

auto DiagnosticGroup::contains(const DiagnosticType& type) const -> bool {
    for (const auto* t : types_) {
        if (*t == type) {
            return true;
        }
    }
    return false;
}

auto JsError::to_string() const -> std::string {
    std::string result = source_name;
    if (line > 0) {
        result += ":" + std::to_string(line);
        if (column > 0) {
            result += ":" + std::to_string(column);
        }
    }
    result += ": ";
    result += level == CheckLevel::Error ? "ERROR" : "WARNING";
    result += " - [";
    result += type ? type->key() : "?";
    result += "] ";
    result += description;
    return result;
}

} // namespace deadprop::diag
