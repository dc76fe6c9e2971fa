#include "diag/emitter.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace deadprop::diag {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_ERROR_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE)
        return false;

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode))
        return false;

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(hOut, dwMode))
        return true;

    return isatty(fileno(stderr)) != 0;
#else
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
#endif
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = (&out == &std::cerr) && terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    source_files_[path] = content;
}

std::string DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) const {
    auto it = source_files_.find(path);
    if (it == source_files_.end() || line == 0)
        return "";

    const std::string& content = it->second;
    uint32_t current_line = 1;
    size_t line_start = 0;

    while (current_line < line) {
        size_t newline = content.find('\n', line_start);
        if (newline == std::string::npos)
            return "";
        line_start = newline + 1;
        current_line++;
    }

    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos)
        line_end = content.size();
    return content.substr(line_start, line_end - line_start);
}

void DiagnosticEmitter::emit(const JsError& error) {
    if (format_ == DiagnosticFormat::JSON) {
        emit_json(error);
    } else {
        emit_text(error);
    }
}

void DiagnosticEmitter::emit_text(const JsError& error) {
    // Format: warning[JSC_KEY]: message
    bool is_error = error.level == CheckLevel::Error;
    out_ << color(Colors::Bold) << color(is_error ? Colors::BrightRed : Colors::BrightYellow)
         << (is_error ? "error" : "warning");
    if (error.type) {
        out_ << "[" << error.type->key() << "]";
    }
    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << error.description
         << color(Colors::Reset) << "\n";

    emit_source_snippet(error);
}

void DiagnosticEmitter::emit_source_snippet(const JsError& error) {
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << error.source_name;
    if (error.line > 0) {
        out_ << ":" << error.line << ":" << error.column;
    }
    out_ << "\n";

    std::string source_line = get_source_line(error.source_name, error.line);
    if (source_line.empty()) {
        return;
    }

    int line_width = std::max(static_cast<int>(std::to_string(error.line).length()), 4);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
    out_ << color(Colors::BrightBlue) << std::setw(line_width) << error.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset);
    uint32_t start_col = error.column > 0 ? error.column - 1 : 0;
    for (uint32_t i = 0; i < start_col && i < source_line.length(); ++i) {
        out_ << (source_line[i] == '\t' ? '\t' : ' ');
    }
    out_ << color(Colors::BrightRed) << '^' << color(Colors::Reset) << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
}

void DiagnosticEmitter::emit_summary(size_t errors, size_t warnings) {
    if (format_ == DiagnosticFormat::JSON) {
        return;
    }
    out_ << errors << " error(s), " << warnings << " warning(s)\n";
}

std::string DiagnosticEmitter::escape_json_string(const std::string& s) {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Control character - emit as \uXXXX
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

void DiagnosticEmitter::emit_json(const JsError& error) {
    out_ << "{";
    out_ << "\"severity\":\"" << check_level_name(error.level) << "\",";
    out_ << "\"code\":\"" << escape_json_string(error.type ? error.type->key() : "") << "\",";
    out_ << "\"message\":\"" << escape_json_string(error.description) << "\",";
    out_ << "\"span\":{";
    out_ << "\"file\":\"" << escape_json_string(error.source_name) << "\",";
    out_ << "\"line\":" << error.line << ",\"column\":" << error.column;
    out_ << "}}\n";
}

} // namespace deadprop::diag
