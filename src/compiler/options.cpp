//! # Analysis Options Loading
//!
//! Reads the TOML subset accepted in `deadprop.toml`: `[section]` headers,
//! `key = value` lines with optionally quoted values, and `#` comments.

#include "compiler/options.hpp"

#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace deadprop::compiler {

auto registry_scope_name(RegistryScope scope) -> const char* {
    switch (scope) {
    case RegistryScope::WholeCompilation:
        return "whole-compilation";
    case RegistryScope::PerFile:
        return "per-file";
    }
    return "???";
}

auto parse_registry_scope(std::string_view s) -> std::optional<RegistryScope> {
    if (s == "whole-compilation")
        return RegistryScope::WholeCompilation;
    if (s == "per-file")
        return RegistryScope::PerFile;
    return std::nullopt;
}

auto AnalysisOptions::check_level(const std::string& key_or_group) const
    -> std::optional<diag::CheckLevel> {
    auto it = check_levels.find(key_or_group);
    if (it == check_levels.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Config File Parsing
// ============================================================================

namespace {

enum class Section { None, Analysis, Checks, Unknown };

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

void unquote(std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
}

void strip_comment(std::string& line) {
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            in_string = !in_string;
        } else if (line[i] == '#' && !in_string) {
            line.erase(i);
            return;
        }
    }
}

} // namespace

auto parse_analysis_options(std::string_view text, const std::string& origin)
    -> Result<AnalysisOptions, std::string> {
    AnalysisOptions options;
    Section section = Section::None;

    std::istringstream input{std::string(text)};
    std::string line;
    size_t line_no = 0;

    auto fail = [&](const std::string& message) -> Result<AnalysisOptions, std::string> {
        return origin + ":" + std::to_string(line_no) + ": " + message;
    };

    while (std::getline(input, line)) {
        ++line_no;
        strip_comment(line);
        trim(line);
        if (line.empty())
            continue;

        // Section headers
        if (line[0] == '[') {
            if (line.back() != ']') {
                return fail("malformed section header '" + line + "'");
            }
            std::string name = line.substr(1, line.size() - 2);
            trim(name);
            if (name == "analysis") {
                section = Section::Analysis;
            } else if (name == "checks") {
                section = Section::Checks;
            } else {
                DEADPROP_LOG_WARN("config", origin << ":" << line_no << ": ignoring unknown section ["
                                                   << name << "]");
                section = Section::Unknown;
            }
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            return fail("expected 'key = value', found '" + line + "'");
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        trim(key);
        trim(value);
        unquote(value);

        if (key.empty()) {
            return fail("missing key before '='");
        }

        switch (section) {
        case Section::None:
            DEADPROP_LOG_WARN("config", origin << ":" << line_no << ": ignoring key '" << key
                                               << "' outside of a section");
            break;
        case Section::Unknown:
            break;
        case Section::Analysis:
            if (key == "registry-scope") {
                auto scope = parse_registry_scope(value);
                if (!scope) {
                    return fail("invalid registry-scope '" + value +
                                "' (expected whole-compilation or per-file)");
                }
                options.registry_scope = *scope;
            } else if (key == "coding-convention") {
                if (value != "default" && value != "closure") {
                    return fail("invalid coding-convention '" + value +
                                "' (expected default or closure)");
                }
                options.coding_convention = value;
            } else if (key == "diagnostic-format") {
                if (value == "text") {
                    options.diagnostic_format = diag::DiagnosticFormat::Text;
                } else if (value == "json") {
                    options.diagnostic_format = diag::DiagnosticFormat::JSON;
                } else {
                    return fail("invalid diagnostic-format '" + value + "' (expected text or json)");
                }
            } else {
                DEADPROP_LOG_WARN("config", origin << ":" << line_no
                                                   << ": ignoring unknown analysis key '" << key
                                                   << "'");
            }
            break;
        case Section::Checks: {
            auto level = diag::parse_check_level(value);
            if (!level) {
                return fail("invalid check level '" + value + "' for '" + key +
                            "' (expected off, warning or error)");
            }
            options.set_check_level(key, *level);
            break;
        }
        }
    }

    DEADPROP_LOG_DEBUG("config", "Loaded options from " << origin << ": registry-scope="
                                                        << registry_scope_name(options.registry_scope)
                                                        << ", coding-convention="
                                                        << options.coding_convention << ", "
                                                        << options.check_levels.size()
                                                        << " check override(s)");
    return options;
}

auto load_analysis_options(const std::filesystem::path& path) -> Result<AnalysisOptions, std::string> {
    std::ifstream file(path);
    if (!file) {
        return "cannot open configuration file '" + path.string() + "'";
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_analysis_options(buffer.str(), path.string());
}

} // namespace deadprop::compiler
