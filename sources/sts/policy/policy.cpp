//
// Created by gregorian-rayne on 10/6/26.
//

#include "sts/policy/policy.hpp"
#include "sts/utils/file_utils.hpp"
#include "sts/utils/string_utils.hpp"
#include "sts/version.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

namespace sts::policy {

    namespace {

        const std::vector<std::string> DEFAULT_ILLEGAL_PATTERNS = {
            "print(", "input(", "import tkinter", "from tkinter"
        };

        const std::vector<std::string> DEFAULT_LEGACY_API_PATTERNS = {
            "os.path"
        };

        const std::vector<std::string> DEFAULT_EXCLUDED_DIRS = {
            "__pycache__", ".venv", "venv", ".git", ".tox", "node_modules"
        };

        constexpr int PROJECT_CC_GAP = 5;

        const std::map<std::string, std::vector<std::string>, std::less<>> KNOWN_KEYS = {
            {"thresholds", {"max_cc", "adf_threshold", "ccr_threshold", "project_max_cc"}},
            {"patterns",   {"illegal_patterns", "legacy_api_patterns"}},
            {"skip",       {"excluded_dirs"}},
            {"churn",      {"window_days", "saturation_commits", "timeout_seconds"}}
        };

        std::string qualified(const std::string_view table, const std::string_view key) {
            return std::string(table) + "." + std::string(key);
        }

        /**
         * Reports unknown tables and keys as warnings; a known table that is
         * not a table is a type error.
         */
        void check_layout(const toml::table& root,
                          std::vector<std::string>& errors,
                          std::vector<std::string>& warnings) {
            for (auto&& [key, node] : root) {
                const auto name = key.str();
                const auto known = KNOWN_KEYS.find(name);
                if (known == KNOWN_KEYS.end()) {
                    warnings.push_back("unknown policy table '" + std::string(name) + "' ignored");
                    continue;
                }

                const auto* section = node.as_table();
                if (!section) {
                    errors.push_back("'" + std::string(name) + "' must be a table");
                    continue;
                }

                for (auto&& [sub_key, sub_node] : *section) {
                    (void)sub_node;
                    const auto sub_name = sub_key.str();
                    if (std::ranges::find(known->second, sub_name) == known->second.end()) {
                        warnings.push_back("unknown policy key '" + qualified(name, sub_name) + "' ignored");
                    }
                }
            }
        }

        void read_int(const toml::table* section, const std::string_view table,
                      const std::string_view key, int& out, std::vector<std::string>& errors) {
            if (!section) return;
            const toml::node* node = section->get(key);
            if (!node) return;

            if (!node->is_integer()) {
                errors.push_back(qualified(table, key) + " must be an integer");
                return;
            }

            const auto value = node->value<std::int64_t>().value_or(0);
            if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
                errors.push_back(qualified(table, key) + " is out of range");
                return;
            }
            out = static_cast<int>(value);
        }

        void read_number(const toml::table* section, const std::string_view table,
                         const std::string_view key, double& out, std::vector<std::string>& errors) {
            if (!section) return;
            const toml::node* node = section->get(key);
            if (!node) return;

            if (node->is_integer()) {
                out = static_cast<double>(node->value<std::int64_t>().value_or(0));
            } else if (node->is_floating_point()) {
                out = node->value<double>().value_or(0.0);
            } else {
                errors.push_back(qualified(table, key) + " must be a number");
            }
        }

        bool read_string_list(const toml::table* section, const std::string_view table,
                              const std::string_view key, std::vector<std::string>& out,
                              std::vector<std::string>& errors) {
            if (!section) return false;
            const toml::node* node = section->get(key);
            if (!node) return false;

            const auto* array = node->as_array();
            if (!array) {
                errors.push_back(qualified(table, key) + " must be an array of strings");
                return false;
            }

            std::vector<std::string> values;
            for (const auto& element : *array) {
                if (!element.is_string()) {
                    errors.push_back(qualified(table, key) + " must contain only strings");
                    return false;
                }
                values.push_back(element.value<std::string>().value_or(""));
            }

            out = std::move(values);
            return true;
        }

        const toml::table* section_of(const toml::table& root, const std::string_view name) {
            const toml::node* node = root.get(name);
            return node ? node->as_table() : nullptr;
        }

        std::string toml_quote(const std::string_view s) {
            std::string out = "\"";
            for (const char c : s) {
                switch (c) {
                    case '\\': out += "\\\\"; break;
                    case '"':  out += "\\\""; break;
                    case '\n': out += "\\n"; break;
                    case '\t': out += "\\t"; break;
                    case '\r': out += "\\r"; break;
                    case '\b': out += "\\b"; break;
                    case '\f': out += "\\f"; break;
                    default: {
                        const auto byte = static_cast<unsigned char>(c);
                        if (byte < 0x20 || byte == 0x7F) {
                            char escaped[7];
                            std::snprintf(escaped, sizeof(escaped), "\\u%04X", static_cast<unsigned>(byte));
                            out += escaped;
                        } else {
                            out += c;
                        }
                        break;
                    }
                }
            }
            out += "\"";
            return out;
        }

        std::string toml_float(const double value) {
            // Shortest rendering that reads back as the same double.
            std::string text;
            for (int precision = std::numeric_limits<double>::digits10;
                 precision <= std::numeric_limits<double>::max_digits10; ++precision) {
                std::ostringstream oss;
                oss << std::setprecision(precision) << value;
                text = oss.str();
                if (std::strtod(text.c_str(), nullptr) == value) break;
            }
            if (text.find_first_of(".eE") == std::string::npos) {
                text += ".0";
            }
            return text;
        }

        std::string toml_list(const std::vector<std::string>& values) {
            std::vector<std::string> quoted;
            quoted.reserve(values.size());
            for (const auto& v : values) {
                quoted.push_back(toml_quote(v));
            }
            return "[" + string_utils::join(quoted, ", ") + "]";
        }

    }  // namespace

    // ============================================================================
    // Patterns
    // ============================================================================

    CompiledPattern::CompiledPattern(std::string text, const PatternKind kind, std::string needle,
                                     std::shared_ptr<const std::regex> regex)
        : text_(std::move(text))
        , kind_(kind)
        , needle_(std::move(needle))
        , regex_(std::move(regex)) {}

    Result<CompiledPattern, Error> CompiledPattern::compile(const std::string& text) {
        if (text.empty()) {
            return Result<CompiledPattern, Error>::failure(
                Error::config_error("Empty pattern")
            );
        }

        if (!string_utils::starts_with(text, REGEX_PREFIX)) {
            return Result<CompiledPattern, Error>::success(
                CompiledPattern(text, PatternKind::Literal, text, nullptr)
            );
        }

        const auto expression = text.substr(REGEX_PREFIX.size());
        if (expression.empty()) {
            return Result<CompiledPattern, Error>::failure(
                Error::config_error("Empty regular expression", text)
            );
        }

        try {
            auto regex = std::make_shared<const std::regex>(expression, std::regex::ECMAScript);
            return Result<CompiledPattern, Error>::success(
                CompiledPattern(text, PatternKind::Regex, "", std::move(regex))
            );
        } catch (const std::regex_error& e) {
            return Result<CompiledPattern, Error>::failure(
                Error::config_error("Invalid regular expression: " + std::string(e.what()), text)
            );
        }
    }

    bool CompiledPattern::matches(const std::string_view line) const {
        if (kind_ == PatternKind::Literal) {
            return string_utils::contains(line, needle_);
        }
        return std::regex_search(line.begin(), line.end(), *regex_);
    }

    Result<PatternSet, Error> PatternSet::compile(const std::vector<std::string>& texts,
                                                  const std::string_view key) {
        PatternSet set;
        set.patterns_.reserve(texts.size());

        for (const auto& text : texts) {
            auto compiled = CompiledPattern::compile(text);
            if (compiled.is_err()) {
                return Result<PatternSet, Error>::failure(
                    compiled.error().with_context(std::string(key))
                );
            }
            set.patterns_.push_back(std::move(compiled).value());
        }

        return Result<PatternSet, Error>::success(std::move(set));
    }

    bool PatternSet::matches(const std::string_view line) const {
        return std::ranges::any_of(patterns_, [line](const CompiledPattern& p) {
            return p.matches(line);
        });
    }

    std::vector<std::string> PatternSet::texts() const {
        std::vector<std::string> result;
        result.reserve(patterns_.size());
        for (const auto& p : patterns_) {
            result.push_back(p.text());
        }
        return result;
    }

    // ============================================================================
    // PolicyConfig
    // ============================================================================

    PolicyConfig PolicyConfig::defaults() {
        PolicyConfig config;
        // The built-in lists are literals and always compile.
        config.illegal_patterns = PatternSet::compile(DEFAULT_ILLEGAL_PATTERNS, "patterns.illegal_patterns").value();
        config.legacy_api_patterns = PatternSet::compile(DEFAULT_LEGACY_API_PATTERNS, "patterns.legacy_api_patterns").value();
        config.excluded_dirs = DEFAULT_EXCLUDED_DIRS;
        return config;
    }

    Result<void, Error> PolicyConfig::validate() const {
        std::vector<std::string> errors;

        if (thresholds.max_cc < 1) {
            errors.emplace_back("max_cc must be at least 1");
        }

        if (thresholds.project_max_cc < 1) {
            errors.emplace_back("project_max_cc must be at least 1");
        }

        if (thresholds.project_max_cc > thresholds.max_cc) {
            errors.emplace_back("project_max_cc must not be greater than max_cc");
        }

        if (!(thresholds.adf_threshold >= 0.0 && thresholds.adf_threshold <= 1.0)) {
            errors.emplace_back("adf_threshold must be between 0.0 and 1.0");
        }

        if (!(thresholds.ccr_threshold >= 0.0 && thresholds.ccr_threshold <= 1.0)) {
            errors.emplace_back("ccr_threshold must be between 0.0 and 1.0");
        }

        if (churn.window_days < 1) {
            errors.emplace_back("window_days must be at least 1");
        }

        if (churn.saturation_commits < 1) {
            errors.emplace_back("saturation_commits must be at least 1");
        }

        if (churn.timeout_seconds < 1) {
            errors.emplace_back("timeout_seconds must be at least 1");
        }

        if (std::ranges::any_of(excluded_dirs, [](const std::string& d) { return d.empty(); })) {
            errors.emplace_back("excluded_dirs must not contain empty names");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Policy validation failed:\n  " + string_utils::join(errors, "\n  "), source)
            );
        }

        return Result<void, Error>::success();
    }

    std::string PolicyConfig::to_toml() const {
        std::ostringstream ss;

        ss << "# Effective policy (source: " << source << ")\n\n";

        ss << "[thresholds]\n";
        ss << "max_cc = " << thresholds.max_cc << "\n";
        ss << "adf_threshold = " << toml_float(thresholds.adf_threshold) << "\n";
        ss << "ccr_threshold = " << toml_float(thresholds.ccr_threshold) << "\n";
        ss << "project_max_cc = " << thresholds.project_max_cc << "\n\n";

        ss << "[patterns]\n";
        ss << "illegal_patterns = " << toml_list(illegal_patterns.texts()) << "\n";
        ss << "legacy_api_patterns = " << toml_list(legacy_api_patterns.texts()) << "\n\n";

        ss << "[skip]\n";
        ss << "excluded_dirs = " << toml_list(excluded_dirs) << "\n\n";

        ss << "[churn]\n";
        ss << "window_days = " << churn.window_days << "\n";
        ss << "saturation_commits = " << churn.saturation_commits << "\n";
        ss << "timeout_seconds = " << churn.timeout_seconds << "\n";

        return ss.str();
    }

    bool PolicyConfig::is_excluded_dir(const std::string_view name) const {
        return std::ranges::find(excluded_dirs, name) != excluded_dirs.end();
    }

    // ============================================================================
    // Loading
    // ============================================================================

    Result<LoadedPolicy, Error> load_from_string(const std::string_view content, const std::string& source) {
        toml::table root;
        try {
            root = toml::parse(content, source);
        } catch (const toml::parse_error& err) {
            const auto& where = err.source().begin;
            return Result<LoadedPolicy, Error>::failure(
                Error::config_error(
                    "Failed to parse TOML: " + std::string(err.description()),
                    source + ":" + std::to_string(where.line) + ":" + std::to_string(where.column)
                )
            );
        }

        LoadedPolicy loaded;
        loaded.config = PolicyConfig::defaults();
        loaded.config.source = source;

        std::vector<std::string> errors;
        check_layout(root, errors, loaded.warnings);

        auto& config = loaded.config;

        const auto* thresholds = section_of(root, "thresholds");
        read_int(thresholds, "thresholds", "max_cc", config.thresholds.max_cc, errors);
        read_number(thresholds, "thresholds", "adf_threshold", config.thresholds.adf_threshold, errors);
        read_number(thresholds, "thresholds", "ccr_threshold", config.thresholds.ccr_threshold, errors);
        if (thresholds && thresholds->contains("project_max_cc")) {
            read_int(thresholds, "thresholds", "project_max_cc", config.thresholds.project_max_cc, errors);
        } else {
            // Absent: follow the file ceiling with the default gap.
            config.thresholds.project_max_cc = std::max(1, config.thresholds.max_cc - PROJECT_CC_GAP);
        }

        std::vector<std::string> illegal = DEFAULT_ILLEGAL_PATTERNS;
        std::vector<std::string> legacy = DEFAULT_LEGACY_API_PATTERNS;
        const auto* patterns = section_of(root, "patterns");
        const bool has_illegal = read_string_list(patterns, "patterns", "illegal_patterns", illegal, errors);
        const bool has_legacy = read_string_list(patterns, "patterns", "legacy_api_patterns", legacy, errors);

        const auto* skip = section_of(root, "skip");
        read_string_list(skip, "skip", "excluded_dirs", config.excluded_dirs, errors);

        const auto* churn = section_of(root, "churn");
        read_int(churn, "churn", "window_days", config.churn.window_days, errors);
        read_int(churn, "churn", "saturation_commits", config.churn.saturation_commits, errors);
        read_int(churn, "churn", "timeout_seconds", config.churn.timeout_seconds, errors);

        if (!errors.empty()) {
            return Result<LoadedPolicy, Error>::failure(
                Error::config_error("Invalid policy:\n  " + string_utils::join(errors, "\n  "), source)
            );
        }

        if (has_illegal) {
            auto compiled = PatternSet::compile(illegal, "patterns.illegal_patterns");
            if (compiled.is_err()) {
                return Result<LoadedPolicy, Error>::failure(compiled.error().with_context(source));
            }
            config.illegal_patterns = std::move(compiled).value();
        }

        if (has_legacy) {
            auto compiled = PatternSet::compile(legacy, "patterns.legacy_api_patterns");
            if (compiled.is_err()) {
                return Result<LoadedPolicy, Error>::failure(compiled.error().with_context(source));
            }
            config.legacy_api_patterns = std::move(compiled).value();
        }

        if (auto validation = config.validate(); validation.is_err()) {
            return Result<LoadedPolicy, Error>::failure(validation.error());
        }

        return Result<LoadedPolicy, Error>::success(std::move(loaded));
    }

    Result<LoadedPolicy, Error> load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<LoadedPolicy, Error>::failure(content.error());
        }
        return load_from_string(content.value(), path.string());
    }

    std::optional<fs::path> find_policy_file(const fs::path& target) {
        std::error_code ec;
        auto dir = file_utils::normalize(target);
        if (!fs::is_directory(dir, ec)) {
            dir = dir.parent_path();
        }

        while (!dir.empty()) {
            if (auto candidate = dir / POLICY_FILE_NAME; fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
            if (fs::exists(dir / ".git", ec)) {
                break;
            }
            auto parent = dir.parent_path();
            if (parent == dir) {
                break;
            }
            dir = std::move(parent);
        }

        return std::nullopt;
    }

    Result<LoadedPolicy, Error> resolve(const fs::path& target,
                                        const std::optional<fs::path>& explicit_config) {
        if (explicit_config.has_value()) {
            if (std::error_code ec; !fs::is_regular_file(*explicit_config, ec)) {
                return Result<LoadedPolicy, Error>::failure(
                    Error::not_found("Policy file not found", explicit_config->string())
                );
            }
            return load_from_file(*explicit_config);
        }

        if (auto found = find_policy_file(target)) {
            return load_from_file(*found);
        }

        return Result<LoadedPolicy, Error>::success(LoadedPolicy{PolicyConfig::defaults(), {}});
    }

}  // namespace sts::policy
