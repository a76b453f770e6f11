//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef STS_POLICY_HPP
#define STS_POLICY_HPP

/**
 * @file policy.hpp
 * @brief Effective audit policy and its loader.
 *
 * The policy is read from `.sts.toml`, searched upward from the audit
 * target, and falls back to built-in defaults. It is built once per run,
 * before any file is scanned, and shared read-only by all workers.
 *
 * Example policy file:
 * @code
 *     [thresholds]
 *     max_cc = 20
 *     adf_threshold = 0.05
 *     ccr_threshold = 0.3
 *     project_max_cc = 15
 *
 *     [patterns]
 *     illegal_patterns = ["print(", "input(", "re:^\\s*import\\s+tkinter"]
 *     legacy_api_patterns = ["os.path"]
 *
 *     [skip]
 *     excluded_dirs = ["__pycache__", ".venv"]
 *
 *     [churn]
 *     window_days = 14
 *     saturation_commits = 10
 *     timeout_seconds = 5
 * @endcode
 */

#include "sts/result.hpp"
#include "sts/error.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace sts::policy {

    namespace fs = std::filesystem;

    /**
     * Prefix that marks a pattern entry as a regular expression.
     */
    constexpr std::string_view REGEX_PREFIX = "re:";

    constexpr auto DEFAULT_SOURCE = "built-in defaults";

    enum class PatternKind {
        Literal,
        Regex
    };

    /**
     * One validated line pattern.
     *
     * Literal patterns match as plain substrings. Regex patterns use the
     * ECMAScript grammar and match anywhere in the line.
     */
    class CompiledPattern {
    public:
        /**
         * Validates and compiles a configured pattern entry.
         *
         * @param text The entry as written in the policy, with or without
         *             the "re:" prefix.
         * @return The compiled pattern, or a ConfigError for an empty entry
         *         or a regex that does not compile.
         */
        static Result<CompiledPattern, Error> compile(const std::string& text);

        [[nodiscard]] bool matches(std::string_view line) const;

        [[nodiscard]] const std::string& text() const noexcept { return text_; }
        [[nodiscard]] PatternKind kind() const noexcept { return kind_; }

    private:
        CompiledPattern(std::string text, PatternKind kind, std::string needle,
                        std::shared_ptr<const std::regex> regex);

        std::string text_;
        PatternKind kind_;
        std::string needle_;
        std::shared_ptr<const std::regex> regex_;
    };

    /**
     * An ordered set of patterns; a line matches when any member matches.
     */
    class PatternSet {
    public:
        PatternSet() = default;

        /**
         * @param texts Configured entries.
         * @param key Policy key the entries came from, used as error context.
         */
        static Result<PatternSet, Error> compile(const std::vector<std::string>& texts,
                                                 std::string_view key);

        [[nodiscard]] bool matches(std::string_view line) const;

        [[nodiscard]] std::vector<std::string> texts() const;
        [[nodiscard]] const std::vector<CompiledPattern>& patterns() const noexcept { return patterns_; }
        [[nodiscard]] bool empty() const noexcept { return patterns_.empty(); }
        [[nodiscard]] std::size_t size() const noexcept { return patterns_.size(); }

    private:
        std::vector<CompiledPattern> patterns_;
    };

    struct Thresholds {
        int max_cc = 20;                // per file, fails when exceeded
        double adf_threshold = 0.05;
        double ccr_threshold = 0.3;
        int project_max_cc = 15;        // project, fails when reached; max(1, max_cc - 5) when absent from a file
    };

    struct ChurnSettings {
        int window_days = 14;
        int saturation_commits = 10;
        int timeout_seconds = 5;
    };

    /**
     * Effective thresholds and pattern sets for one run.
     */
    struct PolicyConfig {
        Thresholds thresholds;
        PatternSet illegal_patterns;
        PatternSet legacy_api_patterns;
        std::vector<std::string> excluded_dirs;
        ChurnSettings churn;

        /// Path of the file the policy came from, or DEFAULT_SOURCE.
        std::string source = DEFAULT_SOURCE;

        static PolicyConfig defaults();

        /**
         * Checks numeric ranges and cross-field constraints.
         *
         * @return Success, or a ConfigError listing every violation.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Renders the effective policy as a loadable `.sts.toml` document.
         */
        [[nodiscard]] std::string to_toml() const;

        [[nodiscard]] bool is_excluded_dir(std::string_view name) const;
    };

    /**
     * A loaded policy together with non-fatal findings (unknown keys).
     */
    struct LoadedPolicy {
        PolicyConfig config;
        std::vector<std::string> warnings;
    };

    /**
     * Parses policy TOML text. Absent keys keep their defaults.
     *
     * @param content TOML document.
     * @param source Name recorded as the policy source and used in errors.
     */
    Result<LoadedPolicy, Error> load_from_string(std::string_view content, const std::string& source);

    Result<LoadedPolicy, Error> load_from_file(const fs::path& path);

    /**
     * Searches for `.sts.toml` from the target upward.
     *
     * Starts at the target itself when it is a directory, otherwise at its
     * parent. The search stops after the first directory that contains a
     * `.git` entry, or at the filesystem root.
     *
     * @return Path of the policy file, or nullopt if none applies.
     */
    std::optional<fs::path> find_policy_file(const fs::path& target);

    /**
     * Resolves the effective policy for a target.
     *
     * @param target File or directory being audited.
     * @param explicit_config Overrides the upward search; must exist.
     */
    Result<LoadedPolicy, Error> resolve(const fs::path& target,
                                        const std::optional<fs::path>& explicit_config);

}  // namespace sts::policy

#endif //STS_POLICY_HPP
