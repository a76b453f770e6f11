//
// Created by gregorian-rayne on 10/9/26.
//

#ifndef STS_CHURN_ANALYZER_HPP
#define STS_CHURN_ANALYZER_HPP

/**
 * @file churn_analyzer.hpp
 * @brief Code churn rate (CCR).
 *
 *     ccr = min(touches / saturation_commits, 1.0)
 *
 * where touches is the number of distinct commits that changed the file
 * within the configured window. With the defaults (10 commits, 14 days)
 * ccr = 0.3 means three commits in two weeks.
 *
 * When the history cannot be read the rate is unknown, never zero.
 */

#include "sts/analyzers/analyzer.hpp"
#include "sts/policy/policy.hpp"
#include "sts/result.hpp"
#include "sts/error.hpp"

#include <atomic>
#include <string_view>

namespace sts::analyzers {

    /**
     * Source of per-file change history.
     */
    class IHistoryProvider {
    public:
        virtual ~IHistoryProvider() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Counts commits that touched the file in the last window_days.
         *
         * Must be safe to call from several threads at once.
         */
        [[nodiscard]] virtual Result<std::size_t, Error> fetch_recent_touches(
            const fs::path& path,
            int window_days
        ) const = 0;
    };

    /**
     * History provider backed by `git log`.
     */
    class GitHistoryProvider : public IHistoryProvider {
    public:
        explicit GitHistoryProvider(Duration timeout, const std::atomic<bool>* cancelled = nullptr)
            : timeout_(timeout)
            , cancelled_(cancelled) {}

        [[nodiscard]] std::string_view name() const noexcept override {
            return "git";
        }

        [[nodiscard]] Result<std::size_t, Error> fetch_recent_touches(
            const fs::path& path,
            int window_days
        ) const override;

    private:
        Duration timeout_;
        const std::atomic<bool>* cancelled_;
    };

    /**
     * Normalizes a commit count into [0, 1].
     */
    double churn_rate(std::size_t touches, int saturation_commits) noexcept;

    /**
     * Queries the provider and converts the count into a rate.
     *
     * A provider error yields an unknown rate with the error message as
     * the note.
     */
    ChurnResult analyze_churn(const fs::path& path,
                              const IHistoryProvider& provider,
                              const policy::ChurnSettings& settings);

}  // namespace sts::analyzers

#endif //STS_CHURN_ANALYZER_HPP
