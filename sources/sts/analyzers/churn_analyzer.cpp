//
// Created by gregorian-rayne on 10/9/26.
//

#include "sts/analyzers/churn_analyzer.hpp"
#include "sts/git/git_integration.hpp"

#include <algorithm>

namespace sts::analyzers {

    Result<std::size_t, Error> GitHistoryProvider::fetch_recent_touches(
        const fs::path& path,
        const int window_days
    ) const {
        return git::count_recent_commits(path, window_days, timeout_, cancelled_);
    }

    double churn_rate(const std::size_t touches, const int saturation_commits) noexcept {
        if (saturation_commits <= 0) {
            return touches > 0 ? 1.0 : 0.0;
        }
        return std::min(static_cast<double>(touches) / static_cast<double>(saturation_commits), 1.0);
    }

    ChurnResult analyze_churn(const fs::path& path,
                              const IHistoryProvider& provider,
                              const policy::ChurnSettings& settings) {
        ChurnResult result;

        auto touches = provider.fetch_recent_touches(path, settings.window_days);
        if (touches.is_err()) {
            result.note = touches.error().message();
            return result;
        }

        result.touches = touches.value();
        result.ccr = churn_rate(touches.value(), settings.saturation_commits);
        return result;
    }

}  // namespace sts::analyzers
