//
// Created by gregorian-rayne on 10/10/26.
//

#include "sts/engine/source_collector.hpp"
#include "sts/utils/file_utils.hpp"

#include <algorithm>

namespace sts::engine {

    Result<SourceCollection, Error> collect_sources(const fs::path& root, const policy::PolicyConfig& policy) {
        std::error_code ec;

        if (!fs::exists(root, ec)) {
            return Result<SourceCollection, Error>::failure(
                Error::not_found("Directory not found", root.string())
            );
        }

        if (!fs::is_directory(root, ec)) {
            return Result<SourceCollection, Error>::failure(
                Error::invalid_argument("Not a directory", root.string())
            );
        }

        SourceCollection collection;

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Result<SourceCollection, Error>::failure(
                Error::io_error("Failed to list directory", root.string())
            );
        }

        const fs::recursive_directory_iterator end;
        while (it != end) {
            const auto& entry = *it;
            std::error_code entry_ec;

            if (entry.is_directory(entry_ec)) {
                if (policy.is_excluded_dir(entry.path().filename().string())) {
                    it.disable_recursion_pending();
                }
            } else if (entry.is_regular_file(entry_ec) &&
                       file_utils::is_python_source(entry.path()) &&
                       entry.path().filename() != "__init__.py") {
                collection.files.push_back(entry.path());
            }

            it.increment(ec);
            if (ec) {
                collection.warnings.push_back("stopped scanning " + root.string() + ": " + ec.message());
                break;
            }
        }

        std::ranges::sort(collection.files);
        return Result<SourceCollection, Error>::success(std::move(collection));
    }

}  // namespace sts::engine
