//
// Created by gregorian-rayne on 10/10/26.
//

#ifndef STS_SOURCE_COLLECTOR_HPP
#define STS_SOURCE_COLLECTOR_HPP

/**
 * @file source_collector.hpp
 * @brief Enumerates the Python files of a directory audit.
 */

#include "sts/result.hpp"
#include "sts/error.hpp"
#include "sts/types.hpp"
#include "sts/policy/policy.hpp"

#include <string>
#include <vector>

namespace sts::engine {

    struct SourceCollection {
        std::vector<fs::path> files;             // Sorted
        std::vector<std::string> warnings;       // Unreadable subtrees
    };

    /**
     * Recursively collects `*.py` files below root.
     *
     * Directories named in the policy's excluded_dirs are not entered,
     * `__init__.py` files are skipped and symlinked directories are not
     * followed.
     *
     * @return The sorted file list, or NotFound/InvalidArgument for a bad root.
     */
    Result<SourceCollection, Error> collect_sources(const fs::path& root, const policy::PolicyConfig& policy);

}  // namespace sts::engine

#endif //STS_SOURCE_COLLECTOR_HPP
