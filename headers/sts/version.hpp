//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef STS_VERSION_HPP
#define STS_VERSION_HPP

/**
 * @file version.hpp
 * @brief Version information for the architectural audit engine.
 */

namespace sts {

    constexpr int VERSION_MAJOR = 2;
    constexpr int VERSION_MINOR = 2;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "2.2.0";

    constexpr auto PROJECT_NAME = "STS Architectural Audit";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "sts";

    /**
     * Name of the policy file searched for from the audit target upwards.
     */
    constexpr auto POLICY_FILE_NAME = ".sts.toml";

}  // namespace sts

#endif //STS_VERSION_HPP
