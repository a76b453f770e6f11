//
// Created by gregorian-rayne on 10/4/26.
//

#ifndef STS_STS_HPP
#define STS_STS_HPP

/**
 * @file sts.hpp
 * @brief Main header for the STS audit library.
 *
 * Pulls in the core types and the audit entry point. Include specific
 * headers for narrower dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "engine/audit_engine.hpp"

#endif //STS_STS_HPP
