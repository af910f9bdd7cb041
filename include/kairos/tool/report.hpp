/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file report.hpp
 * @brief JSON rendering of generated identifiers for the `kairos` executable.
 */

#pragma once

#include "kairos/core/uuid.hpp"

#include <string>
#include <vector>

namespace kairos::tool {

/**
 * @class Report
 * @brief A static serializer for command results.
 *
 * **Response Formats:**
 * - **Success:** `{"status":"ok","version":"7","count":2,"uuids":["...","..."]}`
 * - **Error:** `{"status":"error","message":"<error_description>"}`
 */
class Report {
  public:
    /**
     * @brief Serializes a successful run.
     *
     * @param version The version label as requested on the command line (e.g. `"7m"`).
     * @param ids The identifiers, in issue order.
     */
    static std::string render(const std::string& version, const std::vector<core::Uuid>& ids);

    /// @brief Serializes a failed run.
    static std::string render_error(const std::string& message);
};

} // namespace kairos::tool
