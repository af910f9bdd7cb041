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
 * @file report.cpp
 * @brief cJSON-based implementation of the result serializer.
 */

#include "kairos/tool/report.hpp"

#include <cJSON.h>
#include <cstdlib>

namespace kairos::tool {

namespace {

/// @brief Prints `root` compactly and releases it.
std::string print_and_free(cJSON* root)
{
    char* raw_output = cJSON_PrintUnformatted(root);
    std::string out = raw_output ? std::string(raw_output) : std::string();

    free(raw_output);
    cJSON_Delete(root);
    return out;
}

} // namespace

std::string Report::render(const std::string& version, const std::vector<core::Uuid>& ids)
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "status", "ok");
    cJSON_AddStringToObject(root, "version", version.c_str());
    cJSON_AddNumberToObject(root, "count", static_cast<double>(ids.size()));

    // Ownership Transfer: 'list' becomes a child of 'root'.
    cJSON* list = cJSON_AddArrayToObject(root, "uuids");
    for (const auto& id : ids) {
        cJSON_AddItemToArray(list, cJSON_CreateString(id.to_string().c_str()));
    }

    return print_and_free(root);
}

std::string Report::render_error(const std::string& message)
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "status", "error");
    cJSON_AddStringToObject(root, "message", message.c_str());
    return print_and_free(root);
}

} // namespace kairos::tool
