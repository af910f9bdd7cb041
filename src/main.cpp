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
 * @file main.cpp
 * @brief Entry point of the `kairos` diagnostic executable.
 *
 * @details
 * This file contains the `main` function which orchestrates one run:
 * 1. Argument Parsing.
 * 2. Logger Configuration.
 * 3. Generator Construction (system providers).
 * 4. Identifier Generation and JSON Report.
 */

#include "kairos/core/errors.hpp"
#include "kairos/core/uuid.hpp"
#include "kairos/gen/generator.hpp"
#include "kairos/infra/logger.hpp"
#include "kairos/tool/report.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name
              << " [VERSION] [COUNT] [NAME] [NAMESPACE] [--log-level LEVEL]\n"
              << "Options:\n"
              << "  VERSION     1, 3, 4, 5, 6, 7, or 7m for a monotonic v7 batch (Default: 4)\n"
              << "  COUNT       Number of identifiers to emit (Default: 1)\n"
              << "  NAME        Name hashed by versions 3 and 5 (Required for 3 and 5)\n"
              << "  NAMESPACE   dns, url, oid or x500 (Default: dns)\n"
              << "  --log-level trace, debug, info, warn, error or fatal (Default: warn)\n"
              << "  --help      Show this help message\n";
}

kairos::core::Uuid parse_namespace(const std::string& text)
{
    if (text == "dns")
        return kairos::core::Namespace::DNS;
    if (text == "url")
        return kairos::core::Namespace::URL;
    if (text == "oid")
        return kairos::core::Namespace::OID;
    if (text == "x500")
        return kairos::core::Namespace::X500;
    throw std::invalid_argument("Unknown namespace '" + text + "'");
}

std::vector<kairos::core::Uuid> generate(kairos::gen::MonotonicGenerator& gen,
                                         const std::string& version, std::int64_t count,
                                         const std::string& name, const std::string& ns_text)
{
    if (version == "7m") {
        return gen.generate_batch_v7(count);
    }
    if (count <= 0) {
        throw std::invalid_argument("COUNT must be greater than zero");
    }
    if ((version == "3" || version == "5") && name.empty()) {
        throw std::invalid_argument("NAME is required for version " + version);
    }

    kairos::core::Uuid ns = parse_namespace(ns_text);
    std::vector<kairos::core::Uuid> ids;
    ids.reserve(static_cast<std::size_t>(count));

    for (std::int64_t i = 0; i < count; ++i) {
        if (version == "1")
            ids.push_back(gen.new_v1());
        else if (version == "3")
            ids.push_back(gen.new_v3(ns, name));
        else if (version == "4")
            ids.push_back(gen.new_v4());
        else if (version == "5")
            ids.push_back(gen.new_v5(ns, name));
        else if (version == "6")
            ids.push_back(gen.new_v6());
        else if (version == "7")
            ids.push_back(gen.new_v7());
        else
            throw std::invalid_argument("Unsupported version '" + version + "'");
    }
    return ids;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // 1. Configuration Defaults
    std::vector<std::string> positional;
    kairos::infra::Logger::set_level(kairos::infra::LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_help(argv[0]);
            return 0;
        }
        if (arg == "--log-level" && i + 1 < argc) {
            kairos::infra::Logger::set_level(
                kairos::infra::Logger::parse_level(argv[++i], kairos::infra::LogLevel::WARN));
            continue;
        }
        positional.push_back(arg);
    }

    std::string version = positional.size() > 0 ? positional[0] : "4";
    std::string name = positional.size() > 2 ? positional[2] : "";
    std::string ns_text = positional.size() > 3 ? positional[3] : "dns";

    try {
        // 2. Parse Command Line Arguments
        std::int64_t count = positional.size() > 1 ? std::stoll(positional[1]) : 1;

        kairos::infra::Logger::log(kairos::infra::LogLevel::INFO,
                                   "Config: version=" + version + " count=" +
                                       std::to_string(count));

        // 3. Generator Bootstrap (system randomness, clock and interfaces)
        kairos::gen::MonotonicGenerator gen;

        // 4. Generate and Report
        std::cout << kairos::tool::Report::render(version,
                                                  generate(gen, version, count, name, ns_text))
                  << std::endl;

    } catch (const kairos::core::Error& e) {
        // Already logged where it was raised.
        std::cout << kairos::tool::Report::render_error(e.what()) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        kairos::infra::Logger::log(kairos::infra::LogLevel::FATAL,
                                   "Invalid invocation: " + std::string(e.what()));
        std::cout << kairos::tool::Report::render_error(e.what()) << std::endl;
        return 2;
    }

    return 0;
}
