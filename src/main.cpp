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
 * @brief Command-line entry point of the `uuidforge` tool.
 *
 * @details
 * Sub-commands:
 * 1. `gen`: Generates one or more UUIDs of a given version.
 * 2. `parse`: Decodes UUID text and prints a JSON description per input.
 */

#include "uuidforge/codec/codec.hpp"
#include "uuidforge/core/error.hpp"
#include "uuidforge/generator/generator.hpp"
#include "uuidforge/infra/logger.hpp"
#include "uuidforge/infra/string.hpp"
#include "uuidforge/storage/json.hpp"

#include <cJSON.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using uuidforge::infra::LogLevel;
using uuidforge::infra::Logger;

/**
 * @struct GenConfig
 * @brief Options of the `gen` sub-command.
 */
struct GenConfig {
    int version = 4;
    long count = 1;
    uuidforge::core::Uuid ns = uuidforge::core::NAMESPACE_DNS;
    std::string name;
    bool has_name = false;
    std::uint8_t domain = uuidforge::core::DOMAIN_PERSON;
};

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [--verbose] gen [OPTIONS]\n"
              << "       " << binary_name << " [--verbose] parse TEXT...\n"
              << "Generate options:\n"
              << "  -v, --version N   UUID version 1-7 (Default: 4)\n"
              << "  -n, --count N     Number of UUIDs to print (Default: 1)\n"
              << "  --namespace NS    dns|url|oid|x500 or a UUID, for v3/v5 (Default: dns)\n"
              << "  --name NAME       Name to hash, required for v3/v5\n"
              << "  --domain D        person|group|org or 0-255, for v2 (Default: person)\n"
              << "Global options:\n"
              << "  --verbose         Enable debug logging\n"
              << "  --help            Show this help message\n";
}

uuidforge::core::Uuid parse_namespace(const std::string& value)
{
    if (value == "dns")
        return uuidforge::core::NAMESPACE_DNS;
    if (value == "url")
        return uuidforge::core::NAMESPACE_URL;
    if (value == "oid")
        return uuidforge::core::NAMESPACE_OID;
    if (value == "x500")
        return uuidforge::core::NAMESPACE_X500;
    return uuidforge::codec::from_string(value);
}

std::uint8_t parse_domain(const std::string& value)
{
    if (value == "person")
        return uuidforge::core::DOMAIN_PERSON;
    if (value == "group")
        return uuidforge::core::DOMAIN_GROUP;
    if (value == "org")
        return uuidforge::core::DOMAIN_ORG;

    long raw = uuidforge::infra::String::to_long("--domain", value);
    if (raw < 0 || raw > 255) {
        throw std::invalid_argument("domain out of range: " + value);
    }
    return static_cast<std::uint8_t>(raw);
}

GenConfig parse_gen_args(const std::vector<std::string>& args)
{
    GenConfig config;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for option " + arg);
        }
        const std::string& next = args[++i];

        if (arg == "-v" || arg == "--version") {
            long version = uuidforge::infra::String::to_long(arg, next);
            if (version < 1 || version > 7) {
                throw std::invalid_argument("unsupported UUID version " + next);
            }
            config.version = static_cast<int>(version);
        } else if (arg == "-n" || arg == "--count") {
            config.count = uuidforge::infra::String::to_long(arg, next);
        } else if (arg == "--namespace") {
            config.ns = parse_namespace(next);
        } else if (arg == "--name") {
            config.name = next;
            config.has_name = true;
        } else if (arg == "--domain") {
            config.domain = parse_domain(next);
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }

    if (config.count < 1) {
        throw std::invalid_argument("count must be positive");
    }
    if ((config.version == 3 || config.version == 5) && !config.has_name) {
        throw std::invalid_argument("--name is required for version " +
                                    std::to_string(config.version));
    }
    return config;
}

uuidforge::core::Uuid generate(uuidforge::generator::Generator& gen, const GenConfig& config)
{
    switch (config.version) {
    case 1:
        return gen.new_v1();
    case 2:
        return gen.new_v2(config.domain);
    case 3:
        return gen.new_v3(config.ns, config.name);
    case 5:
        return gen.new_v5(config.ns, config.name);
    case 6:
        return gen.new_v6();
    case 7:
        return gen.new_v7();
    default:
        return gen.new_v4();
    }
}

int run_gen(const std::vector<std::string>& args)
{
    GenConfig config = parse_gen_args(args);
    Logger::log(LogLevel::DEBUG, "Config: version " + std::to_string(config.version) +
                                     ", count " + std::to_string(config.count));

    auto& gen = uuidforge::generator::default_generator();
    for (long i = 0; i < config.count; ++i) {
        std::cout << generate(gen, config) << "\n";
    }
    return 0;
}

/**
 * @brief Prints one JSON line per input; failures are reported inline.
 *
 * @return 0 if every input decoded, 1 otherwise.
 */
int run_parse(const std::vector<std::string>& args)
{
    if (args.empty()) {
        throw std::invalid_argument("parse expects at least one UUID");
    }

    int status = 0;
    for (const auto& text : args) {
        cJSON* out = nullptr;
        try {
            out = uuidforge::storage::describe(uuidforge::codec::from_string(text));
        } catch (const uuidforge::core::Error& e) {
            out = cJSON_CreateObject();
            cJSON_AddStringToObject(out, "input", text.c_str());
            cJSON_AddStringToObject(out, "error", uuidforge::core::to_string(e.kind()));
            cJSON_AddStringToObject(out, "message", e.what());
            status = 1;
        }

        char* rendered = cJSON_PrintUnformatted(out);
        if (rendered) {
            std::cout << rendered << "\n";
            cJSON_free(rendered);
        }
        cJSON_Delete(out);
    }
    return status;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    if (!args.empty() && args.front() == "--verbose") {
        Logger::set_level(LogLevel::DEBUG);
        args.erase(args.begin());
    }

    if (args.empty() || args.front() == "--help") {
        print_help(argv[0]);
        return args.empty() ? 1 : 0;
    }

    const std::string command = args.front();
    args.erase(args.begin());

    try {
        if (command == "gen") {
            return run_gen(args);
        }
        if (command == "parse") {
            return run_parse(args);
        }
        Logger::log(LogLevel::ERROR, "CLI: Unknown command '" + command + "'.");
        print_help(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "CLI: " + std::string(e.what()));
        return 1;
    }
}
