// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "common/utils.hpp"
#include "configuration/env_loader.hpp"
#include "configuration/masking_config_parser.hpp"
#include "json_utils.hpp"
#include "masker.hpp"
#include "masking_config.hpp"
#include "object.hpp"
#include "pattern/registry.hpp"
#include "piiredact.h"

namespace {
// NOLINTNEXTLINE
auto parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-c", "--config"},
        {"-i", "--input"}, {"-e", "--env"}, {"-p", "--patterns"}, {"-v", "--verbose"},
        {"--config", "--config"}, {"--input", "--input"}, {"--env", "--env"},
        {"--patterns", "--patterns"}, {"--verbose", "--verbose"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                arg = long_arg->second;
            } else {
                std::cerr << "Ignoring unknown option " << arg << '\n';
                continue;
            }

            auto [it, res] = args.emplace(arg, std::vector<std::string>{});
            last_arg = it;
        } else if (last_arg != args.end()) {
            last_arg->second.emplace_back(arg);
        }
    }
    return args;
}

void print_usage(const char *name)
{
    std::cout << "Usage: " << name << " [--config <yaml file> | --env] [--patterns]"
              << " [--verbose] --input <json|@json file> [<json|@json file>..]\n";
}

void print_patterns()
{
    for (const auto &info : piiredact::pattern_registry::instance().documentation()) {
        std::cout << info.id << ": " << info.description << " (e.g. " << info.example << ")\n";
    }
}

piiredact::masking_config load_config(
    const std::unordered_map<std::string, std::vector<std::string>> &args)
{
    if (auto it = args.find("--config"); it != args.end()) {
        if (it->second.size() != 1) {
            throw std::invalid_argument("--config expects a single file");
        }
        auto document = YAML::Load(read_file(it->second.front())).as<piiredact::owned_object>();
        return piiredact::parse_masking_config(document);
    }

    if (args.contains("--env")) {
        if (!piiredact::load_dotenv(".env")) {
            std::cerr << "No .env file found, using the process environment only\n";
        }
        return piiredact::masking_config_from_env();
    }

    // Default to masking everything
    piiredact::masking_config config;
    config.enabled = true;
    return config;
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    const bool verbose = args.contains("--verbose");
    piiredact_set_log_cb(log_cb, verbose ? PIIREDACT_LOG_TRACE : PIIREDACT_LOG_OFF);

    if (args.contains("--patterns")) {
        print_patterns();
    }

    const std::vector<std::string> inputs = args["--input"];
    if (inputs.empty()) {
        if (args.contains("--patterns")) {
            return EXIT_SUCCESS;
        }
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (args.contains("--config") && args.contains("--env")) {
        std::cerr << "--config and --env are mutually exclusive\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    piiredact::masking_config config;
    try {
        config = load_config(args);
    } catch (const std::exception &e) {
        std::cerr << "Failed to load configuration: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    const piiredact::masker masker{config};

    int result = EXIT_SUCCESS;
    for (const auto &input_str : inputs) {
        if (verbose) {
            std::cout << "---- Run with " << input_str << '\n';
        }

        try {
            auto json = input_str.starts_with('@') ? read_file(input_str.substr(1)) : input_str;
            auto masked = masker.mask(piiredact::json_to_object(json));
            std::cout << piiredact::object_to_json(masked, true) << '\n';
        } catch (const std::exception &e) {
            std::cerr << "Failed to mask input " << input_str << ": " << e.what() << '\n';
            result = EXIT_FAILURE;
        }
    }

    return result;
}
