// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "allowlist.hpp"
#include "common/utils.hpp"
#include "configuration/allowlist_parser.hpp"
#include "url_validator.hpp"
#include "urlguard.h"
#include "verdict.hpp"

namespace {

void usage(const char *name)
{
    std::cout << "Usage: " << name << " --url <url> [<url>..] [--service <name>]"
              << " [--testnet] [--websocket] [--allowlist <yaml file>] [--verbose]\n";
}

} // namespace

int main(int argc, char *argv[])
{
    const arg_map arg_mapping{{"-u", "--url"}, {"--url", "--url"}, {"-s", "--service"},
        {"--service", "--service"}, {"-t", "--testnet"}, {"--testnet", "--testnet"},
        {"-w", "--websocket"}, {"--websocket", "--websocket"}, {"-a", "--allowlist"},
        {"--allowlist", "--allowlist"}, {"-v", "--verbose"}, {"--verbose", "--verbose"}};

    auto args = parse_args(argc, argv, arg_mapping);

    if (args.contains("--verbose")) {
        urlguard_set_log_cb(log_cb, URLGUARD_LOG_TRACE);
    } else {
        urlguard_set_log_cb(log_cb, URLGUARD_LOG_OFF);
    }

    const std::vector<std::string> urls = args["--url"];
    if (urls.empty()) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::vector<std::string> services = args["--service"];
    const std::vector<std::string> allowlists = args["--allowlist"];
    if (services.size() > 1 || allowlists.size() > 1) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    const bool is_testnet = args.contains("--testnet");
    const bool is_websocket = args.contains("--websocket");

    int retval = EXIT_SUCCESS;
    try {
        std::shared_ptr<const urlguard::allowlist> table;
        if (allowlists.empty()) {
            table = urlguard::allowlist::defaults();
        } else {
            table = urlguard::configuration::load_allowlist_file(allowlists.front());
        }

        const urlguard::url_validator validator{table};

        for (const auto &url : urls) {
            // Only the sanitized form is printed, the query may carry credentials
            std::cout << urlguard::url_validator::sanitize_url(url) << '\n';

            auto safety = validator.check_url_safety(url);
            std::cout << "  safety    : " << urlguard::verdict_to_str(safety) << '\n';
            if (safety != urlguard::verdict::allowed) {
                retval = EXIT_FAILURE;
            }

            if (services.empty()) {
                continue;
            }

            const auto &service = services.front();
            auto allowed = validator.check_allowed_url(service, url, is_testnet, is_websocket);
            std::cout << "  allowlist : " << urlguard::verdict_to_str(allowed) << " (" << service
                      << ", " << (is_testnet ? "testnet" : "mainnet") << ", "
                      << (is_websocket ? "websocket" : "http") << ")\n";
            if (allowed != urlguard::verdict::allowed) {
                retval = EXIT_FAILURE;
            }
        }
    } catch (const std::exception &e) {
        std::cout << "Unexpected exception: " << e.what() << '\n';
        retval = EXIT_FAILURE;
    }

    return retval;
}
