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

#include "allowlist.hpp"
#include "common/utils.hpp"
#include "configuration/allowlist_parser.hpp"
#include "exception.hpp"
#include "urlguard.h"

namespace {

void print_allowlist(const urlguard::allowlist &table)
{
    using urlguard::network_mode;
    using urlguard::transport;

    for (auto name : table.services()) {
        const auto *endpoints = table.find(name);
        std::cout << name << '\n';
        for (auto mode : {network_mode::mainnet, network_mode::testnet}) {
            for (auto type : {transport::http, transport::websocket}) {
                const auto *label = type == transport::websocket
                                        ? (mode == network_mode::testnet ? "ws_testnet" : "ws_mainnet")
                                        : (mode == network_mode::testnet ? "testnet" : "mainnet");
                for (const auto &url : endpoints->urls(mode, type)) {
                    std::cout << "  " << label << " : " << url << '\n';
                }
            }
        }
    }
}

} // namespace

int main(int argc, char *argv[])
{
    int retval = EXIT_SUCCESS;

    try {
        urlguard_set_log_cb(log_cb, URLGUARD_LOG_WARN);

        std::shared_ptr<const urlguard::allowlist> table;
        if (argc < 2) {
            // Without a file, the compiled-in table is checked
            table = urlguard::allowlist::defaults();
        } else {
            table = urlguard::configuration::load_allowlist_file(argv[1]);
        }

        print_allowlist(*table);
    } catch (const urlguard::parsing_error &e) {
        std::cout << (argc < 2 ? "built-in" : argv[1]) << " : " << e.what() << '\n';
        retval = EXIT_FAILURE;
    } catch (const std::exception &e) {
        std::cout << "Unexpected exception: " << e.what() << '\n';
        retval = EXIT_FAILURE;
    }

    return retval;
}
