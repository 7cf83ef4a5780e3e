// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "common/utils.hpp"
#include "urlguard.h"

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
parsed_args parse_args(int argc, char *argv[], const arg_map &arg_mapping)
{
    parsed_args args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                arg = long_arg->second;
            } else {
                std::cerr << "Ignoring unknown option " << arg << '\n';
                last_arg = args.end();
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

const char *level_to_str(URLGUARD_LOG_LEVEL level)
{
    switch (level) {
    case URLGUARD_LOG_TRACE:
        return "trace";
    case URLGUARD_LOG_DEBUG:
        return "debug";
    case URLGUARD_LOG_ERROR:
        return "error";
    case URLGUARD_LOG_WARN:
        return "warn";
    case URLGUARD_LOG_INFO:
        return "info";
    case URLGUARD_LOG_OFF:
        break;
    }

    return "off";
}

void log_cb(URLGUARD_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    std::cerr << "[" << level_to_str(level) << "][" << file << ":" << function << ":" << line
              << "]: " << message << '\n';
}
