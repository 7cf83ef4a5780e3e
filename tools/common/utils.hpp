// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "urlguard.h"

using arg_map = std::map<std::string, std::string, std::less<>>;
using parsed_args = std::unordered_map<std::string, std::vector<std::string>>;

// Options are normalised through the mapping, unknown options are skipped and
// positional values are attached to the last option seen.
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
parsed_args parse_args(int argc, char *argv[], const arg_map &arg_mapping);

const char *level_to_str(URLGUARD_LOG_LEVEL level);

void log_cb(URLGUARD_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);
