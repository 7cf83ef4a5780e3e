// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

#include "urlguard.h"

namespace urlguard {

// Mirrors URLGUARD_VERDICT so that values can be converted with a cast
// NOLINTNEXTLINE(performance-enum-size)
enum class verdict : uint32_t {
    allowed = URLGUARD_ALLOWED,
    empty_url = URLGUARD_EMPTY_URL,
    unknown_service = URLGUARD_UNKNOWN_SERVICE,
    not_allowlisted = URLGUARD_NOT_ALLOWLISTED,
    malformed_url = URLGUARD_MALFORMED_URL,
    forbidden_scheme = URLGUARD_FORBIDDEN_SCHEME,
    missing_host = URLGUARD_MISSING_HOST,
    forbidden_host = URLGUARD_FORBIDDEN_HOST,
    forbidden_port = URLGUARD_FORBIDDEN_PORT,
    internal_error = URLGUARD_INTERNAL_ERROR,
};

constexpr std::string_view verdict_to_str(verdict value)
{
    switch (value) {
    case verdict::allowed:
        return "allowed";
    case verdict::empty_url:
        return "empty_url";
    case verdict::unknown_service:
        return "unknown_service";
    case verdict::not_allowlisted:
        return "not_allowlisted";
    case verdict::malformed_url:
        return "malformed_url";
    case verdict::forbidden_scheme:
        return "forbidden_scheme";
    case verdict::missing_host:
        return "missing_host";
    case verdict::forbidden_host:
        return "forbidden_host";
    case verdict::forbidden_port:
        return "forbidden_port";
    case verdict::internal_error:
        break;
    }

    return "internal_error";
}

} // namespace urlguard
