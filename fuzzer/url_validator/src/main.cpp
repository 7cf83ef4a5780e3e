// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>

#include "../../common/utils.hpp"
#include "url_validator.hpp"
#include "urlguard.h"

using namespace urlguard_fuzzer;

extern "C" int LLVMFuzzerInitialize(const int * /*argc*/, char *** /*argv*/)
{
    urlguard_set_log_cb(nullptr, URLGUARD_LOG_OFF);
    // Build the default allowlist and policy outside of the measured runs
    (void)urlguard::url_validator::defaults();
    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *bytes, size_t size)
{
    random_buffer buffer{bytes, size};

    auto is_testnet = buffer.get_bool();
    auto is_websocket = buffer.get_bool();
    auto service = buffer.get_string();
    auto url = buffer.get_remaining();

    const auto &validator = urlguard::url_validator::defaults();

    auto allowed = validator.check_allowed_url(service, url, is_testnet, is_websocket);
    auto safe = validator.check_url_safety(url);
    prevent_optimization(allowed);
    prevent_optimization(safe);

    auto sanitized = urlguard::url_validator::sanitize_url(url);
    if (urlguard::url_validator::sanitize_url(sanitized) != sanitized) {
        __builtin_trap();
    }

    auto base_urls = validator.get_allowed_base_urls(service, is_testnet);
    auto ws_urls = validator.get_allowed_ws_urls(service, is_testnet);
    prevent_optimization(base_urls);
    prevent_optimization(ws_urls);

    return 0;
}
