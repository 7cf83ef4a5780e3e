// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstring>
#include <exception>
#include <string_view>

#include "log.hpp"
#include "url_validator.hpp"
#include "urlguard.h"
#include "verdict.hpp"
#include "version.hpp"

namespace {

std::string_view to_string_view(const char *str, size_t length)
{
    if (str == nullptr) {
        return {};
    }
    return {str, length};
}

} // namespace

extern "C" {

URLGUARD_VERDICT urlguard_check_allowed_url(
    const char *service, const char *url, size_t length, bool is_testnet, bool is_websocket)
{
    if (service == nullptr) {
        URLGUARD_WARN("Service name not provided");
        return URLGUARD_UNKNOWN_SERVICE;
    }

    try {
        const auto &validator = urlguard::url_validator::defaults();
        auto result = validator.check_allowed_url(
            service, to_string_view(url, length), is_testnet, is_websocket);
        return static_cast<URLGUARD_VERDICT>(result);
    } catch (const std::exception &e) {
        URLGUARD_ERROR("{}", e.what());
    } catch (...) {
        URLGUARD_ERROR("unknown exception");
    }

    return URLGUARD_INTERNAL_ERROR;
}

bool urlguard_is_allowed_url(
    const char *service, const char *url, size_t length, bool is_testnet, bool is_websocket)
{
    return urlguard_check_allowed_url(service, url, length, is_testnet, is_websocket) ==
           URLGUARD_ALLOWED;
}

URLGUARD_VERDICT urlguard_check_url_safety(const char *url, size_t length)
{
    try {
        const auto &validator = urlguard::url_validator::defaults();
        return static_cast<URLGUARD_VERDICT>(
            validator.check_url_safety(to_string_view(url, length)));
    } catch (const std::exception &e) {
        URLGUARD_ERROR("{}", e.what());
    } catch (...) {
        URLGUARD_ERROR("unknown exception");
    }

    return URLGUARD_INTERNAL_ERROR;
}

bool urlguard_validate_url_safety(const char *url, size_t length)
{
    return urlguard_check_url_safety(url, length) == URLGUARD_ALLOWED;
}

size_t urlguard_sanitize_url(const char *url, size_t length, char *buffer, size_t buffer_size)
{
    try {
        auto sanitized = urlguard::url_validator::sanitize_url(to_string_view(url, length));
        if (buffer != nullptr && buffer_size > sanitized.size()) {
            memcpy(buffer, sanitized.data(), sanitized.size());
            buffer[sanitized.size()] = '\0';
        }
        return sanitized.size();
    } catch (const std::exception &e) {
        URLGUARD_ERROR("{}", e.what());
    } catch (...) {
        URLGUARD_ERROR("unknown exception");
    }

    return 0;
}

const char *urlguard_verdict_to_str(URLGUARD_VERDICT verdict)
{
    // All verdict strings are literals, hence NUL-terminated
    return urlguard::verdict_to_str(static_cast<urlguard::verdict>(verdict)).data();
}

const char *urlguard_get_version() { return urlguard::current_version.data(); }

bool urlguard_set_log_cb(urlguard_log_cb cb, URLGUARD_LOG_LEVEL min_level)
{
    urlguard::logger::init(cb, min_level);
    URLGUARD_INFO(
        "Sending log messages to binding, min level {}", urlguard::log_level_to_str(min_level));
    return true;
}
}
