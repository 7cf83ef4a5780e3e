// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "allowlist.hpp"
#include "log.hpp"
#include "uri_utils.hpp"
#include "url_validator.hpp"
#include "utils.hpp"
#include "verdict.hpp"

namespace urlguard {

namespace {

bool endpoint_match(std::string_view candidate, std::string_view endpoint)
{
    if (!candidate.starts_with(endpoint)) {
        return false;
    }
    // Either an exact match or a path below the endpoint
    return candidate.size() == endpoint.size() || candidate[endpoint.size()] == '/';
}

// Query and fragment may carry credentials, only the sanitized form is logged
std::string loggable_url(std::string_view url)
{
    if (!uri_split(url).has_value()) {
        return "(malformed)";
    }
    return url_validator::sanitize_url(url);
}

} // namespace

std::string normalize_endpoint(std::string_view url)
{
    if (url.ends_with('/')) {
        url.remove_suffix(1);
    }
    return to_lower(url);
}

url_validator::url_validator(std::shared_ptr<const allowlist> table, const safety_policy &policy)
    : table_(std::move(table)), policy_(policy)
{}

const url_validator &url_validator::defaults()
{
    static const url_validator validator{allowlist::defaults(), safety_policy::defaults()};
    return validator;
}

verdict url_validator::check_allowed_url(std::string_view service, std::string_view url,
    bool is_testnet, bool is_websocket) const noexcept
{
    if (url.empty()) {
        return verdict::empty_url;
    }

    try {
        const auto *endpoints = table_->find(service);
        if (endpoints == nullptr) {
            URLGUARD_WARN("Unknown service: {}", service);
            return verdict::unknown_service;
        }

        const auto &allowed =
            endpoints->urls(to_network_mode(is_testnet), to_transport(is_websocket));

        const auto candidate = normalize_endpoint(url);
        for (const auto &endpoint : allowed) {
            if (endpoint_match(candidate, normalize_endpoint(endpoint))) {
                URLGUARD_TRACE("URL {} allowed by endpoint {} of service {}", loggable_url(url),
                    endpoint, service);
                return verdict::allowed;
            }
        }

        URLGUARD_DEBUG("URL {} not allowlisted for service {} (testnet: {}, websocket: {})",
            loggable_url(url), service, is_testnet, is_websocket);
        return verdict::not_allowlisted;
    } catch (const std::exception &e) {
        URLGUARD_WARN("Failed to verify URL: {}", e.what());
    } catch (...) {
        URLGUARD_WARN("Failed to verify URL: unknown exception");
    }

    return verdict::internal_error;
}

verdict url_validator::check_url_safety(std::string_view url) const noexcept
{
    try {
        return policy_.evaluate(url);
    } catch (const std::exception &e) {
        URLGUARD_WARN("Failed to verify URL: {}", e.what());
    } catch (...) {
        URLGUARD_WARN("Failed to verify URL: unknown exception");
    }

    return verdict::internal_error;
}

std::string url_validator::sanitize_url(std::string_view url)
{
    if (url.empty()) {
        return {};
    }

    auto decomposed = uri_split(url);
    if (!decomposed.has_value()) {
        URLGUARD_WARN("Unable to sanitize malformed URL");
        return std::string{url};
    }

    std::string sanitized;
    sanitized.reserve(url.size());
    if (!decomposed->scheme.empty()) {
        sanitized.append(decomposed->scheme);
        sanitized.append(":");
    }

    if (decomposed->has_authority) {
        sanitized.append("//");
        sanitized.append(decomposed->authority.raw);
    }

    sanitized.append(decomposed->path);

    while (!sanitized.empty() && sanitized.back() == '/') {
        sanitized.pop_back();
    }

    return sanitized;
}

std::vector<std::string> url_validator::get_allowed_base_urls(
    std::string_view service, bool is_testnet) const
{
    return get_urls(service, to_network_mode(is_testnet), transport::http);
}

std::vector<std::string> url_validator::get_allowed_ws_urls(
    std::string_view service, bool is_testnet) const
{
    return get_urls(service, to_network_mode(is_testnet), transport::websocket);
}

std::vector<std::string> url_validator::get_urls(
    std::string_view service, network_mode mode, transport type) const
{
    const auto *endpoints = table_->find(service);
    if (endpoints == nullptr) {
        return {};
    }
    return endpoints->urls(mode, type);
}

} // namespace urlguard
