// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "allowlist.hpp"
#include "safety_policy.hpp"
#include "verdict.hpp"

namespace urlguard {

// Stateless checks over an immutable allowlist and safety policy, safe to
// share between threads. None of the member functions throw; every failure
// is reported as a denial (or an empty result).
class url_validator {
public:
    explicit url_validator(std::shared_ptr<const allowlist> table,
        const safety_policy &policy = safety_policy::defaults());

    // Validator over the compiled-in allowlist and default policy
    static const url_validator &defaults();

    /**
     * Check whether the URL is one of the endpoints of the service for the
     * given mode and transport, or a path below one of them.
     *
     * Both the URL and the endpoints are lower-cased and stripped of a single
     * trailing slash before comparison. An endpoint matches when it's equal
     * to the URL or when the URL starts with the endpoint followed by '/',
     * so https://api.example.com never authorises https://api.example.com.evil.com.
     */
    [[nodiscard]] verdict check_allowed_url(std::string_view service, std::string_view url,
        bool is_testnet = false, bool is_websocket = false) const noexcept;

    [[nodiscard]] bool is_allowed_url(std::string_view service, std::string_view url,
        bool is_testnet = false, bool is_websocket = false) const noexcept
    {
        return check_allowed_url(service, url, is_testnet, is_websocket) == verdict::allowed;
    }

    // Scheme, host and port heuristics, independent of the allowlist
    [[nodiscard]] verdict check_url_safety(std::string_view url) const noexcept;

    [[nodiscard]] bool validate_url_safety(std::string_view url) const noexcept
    {
        return check_url_safety(url) == verdict::allowed;
    }

    // Keeps scheme, authority and path; drops query, fragment and trailing
    // slashes. Only the component delimiters are considered, so any URL is
    // sanitized except one with an unbalanced IPv6 bracket in its authority,
    // which is returned unchanged.
    static std::string sanitize_url(std::string_view url);

    [[nodiscard]] std::vector<std::string> get_allowed_base_urls(
        std::string_view service, bool is_testnet = false) const;
    [[nodiscard]] std::vector<std::string> get_allowed_ws_urls(
        std::string_view service, bool is_testnet = false) const;

    [[nodiscard]] const allowlist &table() const { return *table_; }
    [[nodiscard]] const safety_policy &policy() const { return policy_; }

protected:
    [[nodiscard]] std::vector<std::string> get_urls(
        std::string_view service, network_mode mode, transport type) const;

    std::shared_ptr<const allowlist> table_;
    const safety_policy &policy_;
};

// Single trailing slash removal followed by ASCII lower-casing
std::string normalize_endpoint(std::string_view url);

} // namespace urlguard
