// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "log.hpp"
#include "safety_policy.hpp"
#include "uri_utils.hpp"
#include "utils.hpp"
#include "verdict.hpp"

namespace urlguard {

safety_policy::safety_policy(std::span<const host_rule_definition> forbidden_hosts,
    std::span<const uint16_t> forbidden_ports, std::span<const std::string_view> allowed_schemes)
    : forbidden_ports_(forbidden_ports.begin(), forbidden_ports.end()),
      allowed_schemes_(allowed_schemes.begin(), allowed_schemes.end())
{
    host_rules_.reserve(forbidden_hosts.size());
    for (const auto &rule : forbidden_hosts) {
        host_rules_.emplace_back(std::string{rule.name}, rule.pattern);
    }
}

const safety_policy &safety_policy::defaults()
{
    static const safety_policy policy{
        default_forbidden_hosts, default_forbidden_ports, default_allowed_schemes};
    return policy;
}

verdict safety_policy::evaluate(std::string_view url) const
{
    if (url.empty()) {
        return verdict::empty_url;
    }

    auto decomposed = uri_parse(url);
    if (!decomposed.has_value()) {
        URLGUARD_WARN("Malformed URL authority");
        return verdict::malformed_url;
    }

    if (!is_allowed_scheme(decomposed->scheme)) {
        URLGUARD_WARN("Forbidden scheme '{}'", decomposed->scheme);
        return verdict::forbidden_scheme;
    }

    if (decomposed->authority.host.empty()) {
        URLGUARD_DEBUG("URL without host, scheme '{}'", decomposed->scheme);
        return verdict::missing_host;
    }

    const auto host = to_lower(decomposed->authority.host);
    if (const auto *rule = match_host(host); rule != nullptr) {
        URLGUARD_WARN("Forbidden host '{}' matched rule {} ({})", host, rule->name(),
            rule->to_string());
        return verdict::forbidden_host;
    }

    if (decomposed->authority.port.has_value() &&
        is_forbidden_port(decomposed->authority.port.value())) {
        URLGUARD_WARN("Forbidden port {} on host '{}'", decomposed->authority.port.value(), host);
        return verdict::forbidden_port;
    }

    return verdict::allowed;
}

const matcher::regex_match *safety_policy::match_host(std::string_view host) const
{
    for (const auto &rule : host_rules_) {
        if (rule.match(host)) {
            return &rule;
        }
    }
    return nullptr;
}

bool safety_policy::is_forbidden_port(uint16_t port) const
{
    return std::find(forbidden_ports_.begin(), forbidden_ports_.end(), port) !=
           forbidden_ports_.end();
}

bool safety_policy::is_allowed_scheme(std::string_view scheme) const
{
    return std::any_of(allowed_schemes_.begin(), allowed_schemes_.end(),
        [scheme](const std::string &allowed) { return string_iequals(scheme, allowed); });
}

} // namespace urlguard
