// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "matcher/regex_match.hpp"
#include "verdict.hpp"

namespace urlguard {

struct host_rule_definition {
    std::string_view name;
    std::string_view pattern;
};

// Blocklist heuristics applied to URLs independently of any allowlist. This
// is a coarse secondary guard, encodings such as decimal or octal IPv4
// addresses are not recognised.
class safety_policy {
public:
    // Rules are evaluated in order, patterns carry their own anchors
    static constexpr std::array<host_rule_definition, 12> default_forbidden_hosts{{
        {"loopback", R"(^127\.)"},
        {"link_local", R"(^169\.254\.)"},
        {"ipv6_loopback", R"(^::1$)"},
        {"ipv6_link_local", R"(^fe80:)"},
        {"private_10", R"(^10\.)"},
        {"private_172", R"(^172\.(1[6-9]|2[0-9]|3[01])\.)"},
        {"private_192", R"(^192\.168\.)"},
        {"localhost", R"(localhost)"},
        {"metadata_service", R"(metadata)"},
        {"docker_socket", R"(docker\.sock)"},
        {"redis", R"(redis)"},
        {"internal_suffix", R"(\.internal$)"},
    }};

    // SSH, Telnet, MySQL, PostgreSQL, Redis, MongoDB and internal HTTP
    static constexpr std::array<uint16_t, 7> default_forbidden_ports{
        22, 23, 3306, 5432, 6379, 27017, 8080};

    static constexpr std::array<std::string_view, 4> default_allowed_schemes{
        "http", "https", "ws", "wss"};

    // Throws parsing_error on invalid patterns
    safety_policy(std::span<const host_rule_definition> forbidden_hosts,
        std::span<const uint16_t> forbidden_ports,
        std::span<const std::string_view> allowed_schemes);

    safety_policy(const safety_policy &) = delete;
    safety_policy(safety_policy &&) noexcept = default;
    safety_policy &operator=(const safety_policy &) = delete;
    safety_policy &operator=(safety_policy &&) noexcept = default;
    virtual ~safety_policy() = default;

    static const safety_policy &defaults();

    // Decomposes the URL and applies the scheme, host and port rules. May
    // throw if the regular expression engine fails. Only the offending
    // component is logged, never the URL itself.
    [[nodiscard]] virtual verdict evaluate(std::string_view url) const;

    // Returns the first rule matching the host, or nullptr. The host is
    // expected to be lower-case already.
    [[nodiscard]] const matcher::regex_match *match_host(std::string_view host) const;
    [[nodiscard]] bool is_forbidden_port(uint16_t port) const;
    // Schemes are compared case-insensitively
    [[nodiscard]] bool is_allowed_scheme(std::string_view scheme) const;

    [[nodiscard]] const std::vector<matcher::regex_match> &host_rules() const
    {
        return host_rules_;
    }

protected:
    std::vector<matcher::regex_match> host_rules_;
    std::vector<uint16_t> forbidden_ports_;
    std::vector<std::string> allowed_schemes_;
};

} // namespace urlguard
