// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "safety_policy.hpp"

namespace urlguard {

enum class network_mode : uint8_t { mainnet, testnet };
enum class transport : uint8_t { http, websocket };

constexpr network_mode to_network_mode(bool is_testnet)
{
    return is_testnet ? network_mode::testnet : network_mode::mainnet;
}

constexpr transport to_transport(bool is_websocket)
{
    return is_websocket ? transport::websocket : transport::http;
}

// Trusted base URLs of a single service, one ordered sequence per network
// mode and transport.
class endpoint_set {
public:
    endpoint_set() = default;
    endpoint_set(std::vector<std::string> mainnet, std::vector<std::string> testnet,
        std::vector<std::string> ws_mainnet, std::vector<std::string> ws_testnet);

    [[nodiscard]] const std::vector<std::string> &urls(network_mode mode, transport type) const
    {
        return urls_[index(mode, type)];
    }

    void set_urls(network_mode mode, transport type, std::vector<std::string> urls)
    {
        urls_[index(mode, type)] = std::move(urls);
    }

    [[nodiscard]] bool empty() const;

protected:
    static constexpr std::size_t index(network_mode mode, transport type)
    {
        return (type == transport::websocket ? 2 : 0) + (mode == network_mode::testnet ? 1 : 0);
    }

    std::array<std::vector<std::string>, 4> urls_;
};

struct service_definition {
    std::string name;
    endpoint_set endpoints;
};

// Immutable mapping from service name to its endpoint set. Service names are
// compared case-insensitively and kept in declaration order.
class allowlist {
public:
    // Throws parsing_error on empty or duplicate service names, or if any
    // endpoint is rejected by the safety policy.
    explicit allowlist(std::vector<service_definition> services,
        const safety_policy &policy = safety_policy::defaults());

    allowlist(const allowlist &) = delete;
    allowlist(allowlist &&) noexcept = default;
    allowlist &operator=(const allowlist &) = delete;
    allowlist &operator=(allowlist &&) noexcept = default;
    ~allowlist() = default;

    // Compiled-in table, built on first use
    static std::shared_ptr<const allowlist> defaults();

    [[nodiscard]] const endpoint_set *find(std::string_view service) const;
    [[nodiscard]] std::vector<std::string_view> services() const;
    [[nodiscard]] std::size_t size() const { return services_.size(); }
    [[nodiscard]] bool empty() const { return services_.empty(); }

protected:
    std::vector<service_definition> services_;
};

// Compiled-in service table
std::vector<service_definition> default_service_definitions();

} // namespace urlguard
