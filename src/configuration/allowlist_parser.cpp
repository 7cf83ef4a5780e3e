// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "allowlist.hpp"
#include "configuration/allowlist_parser.hpp"
#include "exception.hpp"
#include "log.hpp"

using namespace std::literals;

namespace urlguard::configuration {

namespace {

constexpr unsigned supported_major_version = 1;

struct endpoint_key {
    std::string_view key;
    network_mode mode;
    transport type;
};

constexpr std::array<endpoint_key, 4> endpoint_keys{{
    {"mainnet"sv, network_mode::mainnet, transport::http},
    {"testnet"sv, network_mode::testnet, transport::http},
    {"ws_mainnet"sv, network_mode::mainnet, transport::websocket},
    {"ws_testnet"sv, network_mode::testnet, transport::websocket},
}};

std::string scalar_at(const YAML::Node &node, const std::string &key)
{
    auto value = node[key];
    if (!value.IsDefined()) {
        throw missing_key(key);
    }

    if (!value.IsScalar()) {
        throw invalid_type(key, "string");
    }

    return value.Scalar();
}

std::vector<std::string> parse_urls(const YAML::Node &node, const std::string &key)
{
    auto sequence = node[key];
    if (!sequence.IsDefined() || sequence.IsNull()) {
        return {};
    }

    if (!sequence.IsSequence()) {
        throw invalid_type(key, "sequence");
    }

    std::vector<std::string> urls;
    urls.reserve(sequence.size());
    for (const auto &item : sequence) {
        if (!item.IsScalar()) {
            throw invalid_type(key, "sequence of strings");
        }
        urls.emplace_back(item.Scalar());
    }
    return urls;
}

void check_version(const YAML::Node &root)
{
    auto version_node = root["version"];
    if (!version_node.IsDefined()) {
        return;
    }

    if (!version_node.IsScalar()) {
        throw invalid_type("version", "string");
    }

    std::string_view version = version_node.Scalar();
    auto dot_pos = version.find('.');
    if (dot_pos == std::string_view::npos) {
        throw parsing_error("invalid version format, expected major.minor");
    }

    if (version.substr(0, dot_pos) != fmt::format("{}", supported_major_version)) {
        throw parsing_error(fmt::format("unsupported version {}", version));
    }
}

} // namespace

std::vector<service_definition> parse_service_definitions(const YAML::Node &root)
{
    if (!root.IsMap()) {
        throw parsing_error("allowlist configuration must be a map");
    }

    check_version(root);

    auto services_node = root["services"];
    if (!services_node.IsDefined()) {
        throw missing_key("services");
    }

    if (!services_node.IsSequence()) {
        throw invalid_type("services", "sequence");
    }

    std::vector<service_definition> services;
    services.reserve(services_node.size());
    std::size_t index = 0;
    for (const auto &node : services_node) {
        if (!node.IsMap()) {
            throw parsing_error(fmt::format("service at index {} must be a map", index));
        }
        ++index;

        service_definition def;
        def.name = scalar_at(node, "name");

        for (const auto &[key, mode, type] : endpoint_keys) {
            def.endpoints.set_urls(mode, type, parse_urls(node, std::string{key}));
        }

        if (def.endpoints.empty()) {
            URLGUARD_WARN("Service '{}' has no endpoints", def.name);
        }

        services.emplace_back(std::move(def));
    }

    return services;
}

std::shared_ptr<const allowlist> parse_allowlist(
    const YAML::Node &root, const safety_policy &policy)
{
    return std::make_shared<const allowlist>(parse_service_definitions(root), policy);
}

std::shared_ptr<const allowlist> parse_allowlist_document(
    std::string_view document, const safety_policy &policy)
{
    YAML::Node root;
    try {
        root = YAML::Load(std::string{document});
    } catch (const YAML::Exception &e) {
        throw parsing_error(fmt::format("invalid allowlist document: {}", e.what()));
    }
    return parse_allowlist(root, policy);
}

std::shared_ptr<const allowlist> load_allowlist_file(
    const std::string &path, const safety_policy &policy)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
        throw parsing_error(fmt::format("unable to load allowlist {}: {}", path, e.what()));
    }

    URLGUARD_DEBUG("Loading allowlist from {}", path);
    return parse_allowlist(root, policy);
}

} // namespace urlguard::configuration
