// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "allowlist.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "verdict.hpp"

namespace urlguard {

endpoint_set::endpoint_set(std::vector<std::string> mainnet, std::vector<std::string> testnet,
    std::vector<std::string> ws_mainnet, std::vector<std::string> ws_testnet)
{
    set_urls(network_mode::mainnet, transport::http, std::move(mainnet));
    set_urls(network_mode::testnet, transport::http, std::move(testnet));
    set_urls(network_mode::mainnet, transport::websocket, std::move(ws_mainnet));
    set_urls(network_mode::testnet, transport::websocket, std::move(ws_testnet));
}

bool endpoint_set::empty() const
{
    return std::all_of(urls_.begin(), urls_.end(), [](const auto &urls) { return urls.empty(); });
}

allowlist::allowlist(std::vector<service_definition> services, const safety_policy &policy)
{
    services_.reserve(services.size());
    for (auto &service : services) {
        if (service.name.empty()) {
            throw parsing_error("empty service name");
        }

        if (find(service.name) != nullptr) {
            throw parsing_error(fmt::format("duplicate service '{}'", service.name));
        }

        for (auto mode : {network_mode::mainnet, network_mode::testnet}) {
            for (auto type : {transport::http, transport::websocket}) {
                for (const auto &url : service.endpoints.urls(mode, type)) {
                    auto result = policy.evaluate(url);
                    if (result != verdict::allowed) {
                        throw parsing_error(fmt::format("unsafe endpoint '{}' for service '{}': {}",
                            url, service.name, verdict_to_str(result)));
                    }
                }
            }
        }

        URLGUARD_DEBUG("Loaded service '{}'", service.name);
        services_.emplace_back(std::move(service));
    }
}

std::shared_ptr<const allowlist> allowlist::defaults()
{
    static const std::shared_ptr<const allowlist> table =
        std::make_shared<const allowlist>(default_service_definitions());
    return table;
}

const endpoint_set *allowlist::find(std::string_view service) const
{
    auto it = std::find_if(services_.begin(), services_.end(),
        [service](const service_definition &def) { return string_iequals(def.name, service); });
    return it != services_.end() ? &it->endpoints : nullptr;
}

std::vector<std::string_view> allowlist::services() const
{
    std::vector<std::string_view> names;
    names.reserve(services_.size());
    for (const auto &service : services_) { names.emplace_back(service.name); }
    return names;
}

} // namespace urlguard
