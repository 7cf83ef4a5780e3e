// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include "allowlist.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace urlguard;
using namespace std::literals;

namespace {

TEST(TestAllowlist, DefaultServices)
{
    auto table = allowlist::defaults();
    ASSERT_NE(table, nullptr);

    auto names = table->services();
    std::vector<std::string_view> expected{
        "lighter", "backpack", "binance", "okx", "edgex", "hyperliquid"};
    EXPECT_EQ(names, expected);
    EXPECT_EQ(table->size(), 6U);
    EXPECT_FALSE(table->empty());

    // Built once
    EXPECT_EQ(allowlist::defaults().get(), table.get());
}

TEST(TestAllowlist, DefaultEndpoints)
{
    auto table = allowlist::defaults();

    {
        const auto *endpoints = table->find("lighter");
        ASSERT_NE(endpoints, nullptr);

        std::vector<std::string> mainnet{
            "https://mainnet.zklighter.elliot.ai", "https://api.zklighter.elliot.ai"};
        EXPECT_EQ(endpoints->urls(network_mode::mainnet, transport::http), mainnet);

        std::vector<std::string> ws_testnet{
            "wss://testnet.zklighter.elliot.ai", "wss://testnet.zklighter.elliot.ai/stream"};
        EXPECT_EQ(endpoints->urls(network_mode::testnet, transport::websocket), ws_testnet);
    }

    {
        const auto *endpoints = table->find("binance");
        ASSERT_NE(endpoints, nullptr);

        std::vector<std::string> testnet{
            "https://testnet.binancefuture.com", "https://testnet.binance.vision"};
        EXPECT_EQ(endpoints->urls(network_mode::testnet, transport::http), testnet);

        std::vector<std::string> ws_mainnet{
            "wss://fstream.binance.com", "wss://stream.binance.com:9443"};
        EXPECT_EQ(endpoints->urls(network_mode::mainnet, transport::websocket), ws_mainnet);
    }

    {
        const auto *endpoints = table->find("okx");
        ASSERT_NE(endpoints, nullptr);
        EXPECT_EQ(endpoints->urls(network_mode::mainnet, transport::http).size(), 3U);
        EXPECT_EQ(endpoints->urls(network_mode::testnet, transport::http).size(), 2U);
        EXPECT_EQ(endpoints->urls(network_mode::testnet, transport::websocket).front(),
            "wss://wspap.okx.com:8443");
    }

    {
        const auto *endpoints = table->find("hyperliquid");
        ASSERT_NE(endpoints, nullptr);
        std::vector<std::string> ws_mainnet{"wss://api.hyperliquid.xyz/ws"};
        EXPECT_EQ(endpoints->urls(network_mode::mainnet, transport::websocket), ws_mainnet);
    }
}

TEST(TestAllowlist, DefaultEndpointsAreSafe)
{
    const auto &policy = safety_policy::defaults();

    for (const auto &service : default_service_definitions()) {
        EXPECT_FALSE(service.endpoints.empty()) << service.name;

        for (auto mode : {network_mode::mainnet, network_mode::testnet}) {
            for (auto type : {transport::http, transport::websocket}) {
                const auto &urls = service.endpoints.urls(mode, type);
                EXPECT_FALSE(urls.empty()) << service.name;
                for (const auto &url : urls) {
                    EXPECT_EQ(policy.evaluate(url), verdict::allowed) << url;
                }
            }
        }
    }
}

TEST(TestAllowlist, FindIsCaseInsensitive)
{
    auto table = allowlist::defaults();

    EXPECT_NE(table->find("Lighter"), nullptr);
    EXPECT_NE(table->find("HYPERLIQUID"), nullptr);
    EXPECT_EQ(table->find("OKX"), table->find("okx"));

    EXPECT_EQ(table->find("unknown_exchange"), nullptr);
    EXPECT_EQ(table->find(""), nullptr);
    EXPECT_EQ(table->find("okx "), nullptr);
}

TEST(TestAllowlist, EndpointSetSelection)
{
    endpoint_set endpoints{{"https://a.example.com"}, {"https://b.example.com"},
        {"wss://c.example.com"}, {"wss://d.example.com"}};

    EXPECT_EQ(endpoints.urls(network_mode::mainnet, transport::http).front(),
        "https://a.example.com");
    EXPECT_EQ(endpoints.urls(network_mode::testnet, transport::http).front(),
        "https://b.example.com");
    EXPECT_EQ(endpoints.urls(network_mode::mainnet, transport::websocket).front(),
        "wss://c.example.com");
    EXPECT_EQ(endpoints.urls(network_mode::testnet, transport::websocket).front(),
        "wss://d.example.com");

    EXPECT_EQ(to_network_mode(true), network_mode::testnet);
    EXPECT_EQ(to_network_mode(false), network_mode::mainnet);
    EXPECT_EQ(to_transport(true), transport::websocket);
    EXPECT_EQ(to_transport(false), transport::http);
}

TEST(TestAllowlist, EmptyEndpointSet)
{
    endpoint_set endpoints;
    EXPECT_TRUE(endpoints.empty());

    endpoints.set_urls(network_mode::testnet, transport::websocket, {"wss://d.example.com"});
    EXPECT_FALSE(endpoints.empty());
    EXPECT_TRUE(endpoints.urls(network_mode::mainnet, transport::http).empty());
}

TEST(TestAllowlist, CustomAllowlist)
{
    std::vector<service_definition> services;
    services.push_back({"example", {{"https://api.example.com"}, {}, {}, {}}});
    services.push_back({"other", {}});

    allowlist table{std::move(services)};
    EXPECT_EQ(table.size(), 2U);
    ASSERT_NE(table.find("EXAMPLE"), nullptr);
    EXPECT_TRUE(table.find("other")->empty());
}

TEST(TestAllowlist, EmptyAllowlist)
{
    allowlist table{std::vector<service_definition>{}};
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.find("lighter"), nullptr);
}

TEST(TestAllowlist, EmptyServiceName)
{
    std::vector<service_definition> services;
    services.push_back({"", {{"https://api.example.com"}, {}, {}, {}}});

    EXPECT_THROW(allowlist{std::move(services)}, parsing_error);
}

TEST(TestAllowlist, DuplicateService)
{
    std::vector<service_definition> services;
    services.push_back({"okx", {{"https://www.okx.com"}, {}, {}, {}}});
    services.push_back({"OKX", {{"https://okx.com"}, {}, {}, {}}});

    EXPECT_THROW(allowlist{std::move(services)}, parsing_error);
}

TEST(TestAllowlist, UnsafeEndpoint)
{
    {
        std::vector<service_definition> services;
        services.push_back({"internal", {{}, {"http://127.0.0.1:9000"}, {}, {}}});
        EXPECT_THROW(allowlist{std::move(services)}, parsing_error);
    }

    {
        std::vector<service_definition> services;
        services.push_back({"cache", {{}, {}, {"wss://stream.example.com:6379"}, {}}});
        EXPECT_THROW(allowlist{std::move(services)}, parsing_error);
    }

    {
        std::vector<service_definition> services;
        services.push_back({"legacy", {{}, {}, {}, {"ftp://files.example.com"}}});
        EXPECT_THROW(allowlist{std::move(services)}, parsing_error);
    }

    {
        std::vector<service_definition> services;
        services.push_back({"broken", {{"not a url"}, {}, {}, {}}});
        EXPECT_THROW(allowlist{std::move(services)}, parsing_error);
    }
}

TEST(TestAllowlist, UnsafeEndpointMessage)
{
    std::vector<service_definition> services;
    services.push_back({"internal", {{"http://169.254.169.254"}, {}, {}, {}}});

    try {
        allowlist table{std::move(services)};
        FAIL() << "expected parsing_error";
    } catch (const parsing_error &e) {
        EXPECT_NE(std::string_view{e.what()}.find("forbidden_host"), std::string_view::npos);
        EXPECT_NE(std::string_view{e.what()}.find("internal"), std::string_view::npos);
    }
}

} // namespace
