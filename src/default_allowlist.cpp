// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <vector>

#include "allowlist.hpp"

namespace urlguard {

// Adding a service or an endpoint requires a new release, there is no runtime
// registration. Known variants (bare host, host with path, trailing slash) are
// listed explicitly.
std::vector<service_definition> default_service_definitions()
{
    return {
        {"lighter",
            {
                // mainnet
                {"https://mainnet.zklighter.elliot.ai", "https://api.zklighter.elliot.ai"},
                // testnet
                {"https://testnet.zklighter.elliot.ai", "https://testnet-api.zklighter.elliot.ai"},
                // ws_mainnet
                {"wss://mainnet.zklighter.elliot.ai", "wss://mainnet.zklighter.elliot.ai/stream"},
                // ws_testnet
                {"wss://testnet.zklighter.elliot.ai", "wss://testnet.zklighter.elliot.ai/stream"},
            }},
        {"backpack",
            {
                {"https://api.backpack.exchange", "https://api.backpack.exchange/"},
                // Backpack uses the same API endpoint for both modes
                {"https://api.backpack.exchange"},
                {"wss://ws.backpack.exchange", "wss://ws.backpack.exchange/"},
                {"wss://ws.backpack.exchange"},
            }},
        {"binance",
            {
                {"https://fapi.binance.com", "https://api.binance.com"},
                {"https://testnet.binancefuture.com", "https://testnet.binance.vision"},
                {"wss://fstream.binance.com", "wss://stream.binance.com:9443"},
                {"wss://stream.binancefuture.com"},
            }},
        {"okx",
            {
                {"https://www.okx.com", "https://okx.com", "https://api.okx.com"},
                // Demo trading goes through the production hosts
                {"https://www.okx.com", "https://okx.com"},
                {"wss://ws.okx.com:8443", "wss://ws.okx.com:8443/ws/v5/public",
                    "wss://ws.okx.com:8443/ws/v5/private"},
                {"wss://wspap.okx.com:8443", "wss://wspap.okx.com:8443/ws/v5/public",
                    "wss://wspap.okx.com:8443/ws/v5/private"},
            }},
        {"edgex",
            {
                {"https://api.edgex.exchange", "https://edgex.exchange"},
                {"https://api.edgex.exchange", "https://edgex.exchange"},
                {"wss://ws.edgex.exchange"},
                {"wss://ws.edgex.exchange"},
            }},
        {"hyperliquid",
            {
                {"https://api.hyperliquid.xyz", "https://hyperliquid.xyz"},
                {"https://testnet.hyperliquid.xyz", "https://api-testnet.hyperliquid.xyz"},
                {"wss://api.hyperliquid.xyz/ws"},
                {"wss://testnet.hyperliquid.xyz/ws"},
            }},
    };
}

} // namespace urlguard
