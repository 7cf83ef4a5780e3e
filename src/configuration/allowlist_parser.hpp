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

#include <yaml-cpp/yaml.h>

#include "allowlist.hpp"
#include "safety_policy.hpp"

namespace urlguard::configuration {

/*
   version: "1.0"
   services:
     - name: <service>
       mainnet: [ <url>, ... ]
       testnet: [ <url>, ... ]
       ws_mainnet: [ <url>, ... ]
       ws_testnet: [ <url>, ... ]

   Missing sequences are treated as empty, unknown keys are ignored.
*/

// Throws parsing_error (or a subclass) on structural errors
std::vector<service_definition> parse_service_definitions(const YAML::Node &root);

std::shared_ptr<const allowlist> parse_allowlist(
    const YAML::Node &root, const safety_policy &policy = safety_policy::defaults());

std::shared_ptr<const allowlist> parse_allowlist_document(
    std::string_view document, const safety_policy &policy = safety_policy::defaults());

std::shared_ptr<const allowlist> load_allowlist_file(
    const std::string &path, const safety_policy &policy = safety_policy::defaults());

} // namespace urlguard::configuration
