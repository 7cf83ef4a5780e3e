// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>

#include "../../common/utils.hpp"
#include "uri_utils.hpp"

using namespace urlguard_fuzzer;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    auto uri_raw = bytes_to_string_view(data, size);
    auto split = urlguard::uri_split(uri_raw);
    auto result = urlguard::uri_parse(uri_raw);

    // A parsed URI is always splittable
    if (result.has_value() && !split.has_value()) {
        __builtin_trap();
    }

    if (result.has_value()) {
        // Every component must be a view over the input
        const auto *begin = uri_raw.data();
        const auto *end = begin + uri_raw.size();
        for (auto component : {result->scheme, result->authority.raw, result->authority.host,
                 result->path, result->query, result->fragment}) {
            if (!component.empty() &&
                (component.data() < begin || component.data() + component.size() > end)) {
                __builtin_trap();
            }
        }
    }

    prevent_optimization(split);
    prevent_optimization(result);

    return 0;
}
