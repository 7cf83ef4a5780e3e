// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <charconv>
#include <iterator>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "utils.hpp"

namespace urlguard {

bool string_iequals(std::string_view left, std::string_view right)
{
    return left.size() == right.size() &&
           std::equal(left.begin(), left.end(), right.begin(),
               [](char l, char r) { return tolower(l) == tolower(r); });
}

std::string to_lower(std::string_view str)
{
    std::string lowered;
    lowered.reserve(str.size());
    std::transform(str.begin(), str.end(), std::back_inserter(lowered),
        [](char c) { return tolower(c); });
    return lowered;
}

template <typename T> std::pair<bool, T> from_string(std::string_view str)
{
    T result;
    const auto *end = str.data() + str.size();
    auto [endConv, err] = std::from_chars(str.data(), end, result);
    if (err == std::errc{} && endConv == end) {
        return {true, result};
    }

    return {false, {}};
}

template std::pair<bool, uint16_t> from_string<uint16_t>(std::string_view str);
template std::pair<bool, unsigned> from_string<unsigned>(std::string_view str);

} // namespace urlguard
