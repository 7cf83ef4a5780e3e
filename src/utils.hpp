// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace urlguard {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isalpha(char c) { return (static_cast<unsigned>(c) | 32) - 'a' < 26; }
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isxdigit(char c) { return isdigit(c) || ((unsigned)c | 32) - 'a' < 6; }
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline bool isalnum(char c) { return isalpha(c) || isdigit(c); }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

template <typename T> std::pair<bool, T> from_string(std::string_view str);

bool string_iequals(std::string_view left, std::string_view right);

// ASCII-only lower case copy, non-ASCII bytes are kept as-is
std::string to_lower(std::string_view str);

} // namespace urlguard
