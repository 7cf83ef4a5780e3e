// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace urlguard {

// https://datatracker.ietf.org/doc/html/rfc3986#section-3
struct uri_decomposed {
    std::string_view scheme;
    struct {
        std::size_t index{std::string_view::npos};
        std::size_t host_index{std::string_view::npos};
        std::string_view userinfo{};
        // IPv6 literals are stored without the enclosing brackets
        std::string_view host{};
        bool host_is_ipv6{false};
        std::optional<uint16_t> port{};
        std::string_view raw;
    } authority;
    // True when the hierarchical part starts with "//", even if the authority is empty
    bool has_authority{false};
    std::string_view scheme_and_authority;
    std::size_t path_index{std::string_view::npos};
    std::string_view path;
    std::size_t query_index{std::string_view::npos};
    std::string_view query;
    std::size_t fragment_index{std::string_view::npos};
    std::string_view fragment;
    std::string_view raw;
};

/*
 * Structural split on the component delimiters only: scheme, authority,
 * path, query and fragment. Characters within the path, query and fragment
 * aren't validated and the authority is kept raw. Fails only when the
 * authority contains an unbalanced IPv6 bracket.
 */
std::optional<uri_decomposed> uri_split(std::string_view uri);

/*
 * Split followed by the decomposition of the authority into userinfo, host
 * and port. Fails on invalid host characters, invalid IPv6 literals and
 * ports which aren't a number within 0-65535.
 */
std::optional<uri_decomposed> uri_parse(std::string_view uri);

std::ostream &operator<<(std::ostream &o, const uri_decomposed &uri);
} // namespace urlguard
