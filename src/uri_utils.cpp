// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>
#include <string_view>

#include <arpa/inet.h>
#include <netinet/in.h>

#include "uri_utils.hpp"
#include "utils.hpp"

/*
   RFC 3986
   --
   URI           = scheme ":" hier-part [ "?" query ] [ "#" fragment ]
   hier-part     = "//" authority path-abempty / path
   relative-ref  = [ "//" authority ] path [ "?" query ] [ "#" fragment ]
   scheme        = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
   authority     = [ userinfo "@" ] host [ ":" port ]
   host          = "[" IPv6address "]" / IPv4address / reg-name
   port          = *DIGIT

   Only the delimiters ":", "//", "/", "?", "#" determine the split. URLs
   found in the wild carry unescaped spaces, braces, pipes or UTF-8 in their
   path and query, so those components are never validated. The host is held
   to the reg-name character set (plus non-ASCII for IDNs) since it's what
   the forbidden host rules are evaluated against.
*/

namespace urlguard {

namespace {

constexpr const auto &npos = std::string_view::npos;

inline bool is_scheme_char(char c)
{
    return urlguard::isalnum(c) || c == '.' || c == '-' || c == '+';
}

inline bool is_host_char(char c)
{
    switch (c) {
    case '-':
    case '.':
    case '_':
    case '~':
    case '!':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case ';':
    case '=':
    case '%':
        return true;
    default:
        break;
    }
    return urlguard::isalnum(c) || static_cast<unsigned char>(c) >= 0x80;
}

bool is_ipv6_address(std::string_view host)
{
    if (host.empty() || host.size() >= INET6_ADDRSTRLEN) {
        return false;
    }

    std::array<char, INET6_ADDRSTRLEN> host_cstr{0};
    memcpy(host_cstr.data(), host.data(), host.size());

    in6_addr addr{};
    return inet_pton(AF_INET6, host_cstr.data(), &addr) == 1;
}

// Length of the scheme, including the ':' terminator, or 0 if there is none
std::size_t scheme_length(std::string_view uri)
{
    if (uri.empty() || !urlguard::isalpha(uri[0])) {
        return 0;
    }

    for (std::size_t i = 1; i < uri.size(); ++i) {
        if (uri[i] == ':') {
            return i + 1;
        }
        if (!is_scheme_char(uri[i])) {
            return 0;
        }
    }
    return 0;
}

bool parse_port(std::string_view str, uri_decomposed &decomposed)
{
    if (str.empty()) {
        return true;
    }

    for (auto c : str) {
        if (!urlguard::isdigit(c)) {
            return false;
        }
    }

    auto [res, value] = from_string<uint16_t>(str);
    if (res) {
        decomposed.authority.port = value;
    }
    return res;
}

bool parse_authority(uri_decomposed &decomposed)
{
    auto &authority = decomposed.authority;

    // The userinfo ends at the last '@', it may contain anything else
    std::size_t offset = 0;
    auto hostport = authority.raw;
    if (auto at = hostport.rfind('@'); at != npos) {
        authority.userinfo = hostport.substr(0, at);
        offset = at + 1;
        hostport.remove_prefix(offset);
    }

    std::string_view port;
    if (hostport.starts_with('[')) {
        auto end = hostport.find(']');
        if (end == npos) {
            return false;
        }

        auto host = hostport.substr(1, end - 1);
        if (!is_ipv6_address(host)) {
            return false;
        }

        auto remainder = hostport.substr(end + 1);
        if (!remainder.empty()) {
            if (remainder[0] != ':') {
                return false;
            }
            port = remainder.substr(1);
        }

        authority.host = host;
        authority.host_is_ipv6 = true;
        authority.host_index = authority.index + offset + 1;
    } else {
        auto colon = hostport.find(':');
        auto host = hostport.substr(0, colon);
        for (auto c : host) {
            if (!is_host_char(c)) {
                return false;
            }
        }

        if (colon != npos) {
            port = hostport.substr(colon + 1);
        }

        authority.host = host;
        if (!host.empty()) {
            authority.host_index = authority.index + offset;
        }
    }

    return parse_port(port, decomposed);
}

} // namespace

std::optional<uri_decomposed> uri_split(std::string_view uri)
{
    uri_decomposed decomposed;
    decomposed.raw = uri;

    auto scheme_size = scheme_length(uri);
    if (scheme_size > 0) {
        decomposed.scheme = uri.substr(0, scheme_size - 1);
    }

    std::size_t i = scheme_size;
    if (uri.substr(i).starts_with("//")) {
        i += 2;
        decomposed.has_authority = true;

        auto end = uri.find_first_of("/?#", i);
        if (end == npos) {
            end = uri.size();
        }

        auto raw = uri.substr(i, end - i);
        // Brackets are reserved to IPv6 literals
        if ((raw.find('[') == npos) != (raw.find(']') == npos)) {
            return std::nullopt;
        }

        if (!raw.empty()) {
            decomposed.authority.index = i;
            decomposed.authority.raw = raw;
            decomposed.scheme_and_authority = uri.substr(0, end);
        }
        i = end;
    }

    auto path_end = uri.find_first_of("?#", i);
    if (path_end == npos) {
        path_end = uri.size();
    }

    if (path_end > i) {
        decomposed.path_index = i;
        decomposed.path = uri.substr(i, path_end - i);
    }
    i = path_end;

    if (i < uri.size() && uri[i] == '?') {
        auto query_end = uri.find('#', i + 1);
        if (query_end == npos) {
            query_end = uri.size();
        }

        // Ignore empty query
        if (query_end > i + 1) {
            decomposed.query_index = i + 1;
            decomposed.query = uri.substr(i + 1, query_end - i - 1);
        }
        i = query_end;
    }

    // Ignore empty fragment
    if (i + 1 < uri.size() && uri[i] == '#') {
        decomposed.fragment_index = i + 1;
        decomposed.fragment = uri.substr(i + 1);
    }

    return decomposed;
}

std::optional<uri_decomposed> uri_parse(std::string_view uri)
{
    auto decomposed = uri_split(uri);
    if (!decomposed.has_value()) {
        return std::nullopt;
    }

    if (!decomposed->authority.raw.empty() && !parse_authority(*decomposed)) {
        return std::nullopt;
    }

    return decomposed;
}

std::ostream &operator<<(std::ostream &o, const uri_decomposed &uri)
{
    o << "Scheme   : " << uri.scheme << '\n'
      << "Userinfo : " << uri.authority.userinfo << '\n'
      << "Host     : " << uri.authority.host << '\n'
      << "Port     : ";
    if (uri.authority.port.has_value()) {
        o << *uri.authority.port;
    }
    o << '\n'
      << "Path     : " << uri.path << '\n'
      << "Query    : " << uri.query << '\n'
      << "Fragment : " << uri.fragment << '\n';
    return o;
}
} // namespace urlguard
