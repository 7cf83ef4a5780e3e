// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "exception.hpp"
#include "matcher/regex_match.hpp"

namespace urlguard::matcher {

regex_match::regex_match(std::string name, std::string_view regex_str, bool case_sensitive)
    : name_(std::move(name))
{
    constexpr unsigned regex_max_mem = 512 * 1024;

    re2::RE2::Options options;
    options.set_max_mem(regex_max_mem);
    options.set_log_errors(false);
    options.set_case_sensitive(case_sensitive);

    const re2::StringPiece pattern_ref(regex_str.data(), regex_str.size());
    regex = std::make_unique<re2::RE2>(pattern_ref, options);

    if (!regex->ok()) {
        throw parsing_error("invalid regular expression (" + std::string(regex_str) +
                            "): " + regex->error_arg());
    }
}

bool regex_match::match(std::string_view subject) const
{
    if (subject.empty()) {
        return false;
    }

    const re2::StringPiece subject_ref(subject.data(), subject.size());
    return regex->Match(subject_ref, 0, subject_ref.size(), re2::RE2::UNANCHORED, nullptr, 0);
}

} // namespace urlguard::matcher
