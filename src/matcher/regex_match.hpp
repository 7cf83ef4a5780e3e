// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>

namespace urlguard::matcher {

class regex_match {
public:
    // Throws parsing_error if the expression can't be compiled
    regex_match(std::string name, std::string_view regex_str, bool case_sensitive = false);
    ~regex_match() = default;
    regex_match(const regex_match &) = delete;
    regex_match(regex_match &&) noexcept = default;
    regex_match &operator=(const regex_match &) = delete;
    regex_match &operator=(regex_match &&) noexcept = default;

    [[nodiscard]] std::string_view name() const { return name_; }
    [[nodiscard]] std::string_view to_string() const { return regex->pattern(); }

    // Unanchored search, the expression is responsible for its own anchors
    [[nodiscard]] bool match(std::string_view subject) const;

protected:
    std::string name_;
    std::unique_ptr<re2::RE2> regex{nullptr};
};

} // namespace urlguard::matcher
