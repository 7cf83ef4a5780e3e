// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "urlguard.h"

#define EXPECT_STR(a, b) EXPECT_EQ(std::string_view{a}, std::string_view{b})
#define EXPECT_STRV(a, b) EXPECT_STR(a, b)

// Defined in tests/main.cpp
void log_cb(URLGUARD_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t len);
URLGUARD_LOG_LEVEL test_log_level();

namespace urlguard::test {

// Records every log message emitted while alive, then restores the
// test runner callback.
class log_capture {
public:
    explicit log_capture(URLGUARD_LOG_LEVEL min_level = URLGUARD_LOG_TRACE);
    ~log_capture();

    log_capture(const log_capture &) = delete;
    log_capture(log_capture &&) = delete;
    log_capture &operator=(const log_capture &) = delete;
    log_capture &operator=(log_capture &&) = delete;

    [[nodiscard]] const std::vector<std::pair<URLGUARD_LOG_LEVEL, std::string>> &messages() const;
    [[nodiscard]] bool contains(URLGUARD_LOG_LEVEL level, std::string_view substr) const;
    void clear();
};

} // namespace urlguard::test
