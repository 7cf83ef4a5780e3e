// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/gtest_utils.hpp"

namespace urlguard::test {

namespace {

// Tests run sequentially, a single capture can be active at a time
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::vector<std::pair<URLGUARD_LOG_LEVEL, std::string>> captured;

void capture_cb(URLGUARD_LOG_LEVEL level, [[maybe_unused]] const char *function,
    [[maybe_unused]] const char *file, [[maybe_unused]] unsigned line, const char *message,
    uint64_t len)
{
    captured.emplace_back(level, std::string{message, static_cast<std::size_t>(len)});
}

} // namespace

log_capture::log_capture(URLGUARD_LOG_LEVEL min_level)
{
    captured.clear();
    urlguard_set_log_cb(capture_cb, min_level);
    // Drop the message announcing the new callback
    captured.clear();
}

log_capture::~log_capture()
{
    urlguard_set_log_cb(log_cb, test_log_level());
    captured.clear();
}

const std::vector<std::pair<URLGUARD_LOG_LEVEL, std::string>> &log_capture::messages() const
{
    return captured;
}

bool log_capture::contains(URLGUARD_LOG_LEVEL level, std::string_view substr) const
{
    return std::any_of(captured.begin(), captured.end(), [&](const auto &entry) {
        return entry.first == level && entry.second.find(substr) != std::string::npos;
    });
}

void log_capture::clear() { captured.clear(); }

} // namespace urlguard::test
