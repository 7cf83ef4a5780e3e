// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace urlguard_fuzzer {

inline std::string_view bytes_to_string_view(const uint8_t *data, size_t size)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return std::string_view{reinterpret_cast<const char *>(data), size};
}

// Prevent compiler optimization of results
template <typename T> inline void prevent_optimization(T &value)
{
    asm volatile("" : "+m"(value) : : "memory");
}

// Splits the fuzzer input into typed values, the last string takes whatever
// remains of the buffer.
class random_buffer {
public:
    random_buffer(const uint8_t *bytes, size_t size) : bytes_(bytes), size_(size) {}

    bool get_bool()
    {
        if (index_ >= size_) {
            return false;
        }
        return (bytes_[index_++] & 1) != 0;
    }

    std::string_view get_string()
    {
        if ((index_ + sizeof(uint8_t)) > size_) {
            return {};
        }

        auto length = std::min(static_cast<size_t>(bytes_[index_++]), size_ - index_);
        auto value = bytes_to_string_view(&bytes_[index_], length);
        index_ += length;
        return value;
    }

    std::string_view get_remaining()
    {
        if (index_ >= size_) {
            return {};
        }
        auto value = bytes_to_string_view(&bytes_[index_], size_ - index_);
        index_ = size_;
        return value;
    }

protected:
    const uint8_t *bytes_;
    size_t size_;
    size_t index_{0};
};

} // namespace urlguard_fuzzer
