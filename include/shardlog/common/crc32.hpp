// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace shardlog {
namespace common {
struct crc32 {
    constexpr static uint32_t crc32_polynomial = 0xEDB88320U;

    static constexpr auto table = [] {
        auto crc32_table = std::array<uint32_t, 256>{};
        for (uint32_t byte = 0U; byte < crc32_table.size(); ++byte) {
            uint32_t crc = byte;
            for (int i = 0; i < 8; ++i) {
                const auto m = crc & 1U;
                crc >>= 1U;
                if (m != 0U) {
                    crc ^= crc32_polynomial;
                }
            }
            crc32_table[byte] = crc;
        }
        return crc32_table;
    }();

    [[nodiscard]] static uint32_t update(uint32_t initial_value, const void *buf, size_t len) {
        uint32_t c = initial_value ^ 0xFFFFFFFFU;
        const auto *u = static_cast<const uint8_t *>(buf);
        for (size_t i = 0U; i < len; ++i) {
            c = table[(c ^ u[i]) & 0xFFU] ^ (c >> 8U);
        }
        return c ^ 0xFFFFFFFFU;
    }
};
} // namespace common
} // namespace shardlog
