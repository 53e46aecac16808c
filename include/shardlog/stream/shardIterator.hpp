// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>
#include <shardlog/common/expected.hpp>
#include <shardlog/stream/record.hpp>
#include <string>

namespace shardlog {
namespace stream {
namespace detail {
constexpr uint8_t ITERATOR_MAGIC_AND_VERSION = 0xC1U;

#pragma pack(push, 4)
struct IteratorHeader {
    uint8_t magic_and_version{ITERATOR_MAGIC_AND_VERSION};
    uint8_t iterator_type{0U};
    uint16_t stream_name_length{0U};
    uint16_t shard_id_length{0U};
    uint16_t reserved{0U};
    uint32_t crc32{0U};
    uint64_t incarnation{0U};
    uint64_t anchor_sequence_number{0U};
    uint64_t next_sequence_number{0U};
};
#pragma pack(pop)
} // namespace detail

enum class ShardIteratorType : std::uint8_t {
    TrimHorizon = 1U,
    AtSequenceNumber,
    AfterSequenceNumber,
    Latest,
};

// Wire name of the type, e.g. "TRIM_HORIZON".
std::string str(ShardIteratorType) noexcept;

common::Expected<ShardIteratorType, StreamError> parseShardIteratorType(const std::string &) noexcept;

/*
 * Cursor carried by the opaque iterator token. next_sequence_number is the first record a read
 * will return; it is matched against the shard's records each time the cursor is read.
 */
struct ShardIterator {
    std::string stream_name{};
    // Distinguishes a stream from a later one created under the same name.
    uint64_t incarnation{0U};
    std::string shard_id{};
    // How the cursor was issued; reported in read traces only.
    ShardIteratorType type{ShardIteratorType::TrimHorizon};
    uint64_t anchor_sequence_number{0U};
    uint64_t next_sequence_number{FIRST_SEQUENCE_NUMBER};

    /**
     * Render the cursor as an opaque, transport safe token.
     */
    std::string encode() const noexcept;

    /**
     * Parse a token produced by encode().
     *
     * @return the cursor, or InvalidArgument when the token is malformed or fails its checksum.
     */
    static common::Expected<ShardIterator, StreamError> decode(const std::string &token) noexcept;
};
} // namespace stream
} // namespace shardlog
