// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <shardlog/common/crc32.hpp>
#include <shardlog/common/expected.hpp>
#include <shardlog/stream/record.hpp>
#include <shardlog/stream/shardIterator.hpp>
#include <string>
#include <tuple>

namespace shardlog {
namespace stream {
static constexpr auto HEX_DIGITS = "0123456789abcdef";
static constexpr uint32_t HEADER_SIZE = static_cast<uint32_t>(sizeof(detail::IteratorHeader));
static constexpr auto InvalidIteratorErrorStr = "Invalid ShardIterator";

std::string str(const ShardIteratorType type) noexcept {
    std::string v{};
    switch (type) {
    case ShardIteratorType::TrimHorizon:
        v = "TRIM_HORIZON";
        break;
    case ShardIteratorType::AtSequenceNumber:
        v = "AT_SEQUENCE_NUMBER";
        break;
    case ShardIteratorType::AfterSequenceNumber:
        v = "AFTER_SEQUENCE_NUMBER";
        break;
    case ShardIteratorType::Latest:
        v = "LATEST";
        break;
    }
    return v;
}

common::Expected<ShardIteratorType, StreamError> parseShardIteratorType(const std::string &s) noexcept {
    for (const auto type : {ShardIteratorType::TrimHorizon, ShardIteratorType::AtSequenceNumber,
                            ShardIteratorType::AfterSequenceNumber, ShardIteratorType::Latest}) {
        if (str(type) == s) {
            return type;
        }
    }
    return StreamError{StreamErrorCode::InvalidArgument, "Invalid ShardIteratorType: " + s};
}

static int hexValue(const char c) noexcept {
    if ((c >= '0') && (c <= '9')) {
        return c - '0';
    }
    if ((c >= 'a') && (c <= 'f')) {
        return c - 'a' + 10;
    }
    return -1;
}

static uint32_t checksum(const detail::IteratorHeader &header, const std::string &payload) noexcept {
    auto zeroed = header;
    zeroed.crc32 = 0U;
    auto crc = common::crc32::update(0U, &zeroed, HEADER_SIZE);
    return common::crc32::update(crc, payload.data(), payload.size());
}

std::string ShardIterator::encode() const noexcept {
    detail::IteratorHeader header{};
    header.iterator_type = static_cast<uint8_t>(type);
    header.stream_name_length = static_cast<uint16_t>(stream_name.size());
    header.shard_id_length = static_cast<uint16_t>(shard_id.size());
    header.incarnation = incarnation;
    header.anchor_sequence_number = anchor_sequence_number;
    header.next_sequence_number = next_sequence_number;

    const auto payload = stream_name + shard_id;
    header.crc32 = checksum(header, payload);

    std::string raw(HEADER_SIZE, '\0');
    // Use memcpy instead of reinterpret cast to avoid UB.
    std::ignore = memcpy(&raw[0], &header, HEADER_SIZE);
    raw += payload;

    std::string token{};
    token.reserve(raw.size() * 2U);
    for (const char c : raw) {
        const auto b = static_cast<uint8_t>(c);
        token.push_back(HEX_DIGITS[b >> 4U]);
        token.push_back(HEX_DIGITS[b & 0x0FU]);
    }
    return token;
}

common::Expected<ShardIterator, StreamError> ShardIterator::decode(const std::string &token) noexcept {
    if ((token.size() % 2U != 0U) || (token.size() < HEADER_SIZE * 2U)) {
        return StreamError{StreamErrorCode::InvalidArgument, InvalidIteratorErrorStr};
    }

    std::string raw{};
    raw.reserve(token.size() / 2U);
    for (size_t i = 0U; i < token.size(); i += 2U) {
        const auto high = hexValue(token[i]);
        const auto low = hexValue(token[i + 1U]);
        if ((high < 0) || (low < 0)) {
            return StreamError{StreamErrorCode::InvalidArgument, InvalidIteratorErrorStr};
        }
        raw.push_back(static_cast<char>((high << 4) | low));
    }

    detail::IteratorHeader header{};
    std::ignore = memcpy(&header, raw.data(), HEADER_SIZE);
    if (header.magic_and_version != detail::ITERATOR_MAGIC_AND_VERSION) {
        return StreamError{StreamErrorCode::InvalidArgument, InvalidIteratorErrorStr};
    }
    if (raw.size() != static_cast<size_t>(HEADER_SIZE) + header.stream_name_length + header.shard_id_length) {
        return StreamError{StreamErrorCode::InvalidArgument, InvalidIteratorErrorStr};
    }

    const auto payload = raw.substr(HEADER_SIZE);
    if (checksum(header, payload) != header.crc32) {
        return StreamError{StreamErrorCode::InvalidArgument, "ShardIterator failed checksum"};
    }
    if ((header.iterator_type < static_cast<uint8_t>(ShardIteratorType::TrimHorizon)) ||
        (header.iterator_type > static_cast<uint8_t>(ShardIteratorType::Latest))) {
        return StreamError{StreamErrorCode::InvalidArgument, InvalidIteratorErrorStr};
    }

    ShardIterator it{};
    it.stream_name = payload.substr(0U, header.stream_name_length);
    it.shard_id = payload.substr(header.stream_name_length);
    it.incarnation = header.incarnation;
    it.type = static_cast<ShardIteratorType>(header.iterator_type);
    it.anchor_sequence_number = header.anchor_sequence_number;
    it.next_sequence_number = header.next_sequence_number;
    return it;
}
} // namespace stream
} // namespace shardlog
