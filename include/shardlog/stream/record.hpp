// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>
#include <shardlog/common/expected.hpp>
#include <shardlog/common/slices.hpp>
#include <shardlog/common/util.hpp>
#include <string>

namespace shardlog {
namespace stream {
enum class StreamErrorCode : std::uint8_t {
    NoError,
    ResourceNotFound,
    InvalidArgument,
    ResourceInUse,
    LimitExceeded,
};

using StreamError = common::GenericError<StreamErrorCode>;

std::string str(StreamErrorCode) noexcept;

constexpr uint64_t FIRST_SEQUENCE_NUMBER = 1U;

struct Record {
    uint64_t sequence_number{};
    std::string partition_key{};
    common::OwnedSlice data{};
    int64_t approximate_arrival_timestamp{};

    Record() = default;

    // coverity[autosar_cpp14_a15_4_3_violation] false positive, all implementations are noexcept
    // coverity[misra_cpp_2008_rule_15_4_1_violation] false positive, implementation is noexcept
    Record(const uint64_t isequence_number, std::string &&ipartition_key, common::OwnedSlice &&idata,
           const int64_t itimestamp) noexcept;

    /*
     * Deep copy, records handed to readers never share storage with the shard.
     */
    Record clone() const noexcept;

    std::string sequenceNumber() const;
};

std::string formatSequenceNumber(uint64_t sequence_number);

/**
 * Parse an unsigned decimal of at most 20 digits. Leading zeros are allowed.
 */
common::Expected<uint64_t, StreamError> parseDecimal(const std::string &) noexcept;

/**
 * Parse a decimal sequence number as handed out by the service.
 *
 * @return the sequence number, or InvalidArgument when it is empty, not decimal, zero or out of range.
 */
common::Expected<uint64_t, StreamError> parseSequenceNumber(const std::string &) noexcept;

int64_t timestamp() noexcept;

static constexpr auto StreamNotFoundErrorStr = "Stream not found";
static constexpr auto ShardNotFoundErrorStr = "Shard not found";
} // namespace stream
} // namespace shardlog
