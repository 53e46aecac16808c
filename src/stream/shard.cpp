// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <shardlog/common/expected.hpp>
#include <shardlog/common/slices.hpp>
#include <shardlog/stream/record.hpp>
#include <shardlog/stream/shard.hpp>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace shardlog {
namespace stream {
static constexpr int SHARD_ID_DIGITS = 12;

static uint64_t sequenceOf(const Record &r) noexcept {
    return r.sequence_number;
}

static uint64_t sequenceOf(const uint64_t sequence_number) noexcept {
    return sequence_number;
}

Shard::Shard(std::string id, const HashKeyRange range) noexcept : _id(std::move(id)), _hash_key_range(range) {
}

std::string Shard::shardIdFor(const uint32_t index) {
    std::ostringstream out;
    out << "shardId-" << std::setw(SHARD_ID_DIGITS) << std::setfill('0') << index;
    return out.str();
}

common::Expected<uint64_t, StreamError> Shard::append(std::string partition_key,
                                                      const common::BorrowedSlice data) noexcept {
    if (partition_key.empty()) {
        return StreamError{StreamErrorCode::InvalidArgument, "Partition key cannot be empty"};
    }

    common::OwnedSlice owned{data};
    std::lock_guard<std::mutex> lock(_lock);
    const auto seq = _next_sequence_number++;
    _records.emplace_back(seq, std::move(partition_key), std::move(owned), timestamp());
    return seq;
}

ShardReadResult Shard::read(const uint64_t from_sequence_number, const uint64_t limit) const noexcept {
    ShardReadResult result{};
    result.next_sequence_number = from_sequence_number;

    std::lock_guard<std::mutex> lock(_lock);
    auto it = std::lower_bound(_records.cbegin(), _records.cend(), from_sequence_number,
                               [](const auto &a, const auto &b) { return sequenceOf(a) < sequenceOf(b); });

    const auto available = static_cast<uint64_t>(std::distance(it, _records.cend()));
    result.records.reserve(static_cast<size_t>(std::min(available, limit)));
    for (; (it != _records.cend()) && (result.records.size() < limit); ++it) {
        result.records.emplace_back(it->clone());
    }

    if (!result.records.empty()) {
        const auto &last = result.records.back();
        result.next_sequence_number = last.sequence_number + 1U;
        if (it != _records.cend()) {
            result.millis_behind_latest =
                std::max<int64_t>(0, _records.back().approximate_arrival_timestamp - last.approximate_arrival_timestamp);
        }
    }
    return result;
}

uint64_t Shard::nextSequenceNumber() const noexcept {
    std::lock_guard<std::mutex> lock(_lock);
    return _next_sequence_number;
}

bool Shard::containsSequenceNumber(const uint64_t sequence_number) const noexcept {
    std::lock_guard<std::mutex> lock(_lock);
    return std::binary_search(_records.cbegin(), _records.cend(), sequence_number,
                              [](const auto &a, const auto &b) { return sequenceOf(a) < sequenceOf(b); });
}

size_t Shard::recordCount() const noexcept {
    std::lock_guard<std::mutex> lock(_lock);
    return _records.size();
}

ShardDescription Shard::describe() const noexcept {
    return ShardDescription{_id, _hash_key_range, formatSequenceNumber(FIRST_SEQUENCE_NUMBER), {}};
}
} // namespace stream
} // namespace shardlog
