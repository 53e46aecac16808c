// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include <cstdint>
#include <memory>
#include <shardlog/common/crc32.hpp>
#include <shardlog/stream/shard.hpp>
#include <shardlog/stream/stream.hpp>
#include <string>
#include <utility>
#include <vector>

namespace shardlog {
namespace stream {
std::string str(const StreamStatus status) noexcept {
    std::string v{};
    switch (status) {
    case StreamStatus::Creating:
        v = "CREATING";
        break;
    case StreamStatus::Active:
        v = "ACTIVE";
        break;
    case StreamStatus::Deleting:
        v = "DELETING";
        break;
    }
    return v;
}

std::vector<HashKeyRange> splitHashKeySpace(const uint32_t shard_count) {
    std::vector<HashKeyRange> ranges{};
    ranges.reserve(shard_count);
    for (uint64_t i = 0U; i < shard_count; i++) {
        const auto start = (HASH_KEY_SPACE * i) / shard_count;
        const auto end = ((HASH_KEY_SPACE * (i + 1U)) / shard_count) - 1U;
        ranges.push_back(HashKeyRange{start, end});
    }
    return ranges;
}

uint64_t hashPartitionKey(const std::string &partition_key) noexcept {
    return common::crc32::update(0U, partition_key.data(), partition_key.size());
}

Stream::Stream(std::string name, std::string arn, const uint64_t incarnation) noexcept
    : _name(std::move(name)), _arn(std::move(arn)), _incarnation(incarnation), _creation_timestamp(timestamp()) {
}

std::shared_ptr<Stream> Stream::create(std::string name, std::string arn, const uint32_t shard_count,
                                       const uint64_t incarnation) noexcept {
    // coverity[autosar_cpp14_a20_8_6_violation] constructor is private, cannot use make_shared
    auto stream = std::shared_ptr<Stream>(new Stream(std::move(name), std::move(arn), incarnation));

    uint32_t index = 0U;
    for (const auto &range : splitHashKeySpace(shard_count)) {
        stream->_shards.emplace_back(std::make_unique<Shard>(Shard::shardIdFor(index), range));
        index++;
    }
    stream->_status = StreamStatus::Active;
    return stream;
}

Shard *Stream::findShard(const std::string &shard_id) const noexcept {
    for (const auto &shard : _shards) {
        if (shard->id() == shard_id) {
            return shard.get();
        }
    }
    return nullptr;
}

Shard &Stream::shardForHashKey(const uint64_t hash_key) const noexcept {
    for (const auto &shard : _shards) {
        if (shard->hashKeyRange().contains(hash_key)) {
            return *shard;
        }
    }
    // The ranges cover the whole hash key space, so only an out of range key ends up here.
    return *_shards.back();
}

StreamDescription Stream::describe() const noexcept {
    StreamDescription description{_name, _arn, status(), _creation_timestamp, {}, false};
    description.shards.reserve(_shards.size());
    for (const auto &shard : _shards) {
        description.shards.push_back(shard->describe());
    }
    return description;
}
} // namespace stream
} // namespace shardlog
