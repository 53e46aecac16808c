// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <shardlog/common/slices.hpp>
#include <shardlog/stream/record.hpp>
#include <shardlog/stream/shard.hpp>
#include <string>
#include <vector>

namespace shardlog {
namespace stream {
enum class StreamStatus : std::uint8_t {
    Creating,
    Active,
    Deleting,
};

std::string str(StreamStatus) noexcept;

struct StreamDescription {
    std::string stream_name{};
    std::string stream_arn{};
    StreamStatus stream_status{StreamStatus::Creating};
    int64_t stream_creation_timestamp{0};
    std::vector<ShardDescription> shards{};
    bool has_more_shards{false};
};

/**
 * Split the hash key space into shard_count contiguous ranges of (almost) equal width.
 */
std::vector<HashKeyRange> splitHashKeySpace(uint32_t shard_count);

/**
 * Hash of a partition key inside [0, HASH_KEY_SPACE). Stable for the same key.
 */
uint64_t hashPartitionKey(const std::string &partition_key) noexcept;

class __attribute__((visibility("default"))) Stream {
  private:
    std::string _name;
    std::string _arn;
    uint64_t _incarnation;
    int64_t _creation_timestamp;
    std::atomic<StreamStatus> _status{StreamStatus::Creating};
    std::vector<std::unique_ptr<Shard>> _shards{};

    Stream(std::string name, std::string arn, const uint64_t incarnation) noexcept;

  public:
    /**
     * Create a stream with shard_count shards, named shardId-000000000000 onwards. The stream is ACTIVE
     * when this returns.
     */
    static std::shared_ptr<Stream> create(std::string name, std::string arn, const uint32_t shard_count,
                                          const uint64_t incarnation) noexcept;

    Stream(Stream &) = delete;
    Stream &operator=(Stream &) = delete;
    ~Stream() = default;

    const std::string &name() const noexcept {
        return _name;
    }

    const std::string &arn() const noexcept {
        return _arn;
    }

    uint64_t incarnation() const noexcept {
        return _incarnation;
    }

    StreamStatus status() const noexcept {
        return _status.load();
    }

    void markDeleting() noexcept {
        _status = StreamStatus::Deleting;
    }

    // nullptr when the stream has no such shard.
    Shard *findShard(const std::string &shard_id) const noexcept;

    Shard &shardForHashKey(const uint64_t hash_key) const noexcept;

    StreamDescription describe() const noexcept;
};
} // namespace stream
} // namespace shardlog
