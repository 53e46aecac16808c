// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>
#include <mutex>
#include <shardlog/common/expected.hpp>
#include <shardlog/common/slices.hpp>
#include <shardlog/stream/record.hpp>
#include <string>
#include <vector>

namespace shardlog {
namespace stream {
// Partition keys hash into [0, HASH_KEY_SPACE).
constexpr uint64_t HASH_KEY_SPACE = UINT64_C(1) << 32U;

struct HashKeyRange {
    uint64_t starting_hash_key{0U};
    uint64_t ending_hash_key{0U};

    bool contains(const uint64_t hash_key) const noexcept {
        return (hash_key >= starting_hash_key) && (hash_key <= ending_hash_key);
    }
};

struct ShardDescription {
    std::string shard_id{};
    HashKeyRange hash_key_range{};
    std::string starting_sequence_number{};
    // Empty while the shard is open, which is always the case without resharding.
    std::string ending_sequence_number{};
};

struct ShardReadResult {
    std::vector<Record> records{};
    uint64_t next_sequence_number{FIRST_SEQUENCE_NUMBER};
    int64_t millis_behind_latest{0};
};

class __attribute__((visibility("default"))) Shard {
  private:
    std::string _id;
    HashKeyRange _hash_key_range;
    std::vector<Record> _records{};
    uint64_t _next_sequence_number{FIRST_SEQUENCE_NUMBER};
    mutable std::mutex _lock{};

  public:
    // coverity[autosar_cpp14_a15_4_3_violation] false positive, all implementations are noexcept
    // coverity[misra_cpp_2008_rule_15_4_1_violation] false positive, implementation is noexcept
    Shard(std::string id, const HashKeyRange range) noexcept;

    Shard(Shard &) = delete;
    Shard &operator=(Shard &) = delete;
    ~Shard() = default;

    static std::string shardIdFor(uint32_t index);

    const std::string &id() const noexcept {
        return _id;
    }

    const HashKeyRange &hashKeyRange() const noexcept {
        return _hash_key_range;
    }

    /**
     * Append a record to the end of the shard.
     *
     * @return the sequence number assigned to the record.
     */
    common::Expected<uint64_t, StreamError> append(std::string partition_key,
                                                   const common::BorrowedSlice data) noexcept;

    /**
     * Copy out up to limit records whose sequence number is at least from_sequence_number.
     * Reading at or past the tip is not an error, it returns no records.
     */
    ShardReadResult read(const uint64_t from_sequence_number, const uint64_t limit) const noexcept;

    // Sequence number the next append will receive. LATEST iterators anchor here.
    uint64_t nextSequenceNumber() const noexcept;

    bool containsSequenceNumber(const uint64_t sequence_number) const noexcept;

    size_t recordCount() const noexcept;

    ShardDescription describe() const noexcept;
};
} // namespace stream
} // namespace shardlog
