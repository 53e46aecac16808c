// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shardlog/common/expected.hpp>
#include <shardlog/common/logging.hpp>
#include <shardlog/common/slices.hpp>
#include <shardlog/stream/record.hpp>
#include <shardlog/stream/shardIterator.hpp>
#include <shardlog/stream/stream.hpp>
#include <string>
#include <vector>

namespace shardlog {
namespace stream {
struct RegistryOptions {
    std::string partition = "aws";
    std::string service = "kinesis";
    std::string region = "us-east-1";
    std::string account = "123456789012";
    uint32_t max_shards_per_stream = 500U;
    uint32_t max_get_records_limit = 10000U;
    uint32_t max_record_data_bytes = 1024U * 1024U; // 1MB per record
    uint32_t max_partition_key_length = 256U;
    uint32_t max_put_records_entries = 500U;
    std::shared_ptr<logging::Logger> logger{};
};

struct ListStreamsOptions {
    std::optional<int64_t> limit{};
    // Resume listing after this stream name.
    std::string exclusive_start_stream_name{};
};

struct ListStreamsResult {
    std::vector<std::string> stream_names{};
    bool has_more_streams{false};
};

struct PutRecordResult {
    std::string shard_id{};
    std::string sequence_number{};
};

struct PutRecordsEntry {
    std::string partition_key{};
    common::BorrowedSlice data{};
    std::string explicit_hash_key{};
};

struct PutRecordsResult {
    std::vector<PutRecordResult> records{};
    uint32_t failed_record_count{0U};
};

struct GetRecordsResult {
    std::vector<Record> records{};
    std::string next_shard_iterator{};
    int64_t millis_behind_latest{0};
};

/**
 * Table of streams keyed by name and the entry point of every operation. Instances are independent, a test or
 * an embedding service constructs one and passes it to whoever needs it.
 */
class __attribute__((visibility("default"))) StreamRegistry {
  private:
    RegistryOptions _opts;
    std::vector<std::shared_ptr<Stream>> _streams{};
    uint64_t _next_incarnation{1U};
    mutable std::mutex _lock{};

    // coverity[autosar_cpp14_a15_4_3_violation] false positive, all implementations are noexcept
    // coverity[misra_cpp_2008_rule_15_4_1_violation] false positive, implementation is noexcept
    explicit StreamRegistry(RegistryOptions &&opts) noexcept;

    bool logEnabled(logging::LogLevel) const noexcept;

    StreamError reject(const std::string &operation, StreamError &&err) const noexcept;

    common::Expected<std::shared_ptr<Stream>, StreamError> findStream(const std::string &name) const noexcept;

    StreamError validateRecord(const std::string &partition_key, const common::BorrowedSlice data) const noexcept;

    common::Expected<uint64_t, StreamError> resolveHashKey(const std::string &partition_key,
                                                           const std::string &explicit_hash_key) const noexcept;

    std::string arnFor(const std::string &name) const;

  public:
    static common::Expected<std::shared_ptr<StreamRegistry>, StreamError> create(RegistryOptions &&) noexcept;

    StreamRegistry(StreamRegistry &) = delete;
    StreamRegistry &operator=(StreamRegistry &) = delete;
    ~StreamRegistry() = default;

    /**
     * Create a stream. It is ACTIVE as soon as this returns.
     *
     * @param name 1 to 128 characters from [a-zA-Z0-9_.-].
     * @param shard_count number of shards, fixed for the lifetime of the stream.
     * @return ResourceInUse if the name is taken, InvalidArgument or LimitExceeded for a bad name or shard count.
     */
    StreamError createStream(const std::string &name, const int32_t shard_count) noexcept;

    common::Expected<StreamDescription, StreamError> describeStream(const std::string &name) const noexcept;

    /**
     * List stream names in creation order.
     */
    common::Expected<ListStreamsResult, StreamError> listStreams(const ListStreamsOptions &opts) const noexcept;

    common::Expected<ListStreamsResult, StreamError> listStreams() const noexcept;

    /**
     * Delete a stream with all its shards and records. Outstanding iterators become unusable.
     */
    StreamError deleteStream(const std::string &name) noexcept;

    /**
     * Append one record. The shard is picked from the explicit hash key if given, otherwise from the hash of the
     * partition key, so the same key always lands on the same shard.
     */
    common::Expected<PutRecordResult, StreamError> putRecord(const std::string &stream_name,
                                                             const std::string &partition_key,
                                                             const common::BorrowedSlice data,
                                                             const std::string &explicit_hash_key = {}) noexcept;

    /**
     * Append a batch of records in order. Every entry is validated before anything is appended.
     */
    common::Expected<PutRecordsResult, StreamError> putRecords(const std::string &stream_name,
                                                               const std::vector<PutRecordsEntry> &entries) noexcept;

    /**
     * Position an iterator in a shard.
     *
     * @param sequence_number decimal sequence number, required for AT_SEQUENCE_NUMBER and AFTER_SEQUENCE_NUMBER and
     * ignored otherwise.
     * @return the opaque iterator token.
     */
    common::Expected<std::string, StreamError> getShardIterator(const std::string &stream_name,
                                                                const std::string &shard_id,
                                                                const ShardIteratorType type,
                                                                const std::string &sequence_number = {}) const noexcept;

    common::Expected<std::string, StreamError> getShardIterator(const std::string &stream_name,
                                                                const std::string &shard_id, const std::string &type,
                                                                const std::string &sequence_number = {}) const noexcept;

    /**
     * Read records from the iterator's position.
     *
     * @param limit maximum number of records, between 1 and max_get_records_limit. No limit returns everything
     * available.
     * @return the records and the iterator to continue from.
     */
    common::Expected<GetRecordsResult, StreamError> getRecords(const std::string &shard_iterator,
                                                               const std::optional<int64_t> limit = {}) const noexcept;
};
} // namespace stream
} // namespace shardlog
