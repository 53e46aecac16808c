// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <shardlog/common/expected.hpp>
#include <shardlog/common/logging.hpp>
#include <shardlog/common/slices.hpp>
#include <shardlog/stream/record.hpp>
#include <shardlog/stream/shard.hpp>
#include <shardlog/stream/shardIterator.hpp>
#include <shardlog/stream/stream.hpp>
#include <shardlog/stream/streamRegistry.hpp>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace shardlog {
namespace stream {
static constexpr size_t STREAM_NAME_LENGTH_MAX = 128U;
static constexpr int64_t LIST_STREAMS_LIMIT_MAX = 10000;

static bool isValidStreamName(const std::string &name) noexcept {
    if (name.empty() || (name.size() > STREAM_NAME_LENGTH_MAX)) {
        return false;
    }
    return std::all_of(name.cbegin(), name.cend(), [](const char c) {
        return ((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z')) || ((c >= '0') && (c <= '9')) ||
               (c == '_') || (c == '.') || (c == '-');
    });
}

common::Expected<std::shared_ptr<StreamRegistry>, StreamError> StreamRegistry::create(RegistryOptions &&o) noexcept {
    auto opts = std::move(o);
    if (opts.partition.empty() || opts.service.empty() || opts.region.empty() || opts.account.empty()) {
        return StreamError{StreamErrorCode::InvalidArgument, "Partition, service, region and account are required"};
    }
    if ((opts.max_shards_per_stream == 0U) || (opts.max_get_records_limit == 0U) ||
        (opts.max_partition_key_length == 0U) || (opts.max_put_records_entries == 0U)) {
        return StreamError{StreamErrorCode::InvalidArgument, "Limits must be greater than 0"};
    }

    // coverity[autosar_cpp14_a20_8_6_violation] constructor is private, cannot use make_shared
    return std::shared_ptr<StreamRegistry>(new StreamRegistry(std::move(opts)));
}

StreamRegistry::StreamRegistry(RegistryOptions &&opts) noexcept : _opts(std::move(opts)) {
}

bool StreamRegistry::logEnabled(const logging::LogLevel level) const noexcept {
    return _opts.logger && _opts.logger->enabled(level);
}

StreamError StreamRegistry::reject(const std::string &operation, StreamError &&err) const noexcept {
    if (logEnabled(logging::LogLevel::Warning)) {
        _opts.logger->log(logging::LogLevel::Warning, operation + " failed with " + str(err.code) + ": " + err.msg);
    }
    return std::move(err);
}

std::string StreamRegistry::arnFor(const std::string &name) const {
    return "arn:" + _opts.partition + ":" + _opts.service + ":" + _opts.region + ":" + _opts.account + ":" + name;
}

common::Expected<std::shared_ptr<Stream>, StreamError>
StreamRegistry::findStream(const std::string &name) const noexcept {
    std::lock_guard<std::mutex> lock(_lock);
    for (const auto &stream : _streams) {
        if (stream->name() == name) {
            return stream;
        }
    }
    return StreamError{StreamErrorCode::ResourceNotFound, std::string{StreamNotFoundErrorStr} + ": " + name};
}

StreamError StreamRegistry::createStream(const std::string &name, const int32_t shard_count) noexcept {
    if (!isValidStreamName(name)) {
        return reject("CreateStream",
                      StreamError{StreamErrorCode::InvalidArgument,
                                  "Stream name must be 1 to 128 characters from [a-zA-Z0-9_.-]: " + name});
    }
    if (shard_count < 1) {
        return reject("CreateStream", StreamError{StreamErrorCode::InvalidArgument, "Shard count must be at least 1"});
    }
    if (static_cast<uint32_t>(shard_count) > _opts.max_shards_per_stream) {
        return reject("CreateStream",
                      StreamError{StreamErrorCode::LimitExceeded,
                                  "Shard count " + std::to_string(shard_count) + " exceeds the limit of " +
                                      std::to_string(_opts.max_shards_per_stream)});
    }

    {
        std::lock_guard<std::mutex> lock(_lock);
        for (const auto &stream : _streams) {
            if (stream->name() == name) {
                return reject("CreateStream",
                              StreamError{StreamErrorCode::ResourceInUse, "Stream already exists: " + name});
            }
        }
        _streams.push_back(
            Stream::create(name, arnFor(name), static_cast<uint32_t>(shard_count), _next_incarnation++));
    }

    if (logEnabled(logging::LogLevel::Info)) {
        _opts.logger->log(logging::LogLevel::Info,
                          "Created stream " + name + " with " + std::to_string(shard_count) + " shard(s)");
    }
    return StreamError{StreamErrorCode::NoError, {}};
}

common::Expected<StreamDescription, StreamError> StreamRegistry::describeStream(const std::string &name) const
    noexcept {
    auto stream_or = findStream(name);
    if (!stream_or.ok()) {
        return reject("DescribeStream", std::move(stream_or.err()));
    }
    return stream_or.val()->describe();
}

common::Expected<ListStreamsResult, StreamError> StreamRegistry::listStreams() const noexcept {
    return listStreams(ListStreamsOptions{});
}

common::Expected<ListStreamsResult, StreamError>
StreamRegistry::listStreams(const ListStreamsOptions &opts) const noexcept {
    if (opts.limit.has_value() && ((*opts.limit < 1) || (*opts.limit > LIST_STREAMS_LIMIT_MAX))) {
        return reject("ListStreams", StreamError{StreamErrorCode::InvalidArgument,
                                                 "Limit must be between 1 and " +
                                                     std::to_string(LIST_STREAMS_LIMIT_MAX)});
    }

    std::lock_guard<std::mutex> lock(_lock);
    auto begin = _streams.cbegin();
    if (!opts.exclusive_start_stream_name.empty()) {
        begin = std::find_if(_streams.cbegin(), _streams.cend(), [&opts](const std::shared_ptr<Stream> &s) {
            return s->name() == opts.exclusive_start_stream_name;
        });
        if (begin == _streams.cend()) {
            return reject("ListStreams", StreamError{StreamErrorCode::InvalidArgument,
                                                     "Unknown ExclusiveStartStreamName: " +
                                                         opts.exclusive_start_stream_name});
        }
        ++begin;
    }

    ListStreamsResult result{};
    for (auto it = begin; it != _streams.cend(); ++it) {
        if (opts.limit.has_value() && (static_cast<int64_t>(result.stream_names.size()) >= *opts.limit)) {
            result.has_more_streams = true;
            break;
        }
        result.stream_names.push_back((*it)->name());
    }
    return result;
}

StreamError StreamRegistry::deleteStream(const std::string &name) noexcept {
    std::shared_ptr<Stream> removed{};
    {
        std::lock_guard<std::mutex> lock(_lock);
        auto it = std::find_if(_streams.begin(), _streams.end(),
                               [&name](const std::shared_ptr<Stream> &s) { return s->name() == name; });
        if (it != _streams.end()) {
            removed = *it;
            removed->markDeleting();
            std::ignore = _streams.erase(it);
        }
    }

    if (!removed) {
        return reject("DeleteStream",
                      StreamError{StreamErrorCode::ResourceNotFound, std::string{StreamNotFoundErrorStr} + ": " + name});
    }
    if (logEnabled(logging::LogLevel::Info)) {
        _opts.logger->log(logging::LogLevel::Info, "Deleted stream " + name);
    }
    return StreamError{StreamErrorCode::NoError, {}};
}

StreamError StreamRegistry::validateRecord(const std::string &partition_key,
                                           const common::BorrowedSlice data) const noexcept {
    if (partition_key.empty() || (partition_key.size() > _opts.max_partition_key_length)) {
        return StreamError{StreamErrorCode::InvalidArgument,
                           "Partition key must be 1 to " + std::to_string(_opts.max_partition_key_length) +
                               " characters"};
    }
    if (data.size() > _opts.max_record_data_bytes) {
        return StreamError{StreamErrorCode::InvalidArgument,
                           "Record data of " + std::to_string(data.size()) + " bytes exceeds the limit of " +
                               std::to_string(_opts.max_record_data_bytes)};
    }
    return StreamError{StreamErrorCode::NoError, {}};
}

common::Expected<uint64_t, StreamError>
StreamRegistry::resolveHashKey(const std::string &partition_key, const std::string &explicit_hash_key) const noexcept {
    if (explicit_hash_key.empty()) {
        return hashPartitionKey(partition_key);
    }

    auto hash_or = parseDecimal(explicit_hash_key);
    if (!hash_or.ok() || (hash_or.val() >= HASH_KEY_SPACE)) {
        return StreamError{StreamErrorCode::InvalidArgument,
                           "Explicit hash key must be a decimal between 0 and " +
                               std::to_string(HASH_KEY_SPACE - 1U) + ": " + explicit_hash_key};
    }
    return hash_or.val();
}

common::Expected<PutRecordResult, StreamError> StreamRegistry::putRecord(const std::string &stream_name,
                                                                         const std::string &partition_key,
                                                                         const common::BorrowedSlice data,
                                                                         const std::string &explicit_hash_key) noexcept {
    auto err = validateRecord(partition_key, data);
    if (!err.ok()) {
        return reject("PutRecord", std::move(err));
    }
    auto hash_or = resolveHashKey(partition_key, explicit_hash_key);
    if (!hash_or.ok()) {
        return reject("PutRecord", std::move(hash_or.err()));
    }
    auto stream_or = findStream(stream_name);
    if (!stream_or.ok()) {
        return reject("PutRecord", std::move(stream_or.err()));
    }

    auto &shard = stream_or.val()->shardForHashKey(hash_or.val());
    auto seq_or = shard.append(partition_key, data);
    if (!seq_or.ok()) {
        return reject("PutRecord", std::move(seq_or.err()));
    }

    if (logEnabled(logging::LogLevel::Debug)) {
        _opts.logger->log(logging::LogLevel::Debug, "Appended record " + formatSequenceNumber(seq_or.val()) + " to " +
                                                        stream_name + "/" + shard.id());
    }
    return PutRecordResult{shard.id(), formatSequenceNumber(seq_or.val())};
}

common::Expected<PutRecordsResult, StreamError>
StreamRegistry::putRecords(const std::string &stream_name, const std::vector<PutRecordsEntry> &entries) noexcept {
    if (entries.empty() || (entries.size() > _opts.max_put_records_entries)) {
        return reject("PutRecords", StreamError{StreamErrorCode::InvalidArgument,
                                                "Records must contain 1 to " +
                                                    std::to_string(_opts.max_put_records_entries) + " entries"});
    }

    std::vector<uint64_t> hash_keys{};
    hash_keys.reserve(entries.size());
    for (const auto &entry : entries) {
        auto err = validateRecord(entry.partition_key, entry.data);
        if (!err.ok()) {
            return reject("PutRecords", std::move(err));
        }
        auto hash_or = resolveHashKey(entry.partition_key, entry.explicit_hash_key);
        if (!hash_or.ok()) {
            return reject("PutRecords", std::move(hash_or.err()));
        }
        hash_keys.push_back(hash_or.val());
    }

    auto stream_or = findStream(stream_name);
    if (!stream_or.ok()) {
        return reject("PutRecords", std::move(stream_or.err()));
    }
    const auto stream = std::move(stream_or.val());

    PutRecordsResult result{};
    result.records.reserve(entries.size());
    for (size_t i = 0U; i < entries.size(); i++) {
        auto &shard = stream->shardForHashKey(hash_keys[i]);
        auto seq_or = shard.append(entries[i].partition_key, entries[i].data);
        if (!seq_or.ok()) {
            // Unreachable: append only rejects empty partition keys and validateRecord caught those.
            return reject("PutRecords", std::move(seq_or.err()));
        }
        result.records.push_back(PutRecordResult{shard.id(), formatSequenceNumber(seq_or.val())});
    }

    if (logEnabled(logging::LogLevel::Debug)) {
        _opts.logger->log(logging::LogLevel::Debug,
                          "Appended " + std::to_string(result.records.size()) + " record(s) to " + stream_name);
    }
    return result;
}

common::Expected<std::string, StreamError>
StreamRegistry::getShardIterator(const std::string &stream_name, const std::string &shard_id, const std::string &type,
                                 const std::string &sequence_number) const noexcept {
    auto type_or = parseShardIteratorType(type);
    if (!type_or.ok()) {
        return reject("GetShardIterator", std::move(type_or.err()));
    }
    return getShardIterator(stream_name, shard_id, type_or.val(), sequence_number);
}

common::Expected<std::string, StreamError>
StreamRegistry::getShardIterator(const std::string &stream_name, const std::string &shard_id,
                                 const ShardIteratorType type, const std::string &sequence_number) const noexcept {
    auto stream_or = findStream(stream_name);
    if (!stream_or.ok()) {
        return reject("GetShardIterator", std::move(stream_or.err()));
    }
    const auto &stream = stream_or.val();
    const auto *shard = stream->findShard(shard_id);
    if (shard == nullptr) {
        return reject("GetShardIterator",
                      StreamError{StreamErrorCode::ResourceNotFound, std::string{ShardNotFoundErrorStr} + ": " +
                                                                         shard_id + " in stream " + stream_name});
    }

    ShardIterator it{stream->name(), stream->incarnation(), shard->id(), type, 0U, FIRST_SEQUENCE_NUMBER};
    switch (type) {
    case ShardIteratorType::TrimHorizon:
        it.next_sequence_number = FIRST_SEQUENCE_NUMBER;
        break;
    case ShardIteratorType::Latest:
        it.next_sequence_number = shard->nextSequenceNumber();
        break;
    case ShardIteratorType::AtSequenceNumber:
    case ShardIteratorType::AfterSequenceNumber: {
        auto seq_or = parseSequenceNumber(sequence_number);
        if (!seq_or.ok()) {
            return reject("GetShardIterator", std::move(seq_or.err()));
        }
        if (!shard->containsSequenceNumber(seq_or.val())) {
            return reject("GetShardIterator",
                          StreamError{StreamErrorCode::InvalidArgument,
                                      "Sequence number " + sequence_number + " not found in " + shard_id});
        }
        it.anchor_sequence_number = seq_or.val();
        it.next_sequence_number =
            (type == ShardIteratorType::AtSequenceNumber) ? seq_or.val() : (seq_or.val() + 1U);
        break;
    }
    default:
        return reject("GetShardIterator",
                      StreamError{StreamErrorCode::InvalidArgument,
                                  "Invalid ShardIteratorType: " + std::to_string(static_cast<int>(type))});
    }

    if (logEnabled(logging::LogLevel::Trace)) {
        _opts.logger->log(logging::LogLevel::Trace, "Issued " + str(type) + " iterator for " + stream_name + "/" +
                                                        shard_id + " at " +
                                                        formatSequenceNumber(it.next_sequence_number));
    }
    return it.encode();
}

common::Expected<GetRecordsResult, StreamError> StreamRegistry::getRecords(const std::string &shard_iterator,
                                                                           const std::optional<int64_t> limit) const
    noexcept {
    if (limit.has_value() && ((*limit < 1) || (*limit > static_cast<int64_t>(_opts.max_get_records_limit)))) {
        return reject("GetRecords", StreamError{StreamErrorCode::InvalidArgument,
                                                "Limit must be between 1 and " +
                                                    std::to_string(_opts.max_get_records_limit)});
    }

    auto it_or = ShardIterator::decode(shard_iterator);
    if (!it_or.ok()) {
        return reject("GetRecords", std::move(it_or.err()));
    }
    auto it = std::move(it_or.val());

    auto stream_or = findStream(it.stream_name);
    if (!stream_or.ok()) {
        return reject("GetRecords", std::move(stream_or.err()));
    }
    const auto &stream = stream_or.val();
    if (stream->incarnation() != it.incarnation) {
        return reject("GetRecords", StreamError{StreamErrorCode::ResourceNotFound,
                                                "Stream " + it.stream_name + " was deleted after the iterator was issued"});
    }
    const auto *shard = stream->findShard(it.shard_id);
    if (shard == nullptr) {
        return reject("GetRecords", StreamError{StreamErrorCode::ResourceNotFound,
                                                std::string{ShardNotFoundErrorStr} + ": " + it.shard_id});
    }

    auto read = shard->read(it.next_sequence_number, limit.has_value() ? static_cast<uint64_t>(*limit) : UINT64_MAX);

    it.next_sequence_number = read.next_sequence_number;
    GetRecordsResult result{};
    result.records = std::move(read.records);
    result.next_shard_iterator = it.encode();
    result.millis_behind_latest = read.millis_behind_latest;

    if (logEnabled(logging::LogLevel::Trace)) {
        _opts.logger->log(logging::LogLevel::Trace,
                          "Read " + std::to_string(result.records.size()) + " record(s) from " + it.stream_name + "/" +
                              it.shard_id + " with a " + str(it.type) + " iterator anchored at " +
                              formatSequenceNumber(it.anchor_sequence_number));
    }
    return result;
}
} // namespace stream
} // namespace shardlog
