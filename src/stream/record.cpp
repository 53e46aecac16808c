// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <shardlog/common/expected.hpp>
#include <shardlog/common/slices.hpp>
#include <shardlog/stream/record.hpp>
#include <string>
#include <utility>

namespace shardlog {
namespace stream {
static constexpr int BASE_10 = 10;
static constexpr size_t UINT64_MAX_DECIMAL_COUNT = 20U;

std::string str(const StreamErrorCode code) noexcept {
    std::string v{};
    switch (code) {
    case StreamErrorCode::NoError:
        v = "NoError";
        break;
    case StreamErrorCode::ResourceNotFound:
        v = "ResourceNotFound";
        break;
    case StreamErrorCode::InvalidArgument:
        v = "InvalidArgument";
        break;
    case StreamErrorCode::ResourceInUse:
        v = "ResourceInUse";
        break;
    case StreamErrorCode::LimitExceeded:
        v = "LimitExceeded";
        break;
    }
    return v;
}

Record::Record(const uint64_t isequence_number, std::string &&ipartition_key, common::OwnedSlice &&idata,
               const int64_t itimestamp) noexcept
    : sequence_number(isequence_number), partition_key(std::move(ipartition_key)), data(std::move(idata)),
      approximate_arrival_timestamp(itimestamp) {
}

Record Record::clone() const noexcept {
    return Record{sequence_number, std::string{partition_key}, common::OwnedSlice{data.borrow()},
                  approximate_arrival_timestamp};
}

std::string Record::sequenceNumber() const {
    return formatSequenceNumber(sequence_number);
}

std::string formatSequenceNumber(const uint64_t sequence_number) {
    return std::to_string(sequence_number);
}

common::Expected<uint64_t, StreamError> parseDecimal(const std::string &s) noexcept {
    if (s.empty() || (s.size() > UINT64_MAX_DECIMAL_COUNT)) {
        return StreamError{StreamErrorCode::InvalidArgument, "Expected 1 to 20 decimal digits: " + s};
    }
    for (const char c : s) {
        if ((c < '0') || (c > '9')) {
            return StreamError{StreamErrorCode::InvalidArgument, "Not a decimal number: " + s};
        }
    }

    char *end_ptr = nullptr; // NOLINT(cppcoreguidelines-pro-type-vararg)
    // coverity[autosar_cpp14_m19_3_1_violation] setting errno so we can read it from strtoull call
    // coverity[misra_cpp_2008_rule_19_3_1_violation] setting errno so we can read it from strtoull call
    errno = 0;
    const uint64_t value = strtoull(s.c_str(), &end_ptr, BASE_10);
    // coverity[autosar_cpp14_m19_3_1_violation] strtoull gives us errors via errno
    // coverity[misra_cpp_2008_rule_19_3_1_violation] strtoull gives us errors via errno
    if ((errno != 0) || (end_ptr != s.c_str() + s.size())) {
        return StreamError{StreamErrorCode::InvalidArgument, "Decimal number out of range: " + s};
    }
    return value;
}

common::Expected<uint64_t, StreamError> parseSequenceNumber(const std::string &s) noexcept {
    auto value_or = parseDecimal(s);
    if (!value_or.ok()) {
        return StreamError{StreamErrorCode::InvalidArgument, "Invalid sequence number: " + value_or.err().msg};
    }
    if (value_or.val() < FIRST_SEQUENCE_NUMBER) {
        return StreamError{StreamErrorCode::InvalidArgument, "Sequence number out of range: " + s};
    }
    return value_or.val();
}

int64_t timestamp() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}
} // namespace stream
} // namespace shardlog
