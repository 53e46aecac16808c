// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0

// NOLINTBEGIN
#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <tuple>
#include <utility>

#include <shardlog/common/logging.hpp>
#include <shardlog/common/slices.hpp>
#include <shardlog/stream/streamRegistry.hpp>
#include <sys/resource.h>

void do_memory() {
    rusage rusage{};
    getrusage(RUSAGE_SELF, &rusage);

    printf("resident size max: %lu KB\n", (rusage.ru_maxrss) / 1024);
}

class MyLogger final : public shardlog::logging::Logger {
    void log(const shardlog::logging::LogLevel l, const std::string &msg) const override {
        if (!enabled(l)) {
            return;
        }
        if (l >= shardlog::logging::LogLevel::Warning) {
            std::cerr << l << " " << msg << std::endl;
        } else {
            std::cout << l << " " << msg << std::endl;
        }
    }
};

int main() {
    srand(static_cast<uint32_t>(time(nullptr)));
    auto data = std::array<char, 128>{};
    for (char &i : data) {
        i = static_cast<char>((rand() % 64) + 64);
    }

    constexpr int NUM_RECORDS = 100000;
    constexpr int NUM_SHARDS = 4;
    const std::string stream_name = "stream1";

    auto start = std::chrono::high_resolution_clock::now();
    {
        auto logger = std::make_shared<MyLogger>();
        shardlog::stream::RegistryOptions opts{};
        opts.logger = logger;
        auto registry_or = shardlog::stream::StreamRegistry::create(std::move(opts));
        if (!registry_or.ok()) {
            std::cerr << registry_or.err().msg << std::endl;
            std::terminate();
        }
        auto registry = registry_or.val();

        auto err = registry->createStream(stream_name, NUM_SHARDS);
        if (!err.ok()) {
            std::cerr << err.msg << std::endl;
            std::terminate();
        }

        for (int i = 0; i < NUM_RECORDS; i++) {
            auto put_or = registry->putRecord(stream_name, "key" + std::to_string(i),
                                              shardlog::common::BorrowedSlice{data.data(), data.size()});
            if (!put_or.ok()) {
                std::cerr << put_or.err().msg << std::endl;
                std::terminate();
            }
        }

        auto description_or = registry->describeStream(stream_name);
        if (!description_or.ok()) {
            std::cerr << description_or.err().msg << std::endl;
            std::terminate();
        }

        const auto &description = description_or.val();
        std::cout << description.stream_arn << " " << shardlog::stream::str(description.stream_status) << std::endl;
        for (const auto &shard : description.shards) {
            auto it_or = registry->getShardIterator(stream_name, shard.shard_id,
                                                    shardlog::stream::ShardIteratorType::TrimHorizon);
            if (!it_or.ok()) {
                std::cerr << it_or.err().msg << std::endl;
                break;
            }

            size_t total = 0U;
            auto iterator = it_or.val();
            while (true) {
                auto records_or = registry->getRecords(iterator, 1000);
                if (!records_or.ok()) {
                    std::cout << records_or.err().msg << std::endl;
                    break;
                }
                if (records_or.val().records.empty()) {
                    break;
                }
                total += records_or.val().records.size();
                iterator = records_or.val().next_shard_iterator;
            }
            std::cout << shard.shard_id << ": " << total << " records" << std::endl;
        }

        std::ignore = registry->deleteStream(stream_name);
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::cout << std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() << "ms" << std::endl;
    do_memory();
}
// NOLINTEND
