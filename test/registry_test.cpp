#include "test_utils.hpp"
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <set>
#include <shardlog/stream/streamRegistry.hpp>
#include <string>
#include <vector>

using namespace shardlog::stream;
using namespace shardlog::test::utils;

SCENARIO("I can create and describe a stream", "[registry]") {
    RegistryOptions opts{};
    opts.region = "us-west-2";
    auto registry = open_registry(std::move(opts));

    GIVEN("A stream with 2 shards") {
        REQUIRE(registry->createStream("my_stream", 2).ok());

        THEN("Describing it returns its metadata") {
            auto description_or = registry->describeStream("my_stream");
            REQUIRE(description_or.ok());
            const auto &description = description_or.val();
            REQUIRE(description.stream_name == "my_stream");
            REQUIRE(description.stream_arn == "arn:aws:kinesis:us-west-2:123456789012:my_stream");
            REQUIRE(description.stream_status == StreamStatus::Active);
            REQUIRE(str(description.stream_status) == "ACTIVE");
            REQUIRE_FALSE(description.has_more_shards);
            REQUIRE(description.stream_creation_timestamp > 0);
            REQUIRE(description.shards.size() == 2);
            REQUIRE(description.shards[0].shard_id == "shardId-000000000000");
            REQUIRE(description.shards[1].shard_id == "shardId-000000000001");
            REQUIRE(description.shards[0].starting_sequence_number == "1");
            REQUIRE(description.shards[0].ending_sequence_number.empty());
        }

        WHEN("I create another stream with the same name") {
            auto err = registry->createStream("my_stream", 1);

            THEN("It is rejected and the original stream is kept") {
                REQUIRE(err.code == StreamErrorCode::ResourceInUse);
                REQUIRE(shard_ids(registry, "my_stream").size() == 2);
            }
        }
    }
}

SCENARIO("Described shards are unique and cover the hash key space", "[registry]") {
    auto registry = open_registry();
    const int shard_count = GENERATE(1, 2, 3, 7, 16);

    REQUIRE(registry->createStream("stream", shard_count).ok());
    auto description_or = registry->describeStream("stream");
    REQUIRE(description_or.ok());
    const auto &shards = description_or.val().shards;

    REQUIRE(shards.size() == static_cast<size_t>(shard_count));
    std::set<std::string> ids;
    for (const auto &shard : shards) {
        ids.insert(shard.shard_id);
    }
    REQUIRE(ids.size() == static_cast<size_t>(shard_count));

    REQUIRE(shards.front().hash_key_range.starting_hash_key == 0U);
    REQUIRE(shards.back().hash_key_range.ending_hash_key == HASH_KEY_SPACE - 1U);
    for (size_t i = 1U; i < shards.size(); i++) {
        REQUIRE(shards[i].hash_key_range.starting_hash_key == shards[i - 1U].hash_key_range.ending_hash_key + 1U);
    }
}

SCENARIO("I cannot describe a stream that does not exist", "[registry]") {
    auto registry = open_registry();

    auto description_or = registry->describeStream("not-a-stream");
    REQUIRE(!description_or.ok());
    REQUIRE(description_or.err().code == StreamErrorCode::ResourceNotFound);
}

SCENARIO("Stream creation validates its arguments", "[registry]") {
    RegistryOptions opts{};
    opts.max_shards_per_stream = 10U;
    auto registry = open_registry(std::move(opts));

    REQUIRE(registry->createStream("", 1).code == StreamErrorCode::InvalidArgument);
    REQUIRE(registry->createStream("has space", 1).code == StreamErrorCode::InvalidArgument);
    REQUIRE(registry->createStream(std::string(129, 'a'), 1).code == StreamErrorCode::InvalidArgument);
    REQUIRE(registry->createStream("zero", 0).code == StreamErrorCode::InvalidArgument);
    REQUIRE(registry->createStream("negative", -3).code == StreamErrorCode::InvalidArgument);
    REQUIRE(registry->createStream("too-many", 11).code == StreamErrorCode::LimitExceeded);

    REQUIRE(registry->createStream(std::string(128, 'a'), 1).ok());
    REQUIRE(registry->createStream("a-Z_0.9", 10).ok());

    auto list_or = registry->listStreams();
    REQUIRE(list_or.ok());
    REQUIRE(list_or.val().stream_names.size() == 2);
}

SCENARIO("The registry rejects unusable options", "[registry]") {
    RegistryOptions opts{};
    opts.region = "";
    auto registry_or = StreamRegistry::create(std::move(opts));
    REQUIRE(!registry_or.ok());
    REQUIRE(registry_or.err().code == StreamErrorCode::InvalidArgument);

    RegistryOptions no_shards{};
    no_shards.max_shards_per_stream = 0U;
    registry_or = StreamRegistry::create(std::move(no_shards));
    REQUIRE(!registry_or.ok());
}

SCENARIO("I can list and delete streams", "[registry]") {
    auto registry = open_registry();
    REQUIRE(registry->createStream("stream1", 1).ok());
    REQUIRE(registry->createStream("stream2", 1).ok());

    auto list_or = registry->listStreams();
    REQUIRE(list_or.ok());
    REQUIRE(list_or.val().stream_names == std::vector<std::string>{"stream1", "stream2"});
    REQUIRE_FALSE(list_or.val().has_more_streams);

    WHEN("I delete a stream") {
        REQUIRE(registry->deleteStream("stream2").ok());

        THEN("It is no longer listed") {
            list_or = registry->listStreams();
            REQUIRE(list_or.ok());
            REQUIRE(list_or.val().stream_names == std::vector<std::string>{"stream1"});

            auto description_or = registry->describeStream("stream2");
            REQUIRE(description_or.err().code == StreamErrorCode::ResourceNotFound);
        }

        THEN("The name can be used again") {
            REQUIRE(registry->createStream("stream2", 3).ok());
            REQUIRE(shard_ids(registry, "stream2").size() == 3);
        }
    }

    WHEN("I delete a stream that does not exist") {
        auto err = registry->deleteStream("not-a-stream");

        THEN("It fails and nothing is removed") {
            REQUIRE(err.code == StreamErrorCode::ResourceNotFound);
            list_or = registry->listStreams();
            REQUIRE(list_or.val().stream_names.size() == 2);
        }
    }
}

SCENARIO("I can page through the stream list", "[registry]") {
    auto registry = open_registry();
    for (const auto &name : {"a", "b", "c", "d", "e"}) {
        REQUIRE(registry->createStream(name, 1).ok());
    }

    ListStreamsOptions opts{};
    opts.limit = 2;
    auto page_or = registry->listStreams(opts);
    REQUIRE(page_or.ok());
    REQUIRE(page_or.val().stream_names == std::vector<std::string>{"a", "b"});
    REQUIRE(page_or.val().has_more_streams);

    opts.exclusive_start_stream_name = "b";
    page_or = registry->listStreams(opts);
    REQUIRE(page_or.ok());
    REQUIRE(page_or.val().stream_names == std::vector<std::string>{"c", "d"});
    REQUIRE(page_or.val().has_more_streams);

    opts.exclusive_start_stream_name = "d";
    page_or = registry->listStreams(opts);
    REQUIRE(page_or.ok());
    REQUIRE(page_or.val().stream_names == std::vector<std::string>{"e"});
    REQUIRE_FALSE(page_or.val().has_more_streams);

    opts.exclusive_start_stream_name = "unknown";
    page_or = registry->listStreams(opts);
    REQUIRE(page_or.err().code == StreamErrorCode::InvalidArgument);

    opts.exclusive_start_stream_name = "";
    opts.limit = 0;
    page_or = registry->listStreams(opts);
    REQUIRE(page_or.err().code == StreamErrorCode::InvalidArgument);
}

SCENARIO("Registries do not share streams", "[registry]") {
    auto first = open_registry();
    auto second = open_registry();

    REQUIRE(first->createStream("shared-name", 1).ok());
    REQUIRE(second->createStream("shared-name", 2).ok());

    REQUIRE(shard_ids(first, "shared-name").size() == 1);
    REQUIRE(shard_ids(second, "shared-name").size() == 2);
}
