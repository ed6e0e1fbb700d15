// SPDX-License-Identifier: MIT

// tests/message_repository_test.cpp
#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "src/message_repository.hpp"
#include "src/message_sink.hpp"

using namespace stream_sync;

TEST(MessageRepositoryTest, ConsumeQueueDrainsInEmissionOrder) {
    InMemoryMessageRepository repo;
    repo.Emit(LogMessage{LogLevel::Info, "first"});
    repo.Emit(StateMessage{StreamDescriptor{"users", std::nullopt}, R"({"c":"1"})"});
    repo.Emit(LogMessage{LogLevel::Warn, "third"});

    auto drained = repo.ConsumeQueue();
    ASSERT_EQ(drained.size(), 3u);
    EXPECT_EQ(std::get<LogMessage>(drained[0]).message, "first");
    EXPECT_EQ(std::get<StateMessage>(drained[1]).stream.name, "users");
    EXPECT_EQ(std::get<LogMessage>(drained[2]).level, LogLevel::Warn);

    EXPECT_TRUE(repo.ConsumeQueue().empty());
}

TEST(MessageRepositoryTest, EmitFromManyThreads) {
    InMemoryMessageRepository repo;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&repo] {
            for (int i = 0; i < 250; ++i) repo.Emit(LogMessage{LogLevel::Info, "x"});
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(repo.ConsumeQueue().size(), 1000u);
}

TEST(MessageSinkTest, CallbackSinkStopsAfterInvalidate) {
    int calls = 0;
    CallbackMessageSink sink([&](OutputMessage&&) { ++calls; });
    sink.OnMessage(LogMessage{LogLevel::Info, "a"});
    sink.Invalidate();
    sink.OnMessage(LogMessage{LogLevel::Info, "b"});
    EXPECT_EQ(calls, 1);
}

TEST(MessageSinkTest, CollectingSinkKeepsOrder) {
    CollectingMessageSink sink;
    sink.OnMessage(ToStatusMessage("users", std::nullopt, StreamStatus::Started));
    sink.OnMessage(ToRecordMessage("users", "public", R"({"id":1})"));
    ASSERT_EQ(sink.messages().size(), 2u);

    const auto& status = std::get<StreamStatusMessage>(sink.messages()[0]);
    EXPECT_EQ(status.status, StreamStatus::Started);
    EXPECT_GT(status.emitted_at, 0);

    const auto& record = std::get<RecordMessage>(sink.messages()[1]);
    EXPECT_EQ(record.stream, (StreamDescriptor{"users", "public"}));
    EXPECT_EQ(record.data, R"({"id":1})");
}
