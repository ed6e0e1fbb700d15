// SPDX-License-Identifier: MIT

// tests/catalog_test.cpp
#include <gtest/gtest.h>

#include "src/catalog.hpp"

using namespace stream_sync;

TEST(CatalogTest, ParsesStreamsInOrder) {
    auto catalog = ParseConfiguredCatalog(R"({"streams":[
        {"stream":{"name":"users","namespace":"public"},"sync_mode":"incremental"},
        {"stream":{"name":"orders"}}
    ]})");
    ASSERT_TRUE(catalog.has_value()) << catalog.error().message;
    ASSERT_EQ(catalog->streams.size(), 2u);
    EXPECT_EQ(catalog->streams[0].name, "users");
    EXPECT_EQ(catalog->streams[0].stream_namespace, "public");
    EXPECT_EQ(catalog->streams[1].name, "orders");
    EXPECT_FALSE(catalog->streams[1].stream_namespace.has_value());
}

TEST(CatalogTest, RejectsMissingStreamsArray) {
    auto catalog = ParseConfiguredCatalog(R"({"streams": {}})");
    ASSERT_FALSE(catalog.has_value());
    EXPECT_EQ(catalog.error().code, ErrorCode::InvalidConfig);
}

TEST(CatalogTest, RejectsNamelessStream) {
    EXPECT_FALSE(ParseConfiguredCatalog(R"({"streams":[{"stream":{}}]})").has_value());
}

TEST(CatalogTest, RejectsMalformedJson) {
    auto catalog = ParseConfiguredCatalog("{");
    ASSERT_FALSE(catalog.has_value());
    EXPECT_EQ(catalog.error().code, ErrorCode::ParseError);
}

TEST(StreamStateTest, BlankInputIsEmpty) {
    auto state = ParseStreamState("  \n");
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->empty());
}

TEST(StreamStateTest, PerStreamList) {
    auto state = ParseStreamState(R"([
        {"type":"STREAM","stream":{"stream_descriptor":{"name":"users"},
                                   "stream_state":{"updated_at":"2024-01-01"}}},
        {"type":"STREAM","stream":{"stream_descriptor":{"name":"orders"},"stream_state":null}},
        {"type":"GLOBAL","global":{}}
    ])");
    ASSERT_TRUE(state.has_value()) << state.error().message;
    ASSERT_EQ(state->size(), 1u);
    EXPECT_EQ(state->at("users"), R"({"updated_at":"2024-01-01"})");
}

TEST(StreamStateTest, LegacyObject) {
    auto state = ParseStreamState(R"({"users":{"updated_at":"5"},"orders":{}})");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->at("users"), R"({"updated_at":"5"})");
    EXPECT_EQ(state->at("orders"), "{}");
}

TEST(StreamStateTest, RejectsEntryWithoutDescriptor) {
    auto state = ParseStreamState(R"([{"type":"STREAM","stream":{"stream_state":{}}}])");
    ASSERT_FALSE(state.has_value());
    EXPECT_EQ(state.error().code, ErrorCode::InvalidConfig);
}

TEST(StreamStateTest, RejectsScalarDocument) {
    EXPECT_FALSE(ParseStreamState("42").has_value());
}
