//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_event_stream_framer.cpp
// Purpose: Tests for EventStreamFramer (SSE reassembly)
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpgw/EventStreamFramer.h"

using mcpgw::IEventStreamFramer;

TEST(EventStreamFramerTest, ReassemblesEventSplitAcrossChunks) {
    auto framer = mcpgw::MakeEventStreamFramer();
    framer->append("data: {\"jsonrpc\":\"2.0\",");
    EXPECT_EQ(framer->tryDecode().status, IEventStreamFramer::DecodeStatus::Incomplete);
    framer->append("\"id\":1}\n");
    EXPECT_EQ(framer->tryDecode().status, IEventStreamFramer::DecodeStatus::Incomplete);
    framer->append("\n");
    auto r = framer->tryDecode();
    ASSERT_EQ(r.status, IEventStreamFramer::DecodeStatus::Ok);
    ASSERT_TRUE(r.event.has_value());
    EXPECT_EQ(r.event->data, "{\"jsonrpc\":\"2.0\",\"id\":1}");
    EXPECT_EQ(framer->buffered(), 0u);
}

TEST(EventStreamFramerTest, JoinsMultipleDataLines) {
    auto framer = mcpgw::MakeEventStreamFramer();
    framer->append("data: first\ndata:second\ndata:  third\n\n");
    auto r = framer->tryDecode();
    ASSERT_EQ(r.status, IEventStreamFramer::DecodeStatus::Ok);
    EXPECT_EQ(r.event->data, "first\nsecond\n third");
}

TEST(EventStreamFramerTest, HandlesCrLfSplitBetweenChunks) {
    auto framer = mcpgw::MakeEventStreamFramer();
    framer->append("data: x\r");
    EXPECT_EQ(framer->tryDecode().status, IEventStreamFramer::DecodeStatus::Incomplete);
    framer->append("\n\r\n");
    auto r = framer->tryDecode();
    ASSERT_EQ(r.status, IEventStreamFramer::DecodeStatus::Ok);
    EXPECT_EQ(r.event->data, "x");
    EXPECT_EQ(framer->tryDecode().status, IEventStreamFramer::DecodeStatus::Incomplete);
}

TEST(EventStreamFramerTest, ParsesEventIdAndRetryFields) {
    auto framer = mcpgw::MakeEventStreamFramer();
    framer->append("event: message\nid: 42\nretry: 1500\nunknown: y\ndata: {}\n\n");
    auto r = framer->tryDecode();
    ASSERT_EQ(r.status, IEventStreamFramer::DecodeStatus::Ok);
    EXPECT_EQ(r.event->event, "message");
    EXPECT_EQ(r.event->id, "42");
    ASSERT_TRUE(r.event->retryMs.has_value());
    EXPECT_EQ(*r.event->retryMs, 1500u);
    EXPECT_EQ(r.event->data, "{}");
}

TEST(EventStreamFramerTest, SkipsCommentsAndEventsWithoutData) {
    auto framer = mcpgw::MakeEventStreamFramer();
    framer->append(": keepalive\n\nevent: ping\n\ndata: payload\n\n");
    auto r = framer->tryDecode();
    ASSERT_EQ(r.status, IEventStreamFramer::DecodeStatus::Ok);
    EXPECT_EQ(r.event->data, "payload");
    // The data-less "ping" event must not leak its name into the next event
    EXPECT_TRUE(r.event->event.empty());
}

TEST(EventStreamFramerTest, YieldsSeveralEventsFromOneChunk) {
    auto framer = mcpgw::MakeEventStreamFramer();
    framer->append("data: a\n\ndata: b\n\n");
    auto first = framer->tryDecode();
    auto second = framer->tryDecode();
    ASSERT_EQ(first.status, IEventStreamFramer::DecodeStatus::Ok);
    ASSERT_EQ(second.status, IEventStreamFramer::DecodeStatus::Ok);
    EXPECT_EQ(first.event->data, "a");
    EXPECT_EQ(second.event->data, "b");
    EXPECT_EQ(framer->tryDecode().status, IEventStreamFramer::DecodeStatus::Incomplete);
}

TEST(EventStreamFramerTest, FinishFlushesUnterminatedEvent) {
    auto framer = mcpgw::MakeEventStreamFramer();
    framer->append("data: tail");
    EXPECT_EQ(framer->tryDecode().status, IEventStreamFramer::DecodeStatus::Incomplete);
    auto r = framer->finish();
    ASSERT_EQ(r.status, IEventStreamFramer::DecodeStatus::Ok);
    EXPECT_EQ(r.event->data, "tail");
    EXPECT_EQ(framer->finish().status, IEventStreamFramer::DecodeStatus::Incomplete);
}

TEST(EventStreamFramerTest, RejectsOversizedEvent) {
    auto framer = mcpgw::MakeEventStreamFramer(16);
    framer->append("data: " + std::string(32, 'z') + "\n");
    EXPECT_EQ(framer->tryDecode().status, IEventStreamFramer::DecodeStatus::EventTooLarge);
}

TEST(EventStreamFramerTest, RejectsOversizedUnterminatedLine) {
    auto framer = mcpgw::MakeEventStreamFramer(16);
    framer->append("data: " + std::string(32, 'z'));
    EXPECT_EQ(framer->tryDecode().status, IEventStreamFramer::DecodeStatus::EventTooLarge);
}

TEST(EventStreamFramerTest, EncodeSplitsMultilineData) {
    auto framer = mcpgw::MakeEventStreamFramer();
    IEventStreamFramer::Event ev;
    ev.event = "message";
    ev.data = "line1\nline2";
    const std::string frame = framer->encode(ev);
    EXPECT_EQ(frame, "event: message\ndata: line1\ndata: line2\n\n");

    framer->append(frame);
    auto r = framer->tryDecode();
    ASSERT_EQ(r.status, IEventStreamFramer::DecodeStatus::Ok);
    EXPECT_EQ(r.event->data, ev.data);
}
