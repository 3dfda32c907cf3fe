//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventStreamFramer.h
// Purpose: Interface for incremental Server-Sent Events (text/event-stream) framing
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace mcpgw {

//========================================================================================================
// IEventStreamFramer
// Purpose: Reassembles SSE events from arbitrary byte chunks. append() buffers input, tryDecode() yields
//          the next complete event, finish() does the same at end of stream, flushing a final event
//          whose blank-line terminator never arrived.
//========================================================================================================
class IEventStreamFramer {
public:
    virtual ~IEventStreamFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        EventTooLarge
    };
    struct Event {
        std::string data;                   // data lines joined with "\n"
        std::string event;                  // "event:" field, empty when absent
        std::string id;                     // "id:" field, empty when absent
        std::optional<unsigned int> retryMs;
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<Event> event;         // present when status==Ok
    };
    virtual std::string encode(const Event& event) = 0;
    virtual void append(const std::string& chunk) = 0;
    virtual DecodeResult tryDecode() = 0;
    virtual DecodeResult finish() = 0;
    virtual std::size_t buffered() const = 0;
};

std::unique_ptr<IEventStreamFramer> MakeEventStreamFramer(std::size_t maxEventSize = 4 * 1024 * 1024);

} // namespace mcpgw
