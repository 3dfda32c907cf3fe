//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventStreamFramer.cpp
// Purpose: Line-oriented SSE decoder used to reassemble streamed JSON-RPC replies
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpgw/EventStreamFramer.h"

namespace mcpgw {

namespace {
class EventStreamFramer : public IEventStreamFramer {
public:
    explicit EventStreamFramer(std::size_t maxSize) : maxEventSize(maxSize) {}

    std::string encode(const Event& ev) override {
        std::string frame;
        if (!ev.event.empty()) frame += "event: " + ev.event + "\n";
        if (!ev.id.empty()) frame += "id: " + ev.id + "\n";
        if (ev.retryMs.has_value()) frame += "retry: " + std::to_string(*ev.retryMs) + "\n";
        std::size_t pos = 0;
        while (true) {
            std::size_t nl = ev.data.find('\n', pos);
            frame += "data: " + ev.data.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos) + "\n";
            if (nl == std::string::npos) break;
            pos = nl + 1;
        }
        frame += "\n";
        return frame;
    }

    void append(const std::string& chunk) override {
        buffer.append(chunk);
    }

    DecodeResult tryDecode() override {
        while (true) {
            std::optional<std::string> line = nextLine();
            if (!line.has_value()) {
                if (buffer.size() > maxEventSize) {
                    LOG_WARN("SSE line exceeds limit (buffered={}, max={})", buffer.size(), maxEventSize);
                    return { DecodeStatus::EventTooLarge, std::nullopt };
                }
                if (ended) {
                    return dispatch();
                }
                return { DecodeStatus::Incomplete, std::nullopt };
            }
            if (line->empty()) {
                DecodeResult r = dispatch();
                if (r.status == DecodeStatus::Ok) return r;
                continue;
            }
            processField(*line);
            if (dataBuf.size() > maxEventSize) {
                LOG_WARN("SSE event exceeds limit (size={}, max={})", dataBuf.size(), maxEventSize);
                resetPending();
                return { DecodeStatus::EventTooLarge, std::nullopt };
            }
        }
    }

    DecodeResult finish() override {
        ended = true;
        return tryDecode();
    }

    std::size_t buffered() const override {
        return buffer.size() + dataBuf.size();
    }

private:
    // Extracts the next line (terminator removed). A trailing lone '\r' may be the first half of CRLF,
    // so it only terminates a line once the stream has ended.
    std::optional<std::string> nextLine() {
        std::size_t eol = buffer.find_first_of("\r\n");
        if (eol == std::string::npos) {
            if (ended && !buffer.empty()) {
                std::string last = std::move(buffer);
                buffer.clear();
                return last;
            }
            return std::nullopt;
        }
        std::size_t termLen = 1;
        if (buffer[eol] == '\r') {
            if (eol + 1 == buffer.size() && !ended) {
                return std::nullopt;
            }
            if (eol + 1 < buffer.size() && buffer[eol + 1] == '\n') termLen = 2;
        }
        std::string line = buffer.substr(0, eol);
        buffer.erase(0, eol + termLen);
        return line;
    }

    void processField(const std::string& line) {
        if (line[0] == ':') {
            return; // comment / keepalive
        }
        std::string field;
        std::string value;
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            field = line;
        } else {
            field = line.substr(0, colon);
            value = line.substr(colon + 1);
            if (!value.empty() && value[0] == ' ') value.erase(0, 1);
        }
        if (field == "data") {
            dataBuf.append(value);
            dataBuf.push_back('\n');
            haveData = true;
        } else if (field == "event") {
            pending.event = value;
        } else if (field == "id") {
            if (value.find('\0') == std::string::npos) pending.id = value;
        } else if (field == "retry") {
            if (!value.empty() && value.size() <= 9 &&
                std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
                pending.retryMs = static_cast<unsigned int>(std::stoul(value));
            }
        } else {
            LOG_DEBUG("Ignoring SSE field '{}'", field);
        }
    }

    DecodeResult dispatch() {
        if (!haveData) {
            resetPending();
            return { DecodeStatus::Incomplete, std::nullopt };
        }
        Event ev = std::move(pending);
        if (!dataBuf.empty() && dataBuf.back() == '\n') dataBuf.pop_back();
        ev.data = std::move(dataBuf);
        resetPending();
        return { DecodeStatus::Ok, std::make_optional(std::move(ev)) };
    }

    void resetPending() {
        pending = Event{};
        dataBuf.clear();
        haveData = false;
    }

    std::size_t maxEventSize;
    std::string buffer;
    std::string dataBuf;
    Event pending;
    bool haveData{false};
    bool ended{false};
};
} // namespace

std::unique_ptr<IEventStreamFramer> MakeEventStreamFramer(std::size_t maxEventSize) {
    return std::make_unique<EventStreamFramer>(maxEventSize);
}

} // namespace mcpgw
