//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FramingDecoder.cpp
// Purpose: Header/line framing decoder shared by every Session
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <system_error>

#include "logging/Logger.h"
#include "wsmcp/FramingDecoder.h"

namespace wsmcp {

namespace {
constexpr std::size_t kBodyPreviewChars = 50;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isBlank(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\r';
}

// Reads the body length from a header block. Field names compare case-insensitively,
// whitespace after the colon is optional and the value is the leading digit run.
std::optional<std::size_t> parseContentLength(const std::string& headers) {
    std::size_t pos = 0;
    while (pos <= headers.size()) {
        std::size_t eol = headers.find('\n', pos);
        if (eol == std::string::npos) {
            eol = headers.size();
        }
        std::string line = headers.substr(pos, eol - pos);
        pos = eol + 1;

        auto colon = line.find(':');
        if (colon == std::string::npos || toLower(line.substr(0, colon)) != "content-length") {
            continue;
        }
        std::size_t b = colon + 1;
        while (b < line.size() && isBlank(line[b])) ++b;
        std::size_t e = b;
        while (e < line.size() && std::isdigit(static_cast<unsigned char>(line[e]))) ++e;
        // Anything after the digit run is ignored
        if (e == b) {
            continue;
        }
        std::size_t value = 0;
        auto [ptr, ec] = std::from_chars(line.data() + b, line.data() + e, value);
        if (ec == std::errc() && ptr == line.data() + e) {
            return value;
        }
    }
    return std::nullopt;
}

// Earliest blank-line terminator; sets sepLen to the terminator size.
std::size_t findHeaderEnd(const std::string& buffer, std::size_t& sepLen) {
    std::size_t crlf = buffer.find("\r\n\r\n");
    std::size_t lf = buffer.find("\n\n");
    if (crlf == std::string::npos && lf == std::string::npos) {
        return std::string::npos;
    }
    if (lf == std::string::npos || (crlf != std::string::npos && crlf < lf)) {
        sepLen = 4;
        return crlf;
    }
    sepLen = 2;
    return lf;
}

class FramingDecoder : public IFramingDecoder {
public:
    explicit FramingDecoder(const FramingOptions& opts) : options(opts) {}

    DecodeResult Next(std::string& buffer) override {
        while (true) {
            if (auto* body = std::get_if<BodyAccumulation>(&state)) {
                return takeBody(buffer, body->expectedLength);
            }
            if (buffer.rfind(CONTENT_LENGTH_TOKEN, 0) != 0) {
                return takeLine(buffer);
            }

            std::size_t sepLen = 0;
            std::size_t headerEnd = findHeaderEnd(buffer, sepLen);
            if (headerEnd == std::string::npos) {
                return { DecodeStatus::Incomplete, std::nullopt, FramingMode::Header, 0 };
            }
            const std::size_t headerBytes = headerEnd + sepLen;
            const std::string headers = buffer.substr(0, headerEnd);
            auto length = parseContentLength(headers);
            if (!length.has_value()) {
                LOG_WARN("Header block missing a parsable Content-Length: {}", PreviewPayload(headers, kBodyPreviewChars));
                if (options.invalidHeaderPolicy == InvalidHeaderPolicy::SkipHeader) {
                    buffer.erase(0, headerBytes);
                    return { DecodeStatus::InvalidHeader, std::nullopt, FramingMode::Header, headerBytes };
                }
                return { DecodeStatus::InvalidHeader, std::nullopt, FramingMode::Header, 0 };
            }
            if (options.maxContentLength > 0 && length.value() > options.maxContentLength) {
                LOG_WARN("Content-Length {} exceeds limits (max={})", length.value(), options.maxContentLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, FramingMode::Header, 0 };
            }
            buffer.erase(0, headerBytes);
            state = BodyAccumulation{length.value()};
            LOG_DEBUG("Header framing detected, Content-Length: {}", length.value());
        }
    }

    DecodeStatus Drain(std::string& buffer, const MessageSink& sink) override {
        while (true) {
            DecodeResult r = Next(buffer);
            switch (r.status) {
                case DecodeStatus::Message:
                    if (sink) {
                        sink(std::move(r.message.value()), r.mode);
                    }
                    break;
                case DecodeStatus::DroppedInvalidJson:
                    break;
                case DecodeStatus::InvalidHeader:
                    if (options.invalidHeaderPolicy == InvalidHeaderPolicy::CloseSession) {
                        return r.status;
                    }
                    break;
                case DecodeStatus::Incomplete:
                case DecodeStatus::Overflow:
                case DecodeStatus::BodyTooLarge:
                    return r.status;
            }
        }
    }

    const FramingState& State() const override { return state; }

private:
    DecodeResult takeBody(std::string& buffer, std::size_t expected) {
        if (buffer.size() < expected) {
            return { DecodeStatus::Incomplete, std::nullopt, FramingMode::Header, 0 };
        }
        std::string body = buffer.substr(0, expected);
        buffer.erase(0, expected);
        state = HeaderSearch{};
        LOG_DEBUG("Header-framed body decoded: {}", PreviewPayload(body, kBodyPreviewChars));
        auto parsed = TryParseJSON(body);
        if (!parsed.has_value()) {
            // Invalid bodies are dropped without a response; the connection stays open
            LOG_WARN("Dropping header-framed body that is not valid JSON: {}", PreviewPayload(body, kBodyPreviewChars));
            return { DecodeStatus::DroppedInvalidJson, std::nullopt, FramingMode::Header, expected };
        }
        return { DecodeStatus::Message, std::move(parsed), FramingMode::Header, expected };
    }

    DecodeResult takeLine(std::string& buffer) {
        std::size_t nl = buffer.find('\n');
        if (nl == std::string::npos) {
            if (buffer.size() > options.lineOverflowBytes) {
                // Data loss is accepted here: an unterminated run this long is not a message
                LOG_WARN("Line buffer overflow ({} bytes without newline), clearing", buffer.size());
                const std::size_t dropped = buffer.size();
                buffer.clear();
                return { DecodeStatus::Overflow, std::nullopt, FramingMode::Line, dropped };
            }
            return { DecodeStatus::Incomplete, std::nullopt, FramingMode::Line, 0 };
        }
        std::string line = buffer.substr(0, nl + 1);
        buffer.erase(0, nl + 1);
        LOG_DEBUG("Line framing detected: {}", PreviewPayload(line, kBodyPreviewChars));
        auto parsed = TryParseJSON(line);
        if (!parsed.has_value()) {
            // Blank lines and garbage are dropped without a response
            LOG_DEBUG("Dropping line that is not valid JSON: {}", PreviewPayload(line, kBodyPreviewChars));
            return { DecodeStatus::DroppedInvalidJson, std::nullopt, FramingMode::Line, line.size() };
        }
        return { DecodeStatus::Message, std::move(parsed), FramingMode::Line, line.size() };
    }

    FramingOptions options;
    FramingState state{HeaderSearch{}};
};
} // namespace

std::unique_ptr<IFramingDecoder> MakeFramingDecoder(const FramingOptions& options) {
    return std::make_unique<FramingDecoder>(options);
}

std::string EncodeFrame(const std::string& payload, FramingMode mode) {
    if (mode == FramingMode::Line) {
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }
    std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
    std::string frame; frame.reserve(header.size() + payload.size());
    frame.append(header);
    frame.append(payload);
    return frame;
}

const char* ToString(IFramingDecoder::DecodeStatus status) {
    switch (status) {
        case IFramingDecoder::DecodeStatus::Message: return "Message";
        case IFramingDecoder::DecodeStatus::Incomplete: return "Incomplete";
        case IFramingDecoder::DecodeStatus::DroppedInvalidJson: return "DroppedInvalidJson";
        case IFramingDecoder::DecodeStatus::Overflow: return "Overflow";
        case IFramingDecoder::DecodeStatus::InvalidHeader: return "InvalidHeader";
        case IFramingDecoder::DecodeStatus::BodyTooLarge: return "BodyTooLarge";
    }
    return "Unknown";
}

} // namespace wsmcp
