#pragma once

#include "mediagate/protocol/HeaderMap.h"

#include <cstddef>
#include <string>

namespace mediagate {
namespace protocol {

// Incremental HTTP/1.x response parser for origin connections.
// - Supports Content-Length and Transfer-Encoding: chunked.
// - Without either, the body runs until close (connection is not poolable).
// - The decoded body is collected in memory, up to the body limit if one is set.
class HttpResponseContext {
public:
    enum ParseState { kExpectHead, kExpectBody, kGotAll, kError };

    static constexpr size_t kMaxHeadBytes = 64 * 1024;

    // Reply to a HEAD request: headers only, whatever Content-Length says.
    void setExpectNoBody(bool on) { expectNoBody_ = on; }

    // Stop after this many body bytes (0: no limit). A response cut short is
    // reported as complete but is never keep-alive.
    void setBodyLimit(size_t limit) { bodyLimit_ = limit; }

    // Returns true once the response is complete.
    bool feed(const char* data, size_t len);

    // Peer closed. Completes a close-delimited body; returns gotAll().
    bool finishOnClose();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    // Any byte of this response has been seen.
    bool started() const { return bytesSeen_ > 0; }
    // Status line and headers are parsed.
    bool headComplete() const { return state_ == kExpectBody || state_ == kGotAll; }
    bool bodyTruncated() const { return bodyTruncated_; }

    void reset();

    bool keepAlive() const { return keepAlive_; }
    bool needsCloseToFinish() const { return needsCloseToFinish_; }
    int statusCode() const { return statusCode_; }

    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(field);
        return it == headers_.end() ? std::string() : it->second;
    }
    bool hasHeader(const std::string& field) const { return headers_.count(field) != 0; }
    const HeaderMap& headers() const { return headers_; }

    const std::string& body() const { return body_; }
    std::string takeBody() { return std::move(body_); }

private:
    enum ChunkState { kChunkSize, kChunkData, kChunkCrlf, kChunkTrailer };

    bool parseHead(const std::string& head);
    void consumeBody(const char* data, size_t len);
    void consumeChunked(const char* data, size_t len);
    void applyBodyLimit();

    ParseState state_{kExpectHead};
    bool expectNoBody_{false};
    size_t bodyLimit_{0};
    bool bodyTruncated_{false};
    size_t bytesSeen_{0};
    std::string headBuf_;

    int httpMajor_{1};
    int httpMinor_{1};
    int statusCode_{0};
    HeaderMap headers_;

    bool chunked_{false};
    size_t bodyRemaining_{0};
    bool keepAlive_{false};
    bool needsCloseToFinish_{false};
    std::string body_;

    ChunkState chunkState_{kChunkSize};
    size_t chunkRemaining_{0};
    std::string pending_;
};

} // namespace protocol
} // namespace mediagate
