#pragma once

#include "mediagate/protocol/HttpRequest.h"
#include "mediagate/network/Buffer.h"

#include <chrono>
#include <cstddef>

namespace mediagate {
namespace protocol {

// Incremental HTTP/1.x request parser. One instance per client connection.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    HttpContext() : state_(kExpectRequestLine) {}

    // return false on a malformed request
    bool parseRequest(network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset() {
        state_ = kExpectRequestLine;
        HttpRequest dummy;
        request_.swap(dummy);
        chunked_ = false;
        bodyRemaining_ = 0;
        chunkSize_ = 0;
        expectingChunkSize_ = true;
        headerBytes_ = 0;
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool beginBody();
    // Returns false on error, sets *more=false when more input is needed.
    bool consumeChunked(network::Buffer* buf, bool* more);

    HttpRequestParseState state_;
    HttpRequest request_;

    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
    size_t headerBytes_{0};
};

} // namespace protocol
} // namespace mediagate
