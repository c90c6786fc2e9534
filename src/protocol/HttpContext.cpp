#include "mediagate/protocol/HttpContext.h"
#include "mediagate/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mediagate {
namespace protocol {

namespace {

std::string TrimChunkLine(std::string line) {
    const size_t semi = line.find(';');
    if (semi != std::string::npos) line.resize(semi);
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
    size_t i = 0;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    return line.substr(i);
}

} // namespace

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space == end || !request_.setMethod(start, space)) return false;

    start = space + 1;
    space = std::find(start, end, ' ');
    if (space == end || space == start) return false;

    const char* question = std::find(start, space, '?');
    request_.setPath(start, question);
    if (question != space) request_.setQuery(question, space);

    start = space + 1;
    if (end - start != 8 || !std::equal(start, end - 1, "HTTP/1.")) return false;
    switch (*(end - 1)) {
        case '1': request_.setVersion(HttpRequest::kHttp11); return true;
        case '0': request_.setVersion(HttpRequest::kHttp10); return true;
        default: return false;
    }
}

bool HttpContext::beginBody() {
    chunked_ = HeaderHasToken(request_.getHeader("Transfer-Encoding"), "chunked");
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
    if (!chunked_) {
        const std::string cl = request_.getHeader("Content-Length");
        if (!cl.empty()) {
            char* endp = nullptr;
            const long long v = std::strtoll(cl.c_str(), &endp, 10);
            if (endp == cl.c_str() || *endp != '\0' || v < 0) {
                LOG_DEBUG << "Bad request Content-Length: " << cl;
                return false;
            }
            bodyRemaining_ = static_cast<size_t>(v);
        }
    }
    state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::consumeChunked(network::Buffer* buf, bool* more) {
    while (state_ == kExpectBody) {
        if (expectingChunkSize_) {
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) {
                *more = false;
                return true;
            }
            const std::string line = TrimChunkLine(std::string(buf->Peek(), crlf));
            buf->RetrieveUntil(crlf + 2);
            if (line.empty()) return false;
            char* endp = nullptr;
            const unsigned long long sz = std::strtoull(line.c_str(), &endp, 16);
            if (endp == line.c_str()) return false;
            chunkSize_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;
            continue;
        }
        if (chunkSize_ == 0) {
            // Last chunk seen, skip trailers up to the empty line.
            const char* t = buf->FindCRLF();
            if (t == nullptr) {
                *more = false;
                return true;
            }
            const bool empty = t == buf->Peek();
            buf->RetrieveUntil(t + 2);
            if (empty) state_ = kGotAll;
            continue;
        }
        if (buf->ReadableBytes() < chunkSize_ + 2) {
            *more = false;
            return true;
        }
        request_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_);
        const char* p = buf->Peek();
        if (p[0] != '\r' || p[1] != '\n') return false;
        buf->Retrieve(2);
        expectingChunkSize_ = true;
    }
    return true;
}

bool HttpContext::parseRequest(network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    bool hasMore = true;
    while (hasMore && state_ != kGotAll) {
        if (state_ == kExpectRequestLine || state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) {
                if (headerBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) {
                    LOG_WARN << "Request head exceeds " << kMaxHeaderBytes << " bytes";
                    return false;
                }
                break;
            }
            headerBytes_ += static_cast<size_t>(crlf + 2 - buf->Peek());
            if (headerBytes_ > kMaxHeaderBytes) return false;

            if (state_ == kExpectRequestLine) {
                if (!processRequestLine(buf->Peek(), crlf)) return false;
                buf->RetrieveUntil(crlf + 2);
                state_ = kExpectHeaders;
                continue;
            }

            const char* colon = std::find(buf->Peek(), static_cast<const char*>(crlf), ':');
            if (colon != crlf) {
                request_.addHeader(buf->Peek(), colon, crlf);
                buf->RetrieveUntil(crlf + 2);
            } else if (crlf == buf->Peek()) {
                buf->RetrieveUntil(crlf + 2);
                if (!beginBody()) return false;
            } else {
                return false;
            }
        } else if (chunked_) {
            if (!consumeChunked(buf, &hasMore)) return false;
        } else {
            const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
            request_.appendBody(buf->Peek(), n);
            buf->Retrieve(n);
            bodyRemaining_ -= n;
            if (bodyRemaining_ == 0) {
                state_ = kGotAll;
            } else {
                hasMore = false;
            }
        }
    }
    return true;
}

} // namespace protocol
} // namespace mediagate
