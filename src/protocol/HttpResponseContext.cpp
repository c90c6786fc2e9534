#include "mediagate/protocol/HttpResponseContext.h"
#include "mediagate/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace mediagate {
namespace protocol {

namespace {

bool ParseDecimal(const std::string& s, long long* out) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    errno = 0;
    const long long v = std::strtoll(s.c_str(), nullptr, 10);
    if (errno != 0) return false;
    *out = v;
    return true;
}

std::string TrimWs(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

void HttpResponseContext::reset() {
    state_ = kExpectHead;
    expectNoBody_ = false;
    bodyLimit_ = 0;
    bodyTruncated_ = false;
    bytesSeen_ = 0;
    headBuf_.clear();
    httpMajor_ = 1;
    httpMinor_ = 1;
    statusCode_ = 0;
    headers_.clear();
    chunked_ = false;
    bodyRemaining_ = 0;
    keepAlive_ = false;
    needsCloseToFinish_ = false;
    body_.clear();
    chunkState_ = kChunkSize;
    chunkRemaining_ = 0;
    pending_.clear();
}

bool HttpResponseContext::parseHead(const std::string& head) {
    size_t lineEnd = head.find("\r\n");
    const std::string statusLine = head.substr(0, lineEnd);

    // HTTP/1.1 206 Partial Content
    if (statusLine.compare(0, 5, "HTTP/") != 0 || statusLine.size() < 12) return false;
    const size_t sp1 = statusLine.find(' ');
    if (sp1 == std::string::npos) return false;
    const std::string ver = statusLine.substr(5, sp1 - 5);
    const size_t dot = ver.find('.');
    long long major = 0;
    long long minor = 0;
    if (dot == std::string::npos || !ParseDecimal(ver.substr(0, dot), &major) ||
        !ParseDecimal(ver.substr(dot + 1), &minor)) {
        return false;
    }
    httpMajor_ = static_cast<int>(major);
    httpMinor_ = static_cast<int>(minor);

    size_t sp2 = statusLine.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) sp2 = statusLine.size();
    long long code = 0;
    if (!ParseDecimal(statusLine.substr(sp1 + 1, sp2 - sp1 - 1), &code) || code < 100 || code > 999) {
        return false;
    }
    statusCode_ = static_cast<int>(code);

    size_t pos = lineEnd + 2;
    while (pos < head.size()) {
        const size_t next = head.find("\r\n", pos);
        if (next == std::string::npos || next == pos) break;
        const std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        headers_[TrimWs(line.substr(0, colon))] = TrimWs(line.substr(colon + 1));
    }

    const std::string conn = getHeader("Connection");
    if (httpMajor_ == 1 && httpMinor_ == 0) {
        keepAlive_ = HeaderHasToken(conn, "keep-alive");
    } else {
        keepAlive_ = !HeaderHasToken(conn, "close");
    }

    const bool bodyless = expectNoBody_ || statusCode_ < 200 || statusCode_ == 204 || statusCode_ == 304;
    if (bodyless) {
        state_ = kGotAll;
        return true;
    }

    chunked_ = HeaderHasToken(getHeader("Transfer-Encoding"), "chunked");
    if (chunked_) {
        chunkState_ = kChunkSize;
        state_ = kExpectBody;
        return true;
    }

    if (hasHeader("Content-Length")) {
        long long n = 0;
        if (!ParseDecimal(getHeader("Content-Length"), &n)) return false;
        bodyRemaining_ = static_cast<size_t>(n);
        state_ = bodyRemaining_ == 0 ? kGotAll : kExpectBody;
        return true;
    }

    needsCloseToFinish_ = true;
    keepAlive_ = false;
    state_ = kExpectBody;
    return true;
}

void HttpResponseContext::consumeChunked(const char* data, size_t len) {
    pending_.append(data, len);
    size_t pos = 0;
    while (state_ == kExpectBody) {
        if (chunkState_ == kChunkData) {
            const size_t take = std::min(chunkRemaining_, pending_.size() - pos);
            if (take == 0) break;
            body_.append(pending_, pos, take);
            pos += take;
            chunkRemaining_ -= take;
            if (chunkRemaining_ == 0) chunkState_ = kChunkCrlf;
            continue;
        }
        if (chunkState_ == kChunkCrlf) {
            if (pending_.size() - pos < 2) break;
            if (pending_[pos] != '\r' || pending_[pos + 1] != '\n') {
                state_ = kError;
                break;
            }
            pos += 2;
            chunkState_ = kChunkSize;
            continue;
        }

        const size_t crlf = pending_.find("\r\n", pos);
        if (crlf == std::string::npos) {
            if (pending_.size() - pos > 4096) state_ = kError;
            break;
        }
        std::string line = pending_.substr(pos, crlf - pos);
        pos = crlf + 2;

        if (chunkState_ == kChunkTrailer) {
            if (line.empty()) state_ = kGotAll;
            continue;
        }

        const size_t semi = line.find(';');
        if (semi != std::string::npos) line.resize(semi);
        line = TrimWs(line);
        char* endp = nullptr;
        const unsigned long long n = line.empty() ? 0 : std::strtoull(line.c_str(), &endp, 16);
        if (line.empty() || endp == line.c_str() || *endp != '\0') {
            state_ = kError;
            break;
        }
        chunkRemaining_ = static_cast<size_t>(n);
        chunkState_ = chunkRemaining_ == 0 ? kChunkTrailer : kChunkData;
    }
    pending_.erase(0, pos);
}

void HttpResponseContext::consumeBody(const char* data, size_t len) {
    if (chunked_) {
        consumeChunked(data, len);
    } else if (needsCloseToFinish_) {
        body_.append(data, len);
    } else {
        const size_t take = std::min(bodyRemaining_, len);
        body_.append(data, take);
        bodyRemaining_ -= take;
        if (bodyRemaining_ == 0) state_ = kGotAll;
    }
    applyBodyLimit();
}

void HttpResponseContext::applyBodyLimit() {
    if (bodyLimit_ == 0 || state_ != kExpectBody || body_.size() < bodyLimit_) return;
    // The rest of the body is still on the wire, so the connection is spent.
    body_.resize(bodyLimit_);
    bodyTruncated_ = true;
    keepAlive_ = false;
    pending_.clear();
    state_ = kGotAll;
}

bool HttpResponseContext::feed(const char* data, size_t len) {
    if (state_ == kError || state_ == kGotAll) return state_ == kGotAll;
    if (data == nullptr || len == 0) return false;
    bytesSeen_ += len;

    if (state_ == kExpectHead) {
        headBuf_.append(data, len);
        const size_t hdrPos = headBuf_.find("\r\n\r\n");
        if (hdrPos == std::string::npos) {
            if (headBuf_.size() > kMaxHeadBytes) {
                LOG_WARN << "Origin response head exceeds " << kMaxHeadBytes << " bytes";
                state_ = kError;
            }
            return false;
        }
        const std::string rest = headBuf_.substr(hdrPos + 4);
        headBuf_.resize(hdrPos + 4);
        if (!parseHead(headBuf_)) {
            LOG_WARN << "Malformed origin response head";
            state_ = kError;
            return false;
        }
        headBuf_.clear();
        // Bytes past a complete response are not ours.
        if (state_ == kExpectBody && !rest.empty()) consumeBody(rest.data(), rest.size());
        return state_ == kGotAll;
    }

    consumeBody(data, len);
    return state_ == kGotAll;
}

bool HttpResponseContext::finishOnClose() {
    if (state_ == kExpectBody && needsCloseToFinish_) state_ = kGotAll;
    return state_ == kGotAll;
}

} // namespace protocol
} // namespace mediagate
