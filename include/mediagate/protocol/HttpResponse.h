#pragma once

#include "mediagate/protocol/HeaderMap.h"
#include "mediagate/network/Buffer.h"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

namespace mediagate {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k204NoContent = 204,
        k206PartialContent = 206,
        k400BadRequest = 400,
        k403Forbidden = 403,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k416RangeNotSatisfiable = 416,
        k500InternalServerError = 500,
    };

    static const char* ReasonPhrase(HttpStatusCode code) {
        switch (code) {
            case k200Ok: return "OK";
            case k204NoContent: return "No Content";
            case k206PartialContent: return "Partial Content";
            case k400BadRequest: return "Bad Request";
            case k403Forbidden: return "Forbidden";
            case k404NotFound: return "Not Found";
            case k405MethodNotAllowed: return "Method Not Allowed";
            case k416RangeNotSatisfiable: return "Range Not Satisfiable";
            case k500InternalServerError: return "Internal Server Error";
            default: return "Unknown";
        }
    }

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close) {}

    void setStatusCode(HttpStatusCode code) { statusCode_ = code; }
    HttpStatusCode statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    void addHeader(const std::string& key, const std::string& value) { headers_[key] = value; }
    std::string getHeader(const std::string& key) const {
        auto it = headers_.find(key);
        return it == headers_.end() ? std::string() : it->second;
    }
    bool hasHeader(const std::string& key) const { return headers_.count(key) != 0; }
    const HeaderMap& headers() const { return headers_; }

    // Sets the body; Content-Length follows it unless set explicitly afterwards.
    void setBody(const std::string& body) {
        body_ = body;
        contentLength_ = body_.size();
    }
    const std::string& body() const { return body_; }

    // For streamed bodies and HEAD replies where the body is not held here.
    void setContentLength(uint64_t length) { contentLength_ = length; }
    uint64_t contentLength() const { return contentLength_; }

    // Status line and header block only.
    void appendHeadToBuffer(network::Buffer* output) const {
        char buf[64];
        snprintf(buf, sizeof buf, "HTTP/1.1 %d ", static_cast<int>(statusCode_));
        output->Append(buf, strlen(buf));
        output->Append(statusMessage_.empty() ? std::string(ReasonPhrase(statusCode_)) : statusMessage_);
        output->Append("\r\n");

        snprintf(buf, sizeof buf, "Content-Length: %llu\r\n", static_cast<unsigned long long>(contentLength_));
        output->Append(buf, strlen(buf));
        output->Append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");

        for (const auto& header : headers_) {
            output->Append(header.first);
            output->Append(": ");
            output->Append(header.second);
            output->Append("\r\n");
        }
        output->Append("\r\n");
    }

    void appendToBuffer(network::Buffer* output) const {
        appendHeadToBuffer(output);
        output->Append(body_);
    }

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    HeaderMap headers_;
    std::string body_;
    uint64_t contentLength_{0};
};

} // namespace protocol
} // namespace mediagate
