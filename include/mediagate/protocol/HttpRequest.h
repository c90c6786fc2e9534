#pragma once

#include "mediagate/protocol/HeaderMap.h"

#include <cstddef>
#include <string>

namespace mediagate {
namespace protocol {

// A parsed HTTP/1.x request line, header block and body.
class HttpRequest {
public:
    enum Method { kInvalid, kGet, kHead, kPost, kPut, kDelete, kOptions };
    enum Version { kUnknown, kHttp10, kHttp11 };

    // Returns false (leaving kInvalid) for methods outside the enum.
    bool setMethod(const char* start, const char* end);
    Method getMethod() const { return method_; }
    const char* methodString() const;

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    const std::string& path() const { return path_; }

    // Includes the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }

    // [start, colon) is the name, (colon, end) the raw value. Repeated
    // fields are joined with ", ".
    void addHeader(const char* start, const char* colon, const char* end);
    void setHeader(const std::string& field, const std::string& value) { headers_[field] = value; }
    // Case-insensitive; empty when absent.
    std::string getHeader(const std::string& field) const;
    bool hasHeader(const std::string& field) const { return headers_.count(field) != 0; }
    const HeaderMap& headers() const { return headers_; }

    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    // Persistent by default on 1.1; 1.0 must ask for keep-alive.
    bool keepAlive() const;

    void swap(HttpRequest& that);

private:
    Method method_ = kInvalid;
    Version version_ = kUnknown;
    std::string path_;
    std::string query_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace mediagate
