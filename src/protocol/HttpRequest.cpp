#include "mediagate/protocol/HttpRequest.h"

#include <cctype>
#include <cstring>
#include <utility>

namespace mediagate {
namespace protocol {

namespace {

struct MethodName {
    HttpRequest::Method method;
    const char* name;
};

const MethodName kMethods[] = {
    {HttpRequest::kGet, "GET"},
    {HttpRequest::kHead, "HEAD"},
    {HttpRequest::kPost, "POST"},
    {HttpRequest::kPut, "PUT"},
    {HttpRequest::kDelete, "DELETE"},
    {HttpRequest::kOptions, "OPTIONS"},
};

bool IsBlank(char c) {
    return c == ' ' || c == '\t';
}

} // namespace

bool HttpRequest::setMethod(const char* start, const char* end) {
    const size_t len = static_cast<size_t>(end - start);
    method_ = kInvalid;
    for (const MethodName& m : kMethods) {
        if (std::strlen(m.name) == len && std::memcmp(m.name, start, len) == 0) {
            method_ = m.method;
            break;
        }
    }
    return method_ != kInvalid;
}

const char* HttpRequest::methodString() const {
    for (const MethodName& m : kMethods) {
        if (m.method == method_) return m.name;
    }
    return "UNKNOWN";
}

void HttpRequest::addHeader(const char* start, const char* colon, const char* end) {
    const char* v = colon + 1;
    while (v < end && IsBlank(*v)) ++v;
    while (end > v && std::isspace(static_cast<unsigned char>(end[-1]))) --end;

    std::string& slot = headers_[std::string(start, colon)];
    if (!slot.empty()) slot += ", ";
    slot.append(v, end);
}

std::string HttpRequest::getHeader(const std::string& field) const {
    HeaderMap::const_iterator it = headers_.find(field);
    return it == headers_.end() ? std::string() : it->second;
}

bool HttpRequest::keepAlive() const {
    const std::string connection = getHeader("Connection");
    if (HeaderHasToken(connection, "close")) return false;
    return version_ != kHttp10 || HeaderHasToken(connection, "keep-alive");
}

void HttpRequest::swap(HttpRequest& that) {
    std::swap(method_, that.method_);
    std::swap(version_, that.version_);
    path_.swap(that.path_);
    query_.swap(that.query_);
    headers_.swap(that.headers_);
    body_.swap(that.body_);
}

} // namespace protocol
} // namespace mediagate
