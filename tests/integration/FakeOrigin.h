#pragma once

// In-process origin for the integration tests: serves objects under
// /objects/<id> with HEAD and single byte ranges, clamped like a real server.

#include "mediagate/protocol/HttpServer.h"
#include "mediagate/protocol/HttpRequest.h"
#include "mediagate/protocol/HttpResponse.h"
#include "mediagate/protocol/ResponseWriter.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/network/InetAddress.h"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace testutil {

struct FakeObject {
    std::string data;
    std::string contentType;
    std::string name;
    // Accept the request and never answer.
    bool hang{false};
    // Answer every GET with 200 and the whole object.
    bool ignoreRange{false};
    // Ranges starting at or past this offset get a 500.
    uint64_t failFrom{std::numeric_limits<uint64_t>::max()};
    // Range replies go out this long after the request.
    int delayMs{0};
};

class FakeOrigin {
public:
    FakeOrigin(mediagate::network::EventLoop* loop, uint16_t port)
        : loop_(loop), server_(loop, mediagate::network::InetAddress(port, true), "FakeOrigin") {
        server_.setHttpCallback([this](const mediagate::protocol::HttpRequest& req,
                                       const std::shared_ptr<mediagate::protocol::ResponseWriter>& writer) {
            Handle(req, writer);
        });
    }

    void start() { server_.start(); }
    void put(const std::string& id, FakeObject object) { objects_[id] = std::move(object); }

    std::atomic<int> requests{0};
    // Readable from other threads, unlike `ranges`.
    std::atomic<int> rangeRequests{0};
    std::vector<std::string> ranges;

private:
    void Handle(const mediagate::protocol::HttpRequest& req,
                const std::shared_ptr<mediagate::protocol::ResponseWriter>& writer) {
        using mediagate::protocol::HttpResponse;
        ++requests;
        HttpResponse resp(false);
        const std::string prefix = "/objects/";
        auto it = req.path().compare(0, prefix.size(), prefix) == 0
                      ? objects_.find(req.path().substr(prefix.size()))
                      : objects_.end();
        if (it == objects_.end()) {
            resp.setStatusCode(HttpResponse::k404NotFound);
            writer->Send(resp);
            return;
        }
        const FakeObject& obj = it->second;
        if (obj.hang) {
            hung_.push_back(writer);
            return;
        }
        if (!obj.contentType.empty()) resp.setContentType(obj.contentType);
        if (!obj.name.empty()) resp.addHeader("X-Object-Name", obj.name);

        const std::string range = req.getHeader("Range");
        if (range.empty() || obj.ignoreRange || req.getMethod() == mediagate::protocol::HttpRequest::kHead) {
            if (!range.empty()) {
                ranges.push_back(range);
                ++rangeRequests;
            }
            resp.setStatusCode(HttpResponse::k200Ok);
            resp.setBody(obj.data);
            writer->Send(resp);
            return;
        }

        ranges.push_back(range);
        ++rangeRequests;
        // bytes=a-b
        const size_t dash = range.find('-');
        uint64_t from = std::strtoull(range.c_str() + 6, nullptr, 10);
        uint64_t until = std::strtoull(range.c_str() + dash + 1, nullptr, 10);
        const uint64_t size = obj.data.size();
        if (from >= obj.failFrom) {
            resp.setStatusCode(HttpResponse::k500InternalServerError);
            writer->Send(resp);
            return;
        }
        if (from >= size) {
            resp.setStatusCode(HttpResponse::k416RangeNotSatisfiable);
            resp.addHeader("Content-Range", "bytes */" + std::to_string(size));
            writer->Send(resp);
            return;
        }
        if (until >= size) until = size - 1;
        resp.setStatusCode(HttpResponse::k206PartialContent);
        resp.addHeader("Content-Range", "bytes " + std::to_string(from) + "-" + std::to_string(until) + "/" +
                                            std::to_string(size));
        resp.setBody(obj.data.substr(from, until - from + 1));
        if (obj.delayMs > 0) {
            loop_->RunAfter(obj.delayMs, [writer, resp]() mutable { writer->Send(resp); });
            return;
        }
        writer->Send(resp);
    }

    mediagate::network::EventLoop* loop_;
    std::map<std::string, FakeObject> objects_;
    std::vector<std::shared_ptr<mediagate::protocol::ResponseWriter>> hung_;
    mediagate::protocol::HttpServer server_;
};

inline std::string MakeObjectData(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>('A' + (i * 7 + i / 251) % 26);
    return s;
}

} // namespace testutil
