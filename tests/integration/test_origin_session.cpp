#include "mediagate/backend/OriginSession.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/common/Logger.h"

#include "FakeOrigin.h"
#include "SocketTestUtil.h"

#include <cassert>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace mediagate::backend;
using namespace mediagate::network;
using namespace mediagate::common;
using namespace testutil;

using Step = std::function<void(std::function<void()> next)>;

// Runs asynchronous steps one after another on the loop, then quits it.
static void RunSteps(EventLoop* loop, std::shared_ptr<std::vector<Step>> steps, size_t i = 0) {
    if (i == steps->size()) {
        loop->Quit();
        return;
    }
    (*steps)[i]([loop, steps, i]() {
        loop->QueueInLoop([loop, steps, i]() { RunSteps(loop, steps, i + 1); });
    });
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    const uint16_t port = pickFreePort();
    const std::string movie = MakeObjectData(100000);

    EventLoop loop;
    FakeOrigin origin(&loop, port);
    origin.put("movie.mp4", FakeObject{movie, "video/mp4", "Holiday Movie.mp4", false});
    origin.put("anon", FakeObject{"abc", "", "", false});
    origin.put("stuck", FakeObject{"zzz", "", "", true});
    FakeObject whole{movie, "video/mp4", "", false};
    whole.ignoreRange = true;
    origin.put("whole", whole);
    origin.start();

    Backend backend{"backend:1", "127.0.0.1", port};
    OriginSession::Options opts;
    opts.timeoutMs = 300;
    auto session = std::make_shared<OriginSession>(backend, opts);
    assert(session->RequestPath("x") == "/objects/x");

    auto steps = std::make_shared<std::vector<Step>>();
    steps->push_back([&](std::function<void()> next) {
        session->Stat(&loop, "movie.mp4", [next](const StatResult& r) {
            assert(r.error == TransportError::kNone);
            assert(r.stat.size == 100000);
            assert(r.stat.contentType == "video/mp4");
            assert(r.stat.name == "Holiday Movie.mp4");
            LOG_INFO << "Stat PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        session->Stat(&loop, "anon", [next](const StatResult& r) {
            assert(r.error == TransportError::kNone);
            assert(r.stat.size == 3);
            assert(r.stat.contentType.empty());
            assert(r.stat.name == "anon");
            LOG_INFO << "Stat Without Name PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        session->Stat(&loop, "missing", [next](const StatResult& r) {
            assert(r.error == TransportError::kNotFound);
            LOG_INFO << "Stat Not Found PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        session->FetchChunk(&loop, "movie.mp4", 32768, 32768, [&, next](TransportError e, std::string data) {
            assert(e == TransportError::kNone);
            assert(data == movie.substr(32768, 32768));
            assert(origin.ranges.back() == "bytes=32768-65535");
            LOG_INFO << "Fetch Middle Chunk PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        // Last chunk: origin clamps, fewer bytes than asked.
        session->FetchChunk(&loop, "movie.mp4", 98304, 32768, [&, next](TransportError e, std::string data) {
            assert(e == TransportError::kNone);
            assert(data == movie.substr(98304));
            LOG_INFO << "Fetch Tail Chunk PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        session->FetchChunk(&loop, "movie.mp4", 0, 0, [next](TransportError e, std::string data) {
            assert(e == TransportError::kNone);
            assert(data.empty());
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        session->FetchChunk(&loop, "gone", 0, 1024, [next](TransportError e, std::string) {
            assert(e == TransportError::kNotFound);
            LOG_INFO << "Fetch Not Found PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        session->FetchChunk(&loop, "stuck", 0, 1024, [next](TransportError e, std::string) {
            assert(e == TransportError::kTimeout);
            LOG_INFO << "Fetch Timeout PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        // Every exchange above reached the origin exactly once.
        assert(origin.requests == 7);
        next();
    });
    steps->push_back([&](std::function<void()> next) {
        // Origin ignores Range: only the asked-for bytes are kept.
        session->FetchChunk(&loop, "whole", 0, 32768, [&, next](TransportError e, std::string data) {
            assert(e == TransportError::kNone);
            assert(data.size() == 32768);
            assert(data == movie.substr(0, 32768));
            LOG_INFO << "Whole Object Reply Cut To Chunk PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        // Past the first chunk a whole-object reply is refused at its head.
        session->FetchChunk(&loop, "whole", 32768, 32768, [&, next](TransportError e, std::string data) {
            assert(e == TransportError::kBadResponse);
            assert(data.empty());
            LOG_INFO << "Whole Object Reply Past First Chunk PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        // Both cut connections were dropped; the next fetch still works.
        session->FetchChunk(&loop, "movie.mp4", 65536, 32768, [&, next](TransportError e, std::string data) {
            assert(e == TransportError::kNone);
            assert(data == movie.substr(65536, 32768));
            assert(origin.requests == 10);
            LOG_INFO << "Fetch After Cut Reply PASS";
            next();
        });
    });
    steps->push_back([&](std::function<void()> next) {
        Backend dead{"backend:9", "127.0.0.1", pickFreePort()};
        auto deadSession = std::make_shared<OriginSession>(dead, opts);
        deadSession->Stat(&loop, "movie.mp4", [deadSession, next](const StatResult& r) {
            assert(r.error == TransportError::kConnectFailed);
            LOG_INFO << "Connect Failed PASS";
            next();
        });
    });

    loop.QueueInLoop([&loop, steps]() { RunSteps(&loop, steps); });
    loop.Loop();
    return 0;
}
