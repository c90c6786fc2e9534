#include "mediagate/protocol/HttpServer.h"
#include "mediagate/protocol/HttpRequest.h"
#include "mediagate/protocol/HttpResponse.h"
#include "mediagate/protocol/ResponseWriter.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/network/InetAddress.h"
#include "mediagate/common/Logger.h"

#include "SocketTestUtil.h"

#include <cassert>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

using namespace mediagate::protocol;
using namespace mediagate::network;
using namespace mediagate::common;
using namespace testutil;

static void respondText(const std::shared_ptr<ResponseWriter>& writer, const std::string& text) {
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("text/plain");
    resp.setBody(text);
    writer->Send(resp);
}

// Streams `pieces` bodies one drain at a time.
static void streamPieces(const std::shared_ptr<ResponseWriter>& writer, std::shared_ptr<int> left) {
    if (*left == 0) {
        writer->Finish();
        return;
    }
    const std::string piece = "part" + std::to_string(4 - *left);
    --*left;
    writer->SendBody(piece, [writer, left]() { streamPieces(writer, left); });
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    const uint16_t port = pickFreePort();
    EventLoop loop;
    HttpServer server(&loop, InetAddress(port, true), "TestHttpServer");
    int abortedStreams = 0;

    server.setHttpCallback([&](const HttpRequest& req, const std::shared_ptr<ResponseWriter>& writer) {
        LOG_INFO << "HttpServer - Request: " << req.methodString() << " " << req.path();

        if (req.path() == "/later") {
            // Answer from a timer, well after the handler returned.
            writer->getLoop()->RunAfter(100, [writer]() { respondText(writer, "late answer"); });
        } else if (req.path() == "/stream") {
            HttpResponse head(false);
            head.setStatusCode(HttpResponse::k200Ok);
            head.setContentType("text/plain");
            head.setContentLength(15);
            writer->SendHead(head);
            streamPieces(writer, std::make_shared<int>(3));
        } else if (req.path() == "/hang") {
            writer->SetAbortCallback([&abortedStreams]() { ++abortedStreams; });
        } else if (req.path() == "/hello") {
            respondText(writer, "Hello World!");
        } else if (req.path() == "/quit") {
            respondText(writer, "Server Quitting...");
            loop.QueueInLoop([&]() { loop.Quit(); });
        } else {
            HttpResponse resp(false);
            resp.setStatusCode(HttpResponse::k404NotFound);
            writer->Send(resp);
        }
    });
    server.start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        // Pipelined: answers must come back in request order even though the
        // first one is produced last.
        std::string resp = roundTrip(port,
            "GET /later HTTP/1.1\r\nHost: test\r\n\r\n"
            "GET /stream HTTP/1.1\r\nHost: test\r\n\r\n"
            "HEAD /hello HTTP/1.1\r\nHost: test\r\n\r\n"
            "GET /hello HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n");
        const size_t late = resp.find("late answer");
        const size_t streamed = resp.find("part1part2part3");
        const size_t head = resp.find("Content-Length: 12\r\nConnection: keep-alive");
        const size_t hello = resp.find("Hello World!");
        assert(late != std::string::npos);
        assert(streamed != std::string::npos && streamed > late);
        assert(head != std::string::npos && head > streamed);
        assert(hello != std::string::npos && hello > head);
        // HEAD carried no body: exactly one copy of the greeting.
        assert(resp.find("Hello World!", hello + 1) == std::string::npos);
        assert(resp.find("Connection: close") != std::string::npos);

        resp = roundTrip(port, "BREW /pot HTTP/1.1\r\n\r\n");
        assert(resp.find("HTTP/1.1 400 Bad Request") == 0);

        resp = roundTrip(port, "GET /nothing HTTP/1.0\r\n\r\n");
        assert(resp.find("HTTP/1.1 404 Not Found") == 0);
        assert(resp.find("Connection: close") != std::string::npos);

        // Client leaves while its response is pending.
        int fd = connectTo(port);
        sendAll(fd, "GET /hang HTTP/1.1\r\nHost: test\r\n\r\n");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ::close(fd);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        resp = roundTrip(port, "GET /quit HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n");
        assert(resp.find("Server Quitting...") != std::string::npos);
    });

    loop.Loop();
    client.join();
    assert(abortedStreams == 1);
    LOG_INFO << "HttpServer async and pipelining PASS";
    return 0;
}
