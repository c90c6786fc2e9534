#include "mediagate/protocol/HttpResponseContext.h"
#include "mediagate/common/Logger.h"

#include <cassert>
#include <cstring>

using namespace mediagate::protocol;
using namespace mediagate::common;

static bool Feed(HttpResponseContext& ctx, const std::string& s) {
    return ctx.feed(s.data(), s.size());
}

void testContentLengthByteByByte() {
    const std::string wire =
        "HTTP/1.1 206 Partial Content\r\n"
        "Content-Range: bytes 0-9/100\r\n"
        "Content-Length: 10\r\n"
        "\r\n"
        "0123456789";
    HttpResponseContext ctx;
    bool done = false;
    for (size_t i = 0; i < wire.size(); ++i) {
        assert(!done);
        done = ctx.feed(wire.data() + i, 1);
    }
    assert(done);
    assert(ctx.statusCode() == 206);
    assert(ctx.getHeader("content-range") == "bytes 0-9/100");
    assert(ctx.body() == "0123456789");
    assert(ctx.keepAlive());
    assert(ctx.started());
    LOG_INFO << "Content-Length Byte By Byte PASS";
}

void testChunked() {
    HttpResponseContext ctx;
    assert(!Feed(ctx, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki"));
    assert(!Feed(ctx, "\r\n5;name=x\r\npedia\r\n"));
    assert(!Feed(ctx, "0\r\n"));
    assert(Feed(ctx, "\r\n"));
    assert(ctx.body() == "Wikipedia");
    assert(ctx.takeBody() == "Wikipedia");
    LOG_INFO << "Chunked PASS";
}

void testCloseDelimited() {
    HttpResponseContext ctx;
    assert(!Feed(ctx, "HTTP/1.0 200 OK\r\n\r\nabc"));
    assert(!Feed(ctx, "def"));
    assert(ctx.needsCloseToFinish());
    assert(!ctx.keepAlive());
    assert(ctx.finishOnClose());
    assert(ctx.body() == "abcdef");

    // Truncated Content-Length body does not complete on close.
    HttpResponseContext cut;
    assert(!Feed(cut, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc"));
    assert(!cut.finishOnClose());
    LOG_INFO << "Close Delimited PASS";
}

void testHeadAndBodyless() {
    HttpResponseContext head;
    head.setExpectNoBody(true);
    assert(Feed(head, "HTTP/1.1 200 OK\r\nContent-Length: 3000000\r\nContent-Type: video/mp4\r\n\r\n"));
    assert(head.getHeader("Content-Length") == "3000000");
    assert(head.body().empty());

    HttpResponseContext none;
    assert(Feed(none, "HTTP/1.1 204 No Content\r\n\r\n"));
    assert(none.statusCode() == 204);

    HttpResponseContext nf;
    assert(Feed(nf, "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n"));
    assert(nf.statusCode() == 404);
    assert(!nf.keepAlive());
    LOG_INFO << "Head And Bodyless PASS";
}

void testErrors() {
    HttpResponseContext bad;
    assert(!Feed(bad, "SPDY/9 200 OK\r\n\r\n"));
    assert(bad.hasError());

    HttpResponseContext badLen;
    assert(!Feed(badLen, "HTTP/1.1 200 OK\r\nContent-Length: ten\r\n\r\n"));
    assert(badLen.hasError());

    HttpResponseContext badChunk;
    assert(!Feed(badChunk, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"));
    assert(badChunk.hasError());

    HttpResponseContext huge;
    std::string head = "HTTP/1.1 200 OK\r\nX-Pad: " + std::string(HttpResponseContext::kMaxHeadBytes, 'p');
    assert(!Feed(huge, head));
    assert(huge.hasError());
    LOG_INFO << "Errors PASS";
}

void testReset() {
    HttpResponseContext ctx;
    assert(Feed(ctx, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nhi"));
    ctx.reset();
    assert(!ctx.started());
    assert(!ctx.gotAll());
    assert(Feed(ctx, "HTTP/1.1 206 Partial Content\r\nContent-Length: 1\r\n\r\nx"));
    assert(ctx.statusCode() == 206);
    assert(ctx.body() == "x");
    LOG_INFO << "Reset PASS";
}

void testBodyLimit() {
    HttpResponseContext big;
    big.setBodyLimit(4);
    assert(!Feed(big, "HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n"));
    assert(big.headComplete());
    assert(Feed(big, "0123456789"));
    assert(big.body() == "0123");
    assert(big.bodyTruncated());
    assert(!big.keepAlive());
    // Later bytes are ignored.
    assert(Feed(big, "abcdef"));
    assert(big.body() == "0123");

    HttpResponseContext exact;
    exact.setBodyLimit(4);
    assert(Feed(exact, "HTTP/1.1 206 Partial Content\r\nContent-Length: 4\r\n\r\nwxyz"));
    assert(exact.body() == "wxyz");
    assert(!exact.bodyTruncated());
    assert(exact.keepAlive());

    HttpResponseContext chunked;
    chunked.setBodyLimit(6);
    assert(Feed(chunked, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\na\r\n0123456789\r\n"));
    assert(chunked.body() == "012345");
    assert(chunked.bodyTruncated());

    HttpResponseContext untilClose;
    untilClose.setBodyLimit(3);
    assert(Feed(untilClose, "HTTP/1.1 200 OK\r\n\r\nabcdef"));
    assert(untilClose.body() == "abc");

    big.reset();
    assert(!big.bodyTruncated());
    assert(!big.headComplete());
    LOG_INFO << "Body Limit PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testContentLengthByteByByte();
    testChunked();
    testCloseDelimited();
    testHeadAndBodyless();
    testErrors();
    testReset();
    testBodyLimit();
    return 0;
}
