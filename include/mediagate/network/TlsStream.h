#pragma once

#include "mediagate/common/noncopyable.h"

#include <memory>
#include <string>
#include <sys/types.h>

struct ssl_ctx_st;
struct ssl_st;

namespace mediagate {
namespace network {

// Server side of one TLS session layered over a non-blocking socket.
class TlsStream : mediagate::common::noncopyable {
public:
    enum Status { kDone, kWantRead, kWantWrite, kEof, kError };

    // nullptr if OpenSSL cannot allocate the session.
    static std::unique_ptr<TlsStream> Accept(ssl_ctx_st* ctx, int fd);

    bool established() const { return established_; }

    Status Handshake();
    // Both return the byte count, or -1 with *status saying why nothing moved.
    ssize_t Read(char* buf, size_t cap, Status* status);
    ssize_t Write(const void* data, size_t len, Status* status);
    // Sends close_notify; never waits for the peer's reply.
    void Close();

    // OpenSSL error queue of the last failure, for logging.
    std::string lastError() const { return lastError_; }

private:
    struct SslDeleter {
        void operator()(ssl_st* ssl) const;
    };

    explicit TlsStream(ssl_st* ssl)
        : ssl_(ssl) {}

    Status Classify(int ret);

    std::unique_ptr<ssl_st, SslDeleter> ssl_;
    bool established_ = false;
    std::string lastError_;
};

} // namespace network
} // namespace mediagate
