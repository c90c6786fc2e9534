#include "mediagate/network/TlsStream.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mediagate {
namespace network {

void TlsStream::SslDeleter::operator()(ssl_st* ssl) const {
    SSL_free(ssl);
}

std::unique_ptr<TlsStream> TlsStream::Accept(ssl_ctx_st* ctx, int fd) {
    SSL* ssl = SSL_new(ctx);
    if (ssl == nullptr) {
        return nullptr;
    }
    std::unique_ptr<TlsStream> stream(new TlsStream(ssl));
    if (SSL_set_fd(ssl, fd) != 1) {
        return nullptr;
    }
    SSL_set_accept_state(ssl);
    return stream;
}

TlsStream::Status TlsStream::Classify(int ret) {
    switch (SSL_get_error(ssl_.get(), ret)) {
        case SSL_ERROR_WANT_READ:
            return kWantRead;
        case SSL_ERROR_WANT_WRITE:
            return kWantWrite;
        case SSL_ERROR_ZERO_RETURN:
            return kEof;
        default:
            break;
    }
    lastError_.clear();
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof buf);
        if (!lastError_.empty()) lastError_ += "; ";
        lastError_ += buf;
    }
    if (lastError_.empty()) lastError_ = "connection dropped during TLS";
    return kError;
}

TlsStream::Status TlsStream::Handshake() {
    const int r = SSL_accept(ssl_.get());
    if (r == 1) {
        established_ = true;
        return kDone;
    }
    return Classify(r);
}

ssize_t TlsStream::Read(char* buf, size_t cap, Status* status) {
    const int r = SSL_read(ssl_.get(), buf, static_cast<int>(cap));
    if (r > 0) {
        *status = kDone;
        return r;
    }
    *status = Classify(r);
    return -1;
}

ssize_t TlsStream::Write(const void* data, size_t len, Status* status) {
    const int r = SSL_write(ssl_.get(), data, static_cast<int>(len));
    if (r > 0) {
        *status = kDone;
        return r;
    }
    *status = Classify(r);
    return -1;
}

void TlsStream::Close() {
    if (established_) {
        SSL_shutdown(ssl_.get());
    }
}

} // namespace network
} // namespace mediagate
