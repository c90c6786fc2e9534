#pragma once

#include "mediagate/common/noncopyable.h"

#include <memory>
#include <string>

struct ssl_ctx_st;

namespace mediagate {
namespace network {

// Server-side OpenSSL context, built once and shared read-only by every
// accepted connection of a TcpServer.
class TlsContext : mediagate::common::noncopyable {
public:
    // Loads the PEM chain and key. Returns nullptr (after logging the
    // OpenSSL error queue) if either file is unusable or they do not match.
    static std::shared_ptr<TlsContext> CreateServer(const std::string& certChainPath,
                                                    const std::string& keyPath);

    ssl_ctx_st* ctx() const { return ctx_.get(); }

private:
    struct CtxDeleter {
        void operator()(ssl_ctx_st* ctx) const;
    };

    explicit TlsContext(ssl_ctx_st* ctx)
        : ctx_(ctx) {}

    std::unique_ptr<ssl_ctx_st, CtxDeleter> ctx_;
};

} // namespace network
} // namespace mediagate
