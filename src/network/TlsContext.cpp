#include "mediagate/network/TlsContext.h"
#include "mediagate/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mediagate {
namespace network {

namespace {

const char kCipherList[] = "ECDHE+AESGCM:ECDHE+CHACHA20:!aNULL:!MD5:!RC4";

// Drains the whole OpenSSL error queue into one line.
std::string DrainSslErrors() {
    std::string out;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof buf);
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? "no OpenSSL error recorded" : out;
}

// Browsers and players offer h2 first; only HTTP/1.1 is spoken here.
int SelectAlpn(SSL*, const unsigned char** out, unsigned char* outlen,
               const unsigned char* in, unsigned int inlen, void*) {
    static const unsigned char kHttp11[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};
    unsigned char* selected = nullptr;
    if (SSL_select_next_proto(&selected, outlen, kHttp11, sizeof kHttp11, in, inlen) !=
        OPENSSL_NPN_NEGOTIATED) {
        return SSL_TLSEXT_ERR_NOACK;
    }
    *out = selected;
    return SSL_TLSEXT_ERR_OK;
}

} // namespace

void TlsContext::CtxDeleter::operator()(ssl_ctx_st* ctx) const {
    SSL_CTX_free(ctx);
}

std::shared_ptr<TlsContext> TlsContext::CreateServer(const std::string& certChainPath,
                                                     const std::string& keyPath) {
    if (certChainPath.empty() || keyPath.empty()) {
        LOG_ERROR << "TLS needs both a certificate chain and a private key";
        return nullptr;
    }

    ERR_clear_error();
    std::shared_ptr<TlsContext> context(new TlsContext(SSL_CTX_new(TLS_server_method())));
    SSL_CTX* c = context->ctx();
    if (c == nullptr) {
        LOG_ERROR << "SSL_CTX_new: " << DrainSslErrors();
        return nullptr;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION | SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_mode(c, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER | SSL_MODE_ENABLE_PARTIAL_WRITE |
                            SSL_MODE_RELEASE_BUFFERS);
    SSL_CTX_set_session_cache_mode(c, SSL_SESS_CACHE_SERVER);
    if (SSL_CTX_set_cipher_list(c, kCipherList) != 1) {
        LOG_WARN << "TLS cipher list rejected, keeping OpenSSL defaults: " << DrainSslErrors();
    }
    SSL_CTX_set_alpn_select_cb(c, SelectAlpn, nullptr);

    if (SSL_CTX_use_certificate_chain_file(c, certChainPath.c_str()) != 1) {
        LOG_ERROR << "TLS certificate " << certChainPath << ": " << DrainSslErrors();
        return nullptr;
    }
    if (SSL_CTX_use_PrivateKey_file(c, keyPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        LOG_ERROR << "TLS key " << keyPath << ": " << DrainSslErrors();
        return nullptr;
    }
    if (SSL_CTX_check_private_key(c) != 1) {
        LOG_ERROR << "TLS key " << keyPath << " does not match " << certChainPath;
        return nullptr;
    }

    LOG_INFO << "TLS enabled with " << certChainPath;
    return context;
}

} // namespace network
} // namespace mediagate
