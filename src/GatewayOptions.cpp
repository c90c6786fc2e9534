#include "mediagate/GatewayOptions.h"
#include "mediagate/common/Config.h"

namespace mediagate {

GatewayOptions GatewayOptions::FromConfig(common::Config& config) {
    GatewayOptions o;
    o.bindAddress = config.GetString("global", "bind_address", o.bindAddress);
    const int port = config.GetInt("global", "listen_port", o.port);
    if (port <= 0 || port > 65535) {
        throw common::ConfigError("[global] listen_port out of range: " + std::to_string(port));
    }
    o.port = static_cast<uint16_t>(port);
    o.threads = config.GetInt("global", "threads", o.threads);
    o.name = config.GetString("global", "name", o.name);
    o.reusePort = config.GetBool("global", "reuse_port", o.reusePort);

    const int64_t chunk = config.GetInt64("stream", "chunk_size", static_cast<int64_t>(o.chunkSize));
    if (chunk < 1) {
        throw common::ConfigError("[stream] chunk_size must be at least 1, got " + std::to_string(chunk));
    }
    o.chunkSize = static_cast<uint64_t>(chunk);
    o.fetchTimeoutMs = config.GetInt("stream", "fetch_timeout_ms", o.fetchTimeoutMs);
    o.originPrefix = config.GetString("stream", "origin_prefix", o.originPrefix);

    o.verifyTokens = config.GetBool("security", "verify_tokens", o.verifyTokens);
    o.tokenSecret = config.GetString("security", "token_secret", "");

    o.loadAccounting = config.GetBool("backends", "load_accounting", o.loadAccounting);
    const int idle = config.GetInt("backends", "max_idle_per_backend", static_cast<int>(o.maxIdlePerBackend));
    o.maxIdlePerBackend = idle < 0 ? 0 : static_cast<size_t>(idle);
    for (const auto& conf : config.GetBackends()) {
        backend::Backend b;
        b.name = conf.section;
        b.host = conf.host;
        b.port = conf.port;
        o.backends.push_back(std::move(b));
    }

    o.tlsEnable = config.GetBool("tls", "enable", false);
    o.certPath = config.GetString("tls", "cert_path", "");
    o.keyPath = config.GetString("tls", "key_path", "");

    o.maxConnections = config.GetInt("connection_limit", "max_total", 0);
    o.maxConnectionsPerIp = config.GetInt("connection_limit", "max_per_ip", 0);
    o.idleTimeoutSec = config.GetDouble("connection_limit", "idle_timeout_sec", 0.0);
    return o;
}

void GatewayOptions::Validate() const {
    if (backends.empty()) {
        throw common::ConfigError("no backends configured: add at least one [backend:N] section with host and port");
    }
    if (chunkSize < 1) {
        throw common::ConfigError("[stream] chunk_size must be at least 1");
    }
    if (verifyTokens && tokenSecret.empty()) {
        throw common::ConfigError("[security] token_secret is required while verify_tokens is on");
    }
    if (fetchTimeoutMs <= 0) {
        throw common::ConfigError("[stream] fetch_timeout_ms must be positive");
    }
    if (threads < 0) {
        throw common::ConfigError("[global] threads must not be negative");
    }
    if (tlsEnable && (certPath.empty() || keyPath.empty())) {
        throw common::ConfigError("[tls] enable needs cert_path and key_path");
    }
}

} // namespace mediagate
