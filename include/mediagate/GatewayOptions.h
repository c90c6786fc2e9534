#pragma once

#include "mediagate/backend/BackendPool.h"

#include <cstdint>
#include <string>
#include <vector>

namespace mediagate {

namespace common {
class Config;
}

// Everything the gateway reads from the INI file, with defaults.
struct GatewayOptions {
    // [global]
    std::string bindAddress{"0.0.0.0"};
    uint16_t port{8080};
    int threads{4};
    std::string name{"mediagate"};
    bool reusePort{false};

    // [stream]
    uint64_t chunkSize{1024 * 1024};
    int fetchTimeoutMs{15000};
    std::string originPrefix{"/objects"};

    // [security]
    bool verifyTokens{true};
    std::string tokenSecret;

    // [backends] and [backend:N]
    bool loadAccounting{true};
    size_t maxIdlePerBackend{8};
    std::vector<backend::Backend> backends;

    // [tls]
    bool tlsEnable{false};
    std::string certPath;
    std::string keyPath;

    // [connection_limit]
    int maxConnections{0};
    int maxConnectionsPerIp{0};
    double idleTimeoutSec{0.0};

    static GatewayOptions FromConfig(common::Config& config);

    // Throws common::ConfigError describing the first problem found.
    void Validate() const;
};

} // namespace mediagate
