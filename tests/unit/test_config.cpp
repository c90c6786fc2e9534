#include "mediagate/GatewayOptions.h"
#include "mediagate/common/Config.h"
#include "mediagate/common/Logger.h"

#include <cassert>
#include <cstdio>
#include <fstream>

using namespace mediagate;
using namespace mediagate::common;

static const char* kFullConfig =
    "# sample\n"
    "[global]\n"
    "listen_port = 9090\n"
    "bind_address = 127.0.0.1\n"
    "threads = 2\n"
    "name = gate\n"
    "reuse_port = 1\n"
    "\n"
    "[stream]\n"
    "chunk_size = 524288\n"
    "fetch_timeout_ms = 5000\n"
    "origin_prefix = /files\n"
    "\n"
    "[security]\n"
    "verify_tokens = yes\n"
    "token_secret = s3cret\n"
    "\n"
    "[backends]\n"
    "load_accounting = off\n"
    "max_idle_per_backend = 3\n"
    "\n"
    "[backend:10]\n"
    "host = 10.0.0.10\n"
    "port = 9010\n"
    "[backend:2]\n"
    "host = 10.0.0.2\n"
    "port = 9002\n"
    "[backend:3]\n"
    "host = 10.0.0.3\n"
    "; port missing, skipped\n"
    "\n"
    "[connection_limit]\n"
    "max_total = 100\n"
    "max_per_ip = 4\n"
    "idle_timeout_sec = 30.5\n";

void testTypedGetters() {
    Config& cfg = Config::Instance();
    cfg.LoadFromString("[a]\nn = 42\nbig = 5000000000\nf = 2.5\nb1 = ON\nb2 = 0\njunk = x1\n");
    assert(cfg.GetInt("a", "n", 0) == 42);
    assert(cfg.GetInt64("a", "big", 0) == 5000000000LL);
    assert(cfg.GetDouble("a", "f", 0.0) == 2.5);
    assert(cfg.GetBool("a", "b1", false));
    assert(!cfg.GetBool("a", "b2", true));
    assert(cfg.GetInt("a", "junk", 7) == 7);
    assert(cfg.GetString("a", "missing", "dflt") == "dflt");
    assert(cfg.GetString("nosection", "n", "d") == "d");

    // Trailing garbage and keys ahead of any section header.
    cfg.LoadFromString("top = 1\n[b]\nport = 80abc\nratio = 1.5x\nbroken line\n[unterminated\nk = v\n");
    assert(cfg.GetInt("global", "top", 0) == 1);
    assert(cfg.GetInt("b", "port", -1) == -1);
    assert(cfg.GetDouble("b", "ratio", 0.25) == 0.25);
    assert(cfg.GetString("b", "k") == "v");
    assert(cfg.GetSectionsWithPrefix("b").size() == 1);

    Logger& logger = Logger::Instance();
    assert(logger.ParseLevel("debug") == LogLevel::DEBUG);
    assert(logger.ParseLevel("Error") == LogLevel::ERROR);
    assert(logger.ParseLevel("verbose") == LogLevel::INFO);
    LOG_INFO << "Typed Getters PASS";
}

void testGatewayOptions() {
    Config& cfg = Config::Instance();
    cfg.LoadFromString(kFullConfig);
    GatewayOptions o = GatewayOptions::FromConfig(cfg);
    assert(o.port == 9090);
    assert(o.bindAddress == "127.0.0.1");
    assert(o.threads == 2);
    assert(o.name == "gate");
    assert(o.reusePort);
    assert(o.chunkSize == 524288);
    assert(o.fetchTimeoutMs == 5000);
    assert(o.originPrefix == "/files");
    assert(o.verifyTokens);
    assert(o.tokenSecret == "s3cret");
    assert(!o.loadAccounting);
    assert(o.maxIdlePerBackend == 3);
    assert(o.backends.size() == 2);
    assert(o.backends[0].name == "backend:2");
    assert(o.backends[0].port == 9002);
    assert(o.backends[1].name == "backend:10");
    assert(o.backends[1].host == "10.0.0.10");
    assert(o.maxConnections == 100);
    assert(o.maxConnectionsPerIp == 4);
    assert(o.idleTimeoutSec == 30.5);
    o.Validate();
    LOG_INFO << "Gateway Options PASS";
}

static bool ValidateThrows(const GatewayOptions& o) {
    try {
        o.Validate();
    } catch (const ConfigError& e) {
        LOG_INFO << "rejected: " << e.what();
        return true;
    }
    return false;
}

void testValidation() {
    Config& cfg = Config::Instance();
    cfg.LoadFromString(kFullConfig);
    const GatewayOptions good = GatewayOptions::FromConfig(cfg);

    GatewayOptions o = good;
    o.backends.clear();
    assert(ValidateThrows(o));

    o = good;
    o.tokenSecret.clear();
    assert(ValidateThrows(o));
    o.verifyTokens = false;
    assert(!ValidateThrows(o));

    o = good;
    o.fetchTimeoutMs = 0;
    assert(ValidateThrows(o));

    o = good;
    o.tlsEnable = true;
    assert(ValidateThrows(o));

    cfg.LoadFromString("[global]\nlisten_port = 70000\n");
    bool threw = false;
    try {
        GatewayOptions::FromConfig(cfg);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    cfg.LoadFromString("[stream]\nchunk_size = 0\n");
    threw = false;
    try {
        GatewayOptions::FromConfig(cfg);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    LOG_INFO << "Validation PASS";
}

void testLoadFile() {
    const std::string path = "test_config_tmp.conf";
    {
        std::ofstream out(path);
        out << kFullConfig;
    }
    Config& cfg = Config::Instance();
    assert(cfg.Load(path));
    assert(cfg.GetString("global", "name") == "gate");
    std::remove(path.c_str());
    assert(!cfg.Load("/nonexistent/mediagate.conf"));
    LOG_INFO << "Load File PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testTypedGetters();
    testGatewayOptions();
    testValidation();
    testLoadFile();
    return 0;
}
