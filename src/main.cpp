#include "mediagate/GatewayOptions.h"
#include "mediagate/GatewayServer.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/stream/TokenCodec.h"
#include "mediagate/common/Config.h"
#include "mediagate/common/Logger.h"
#include "mediagate/common/Version.h"

#include <csignal>
#include <cstdio>
#include <exception>
#include <getopt.h>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    using namespace mediagate;

    std::string configFile = "../config/mediagate.conf";
    bool checkOnly = false;
    std::string tokenFor;
    int ch;
    while ((ch = getopt(argc, argv, "c:Ct:hv")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 't':
                tokenFor = optarg;
                break;
            case 'v':
                printf("mediagate %s\n", MEDIAGATE_VERSION);
                return 0;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C] [-t object_id]\n", argv[0]);
                printf("  -C  check config and exit\n");
                printf("  -t  print the URL token for an object id and exit\n");
                printf("  -v  print version\n");
                return ch == 'h' ? 0 : 1;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config, using defaults.";
    }

    auto& logger = common::Logger::Instance();
    logger.SetLevel(logger.ParseLevel(conf.GetString("global", "log_level", "INFO")));
    logger.SetColor(conf.GetBool("log", "color", true));
    const std::string logFile = conf.GetString("log", "file", "");
    if (!logFile.empty() && !logger.SetLogFile(logFile)) {
        LOG_WARN << "Cannot open log file " << logFile << ", logging to stdout only";
    }

    GatewayOptions options;
    try {
        options = GatewayOptions::FromConfig(conf);
        options.Validate();
    } catch (const common::ConfigError& e) {
        LOG_ERROR << "Invalid configuration: " << e.what();
        fprintf(stderr, "config error: %s\n", e.what());
        return 1;
    }

    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    if (!tokenFor.empty()) {
        try {
            const stream::TokenCodec codec(options.tokenSecret, options.verifyTokens);
            printf("%s\n", codec.Encode(tokenFor).c_str());
            return 0;
        } catch (const std::invalid_argument& e) {
            fprintf(stderr, "%s\n", e.what());
            return 1;
        }
    }

    // Peers vanish mid-write all the time; the write error is handled per connection.
    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    try {
        GatewayServer server(&loop, options);
        if (!server.Start()) {
            return 1;
        }
        loop.Loop();
    } catch (const std::exception& e) {
        LOG_ERROR << "mediagate stopped: " << e.what();
        return 1;
    }
    return 0;
}
