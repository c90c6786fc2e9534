#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mediagate {

// "0s", "42s", "1m: 5s", "2h: 0m: 7s", "3 days, 4h: 0m: 1s"
std::string ReadableUptime(uint64_t seconds);

std::string JsonEscape(const std::string& s);

struct StatusSnapshot {
    uint64_t uptimeSeconds{0};
    std::string name;
    size_t connectedBackends{0};
    std::vector<int> loads; // pool order
    std::string version;
};

// The /status document. Loads are listed busiest first as backend1..backendN.
std::string StatusJson(const StatusSnapshot& snapshot);

} // namespace mediagate
