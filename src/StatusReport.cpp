#include "mediagate/StatusReport.h"

#include <algorithm>
#include <sstream>

namespace mediagate {

std::string ReadableUptime(uint64_t seconds) {
    const uint64_t days = seconds / 86400;
    const uint64_t hours = seconds % 86400 / 3600;
    const uint64_t minutes = seconds % 3600 / 60;
    const uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (days > 0) {
        ss << days << (days == 1 ? " day, " : " days, ") << hours << "h: " << minutes << "m: " << secs << "s";
    } else if (hours > 0) {
        ss << hours << "h: " << minutes << "m: " << secs << "s";
    } else if (minutes > 0) {
        ss << minutes << "m: " << secs << "s";
    } else {
        ss << secs << "s";
    }
    return ss.str();
}

std::string JsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0xF]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

std::string StatusJson(const StatusSnapshot& snapshot) {
    std::vector<int> loads = snapshot.loads;
    std::stable_sort(loads.begin(), loads.end(), [](int a, int b) { return a > b; });

    std::ostringstream ss;
    ss << "{\"server_status\":\"running\"";
    ss << ",\"uptime\":\"" << JsonEscape(ReadableUptime(snapshot.uptimeSeconds)) << "\"";
    ss << ",\"identity\":\"@" << JsonEscape(snapshot.name) << "\"";
    ss << ",\"connected_backends\":" << snapshot.connectedBackends;
    ss << ",\"loads\":{";
    for (size_t i = 0; i < loads.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "\"backend" << (i + 1) << "\":" << loads[i];
    }
    ss << "}";
    ss << ",\"version\":\"" << JsonEscape(snapshot.version) << "\"";
    ss << "}";
    return ss.str();
}

} // namespace mediagate
