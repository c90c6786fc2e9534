#pragma once

#include <cctype>
#include <cstddef>
#include <map>
#include <string>

namespace mediagate {
namespace protocol {

// HTTP field names compare case-insensitively.
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        const size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            const int ca = std::tolower(static_cast<unsigned char>(a[i]));
            const int cb = std::tolower(static_cast<unsigned char>(b[i]));
            if (ca != cb) return ca < cb;
        }
        return a.size() < b.size();
    }
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

inline std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

inline bool IEquals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && ToLowerCopy(a) == ToLowerCopy(b);
}

// True when the comma separated header value lists `token` (e.g. "chunked", "close").
inline bool HeaderHasToken(const std::string& value, const std::string& token) {
    const std::string lv = ToLowerCopy(value);
    const std::string lt = ToLowerCopy(token);
    size_t pos = 0;
    while (pos <= lv.size()) {
        size_t comma = lv.find(',', pos);
        if (comma == std::string::npos) comma = lv.size();
        size_t b = pos;
        size_t e = comma;
        while (b < e && std::isspace(static_cast<unsigned char>(lv[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(lv[e - 1]))) --e;
        if (lv.compare(b, e - b, lt) == 0 && e - b == lt.size()) return true;
        pos = comma + 1;
    }
    return false;
}

} // namespace protocol
} // namespace mediagate
