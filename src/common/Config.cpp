#include "mediagate/common/Config.h"
#include "mediagate/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <strings.h>

namespace mediagate {
namespace common {

namespace {

std::string Strip(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Numeric suffix of "backend:12" style names, or -1.
long SectionOrdinal(const std::string& section) {
    const size_t colon = section.find(':');
    if (colon == std::string::npos || colon + 1 >= section.size()) return -1;
    const std::string tail = section.substr(colon + 1);
    if (!std::all_of(tail.begin(), tail.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) return -1;
    errno = 0;
    const long v = std::strtol(tail.c_str(), nullptr, 10);
    return errno == 0 ? v : -1;
}

// Each parser succeeds only when the whole string is consumed.
bool ParseInt64(const std::string& s, int64_t* out) {
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
    *out = static_cast<int64_t>(v);
    return true;
}

bool ParseInt(const std::string& s, int* out) {
    int64_t v = 0;
    if (!ParseInt64(s, &v) || v < INT_MIN || v > INT_MAX) return false;
    *out = static_cast<int>(v);
    return true;
}

bool ParseDouble(const std::string& s, double* out) {
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
    *out = v;
    return true;
}

} // namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::map<std::string, Config::Section> Config::Parse(std::istream& in, const std::string& origin) {
    std::map<std::string, Section> parsed;
    std::string section = "global";
    std::string raw;
    int lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        const std::string line = Strip(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                LOG_WARN << origin << ":" << lineNo << ": unterminated section header ignored";
                continue;
            }
            section = Strip(line.substr(1, line.size() - 2));
            parsed[section];
            continue;
        }

        const size_t eq = line.find('=');
        const std::string key = eq == std::string::npos ? std::string() : Strip(line.substr(0, eq));
        if (key.empty()) {
            LOG_WARN << origin << ":" << lineNo << ": expected key = value, ignored";
            continue;
        }
        parsed[section][key] = Strip(line.substr(eq + 1));
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        LOG_ERROR << "Cannot open config file " << filename;
        return false;
    }
    std::map<std::string, Section> parsed = Parse(file, filename);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.swap(parsed);
    }
    LOG_INFO << "Config loaded from " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    std::map<std::string, Section> parsed = Parse(in, "<string>");
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.swap(parsed);
    return true;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? defaultVal : kit->second;
}

template <typename T, typename Parser>
T Config::GetNumber(const std::string& section, const std::string& key, T defaultVal, Parser parse) {
    const std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    T out{};
    if (!parse(val, &out)) {
        LOG_WARN << "Config [" << section << "] " << key << " = " << val << " is not a valid number, using "
                 << defaultVal;
        return defaultVal;
    }
    return out;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) {
    return GetNumber(section, key, defaultVal, ParseInt);
}

int64_t Config::GetInt64(const std::string& section, const std::string& key, int64_t defaultVal) {
    return GetNumber(section, key, defaultVal, ParseInt64);
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) {
    return GetNumber(section, key, defaultVal, ParseDouble);
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) {
    const std::string val = GetString(section, key, "");
    static const char* const kTrue[] = {"1", "true", "yes", "on"};
    static const char* const kFalse[] = {"0", "false", "no", "off"};
    for (const char* t : kTrue) {
        if (::strcasecmp(val.c_str(), t) == 0) return true;
    }
    for (const char* f : kFalse) {
        if (::strcasecmp(val.c_str(), f) == 0) return false;
    }
    if (!val.empty()) {
        LOG_WARN << "Config [" << section << "] " << key << " = " << val << " is not a boolean";
    }
    return defaultVal;
}

std::vector<Config::BackendConf> Config::GetBackends() {
    std::vector<BackendConf> result;
    for (const auto& entry : GetSectionsWithPrefix("backend:")) {
        const std::string& section = entry.first;
        const Section& keys = entry.second;
        auto host = keys.find("host");
        auto port = keys.find("port");
        if (host == keys.end() || port == keys.end()) {
            LOG_WARN << "Config [" << section << "] needs both host and port, skipped";
            continue;
        }
        int portNum = 0;
        if (!ParseInt(port->second, &portNum) || portNum <= 0 || portNum > 65535) {
            LOG_WARN << "Config [" << section << "] bad port " << port->second << ", skipped";
            continue;
        }
        BackendConf conf;
        conf.section = section;
        conf.host = host->second;
        conf.port = static_cast<uint16_t>(portNum);
        result.push_back(std::move(conf));
    }

    // [backend:2] must come before [backend:10].
    std::stable_sort(result.begin(), result.end(), [](const BackendConf& a, const BackendConf& b) {
        const long oa = SectionOrdinal(a.section);
        const long ob = SectionOrdinal(b.section);
        if (oa >= 0 && ob >= 0) return oa < ob;
        if (oa >= 0 || ob >= 0) return oa >= 0;
        return a.section < b.section;
    });
    return result;
}

std::vector<std::pair<std::string, Config::Section>> Config::GetSectionsWithPrefix(const std::string& prefix) {
    std::vector<std::pair<std::string, Section>> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = settings_.lower_bound(prefix); it != settings_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        out.emplace_back(it->first, it->second);
    }
    return out;
}

} // namespace common
} // namespace mediagate
