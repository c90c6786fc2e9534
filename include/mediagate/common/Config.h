#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mediagate/common/noncopyable.h"

namespace mediagate {
namespace common {

// Raised when the loaded settings cannot describe a runnable gateway.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// INI settings shared by the whole process. Keys before the first
// [section] header belong to "global"; '#' and ';' start comment lines.
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    static Config& Instance();

    bool Load(const std::string& filename);
    // Replaces the in-memory settings with the parsed INI text.
    bool LoadFromString(const std::string& iniText);

    // Typed getters fall back to defaultVal when the key is absent or the
    // value does not parse completely (the latter is logged).
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "");
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0);
    int64_t GetInt64(const std::string& section, const std::string& key, int64_t defaultVal = 0);
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0);
    // Accepts 1/0, true/false, yes/no, on/off.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false);

    struct BackendConf {
        std::string section;
        std::string host;
        uint16_t port{0};
    };
    // One entry per [backend:N] section carrying both host and port, ordered by N.
    std::vector<BackendConf> GetBackends();

    std::vector<std::pair<std::string, Section>> GetSectionsWithPrefix(const std::string& prefix);

private:
    Config() = default;

    template <typename T, typename Parser>
    T GetNumber(const std::string& section, const std::string& key, T defaultVal, Parser parse);

    static std::map<std::string, Section> Parse(std::istream& in, const std::string& origin);

    mutable std::mutex mutex_;
    std::map<std::string, Section> settings_;
};

} // namespace common
} // namespace mediagate
