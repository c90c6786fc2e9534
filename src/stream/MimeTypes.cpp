#include "mediagate/stream/MimeTypes.h"

#include <cctype>
#include <unordered_map>

namespace mediagate {
namespace stream {

std::string GuessMimeType(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> kTypes = {
        {"mp4", "video/mp4"},
        {"m4v", "video/x-m4v"},
        {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},
        {"mov", "video/quicktime"},
        {"avi", "video/x-msvideo"},
        {"wmv", "video/x-ms-wmv"},
        {"flv", "video/x-flv"},
        {"ts", "video/mp2t"},
        {"3gp", "video/3gpp"},
        {"mpeg", "video/mpeg"},
        {"mpg", "video/mpeg"},
        {"mp3", "audio/mpeg"},
        {"m4a", "audio/mp4"},
        {"aac", "audio/aac"},
        {"ogg", "audio/ogg"},
        {"oga", "audio/ogg"},
        {"opus", "audio/opus"},
        {"flac", "audio/flac"},
        {"wav", "audio/x-wav"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"rar", "application/vnd.rar"},
        {"7z", "application/x-7z-compressed"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"apk", "application/vnd.android.package-archive"},
        {"json", "application/json"},
        {"txt", "text/plain"},
        {"srt", "application/x-subrip"},
        {"vtt", "text/vtt"},
        {"html", "text/html"},
        {"htm", "text/html"},
    };

    const size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 >= filename.size()) return std::string();
    std::string ext = filename.substr(dot + 1);
    for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    auto it = kTypes.find(ext);
    return it == kTypes.end() ? std::string() : it->second;
}

} // namespace stream
} // namespace mediagate
