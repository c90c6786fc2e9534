#include "mediagate/stream/ResponseAssembler.h"
#include "mediagate/stream/MimeTypes.h"

namespace mediagate {
namespace stream {

using protocol::HttpResponse;

std::string ResponseAssembler::ContentTypeFor(const ObjectMetadata& meta) {
    if (meta.mimeType && !meta.mimeType->empty()) return *meta.mimeType;
    std::string guessed = GuessMimeType(meta.displayName);
    if (!guessed.empty()) return guessed;
    return "application/octet-stream";
}

std::string ResponseAssembler::SanitizeFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (c < 0x20 || c == 0x7f || c == '"' || c == '\\') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

void ResponseAssembler::AddCorsHeaders(HttpResponse* response) {
    response->addHeader("Access-Control-Allow-Origin", "*");
    response->addHeader("Access-Control-Allow-Methods", "GET, HEAD, OPTIONS");
}

void ResponseAssembler::BuildMediaHead(const ObjectMetadata& meta,
                                       const RangeSpec& range,
                                       Disposition disposition,
                                       HttpResponse* response) {
    response->setStatusCode(range.explicitRange ? HttpResponse::k206PartialContent : HttpResponse::k200Ok);
    response->setContentType(ContentTypeFor(meta));
    if (range.length > 0) {
        response->addHeader("Content-Range", "bytes " + std::to_string(range.from) + "-" +
                                                 std::to_string(range.until) + "/" + std::to_string(meta.size));
    }
    response->setContentLength(range.length);
    response->addHeader("Content-Disposition",
                        std::string(disposition == Disposition::kInline ? "inline" : "attachment") +
                            "; filename=\"" + SanitizeFilename(meta.displayName) + "\"");
    response->addHeader("Accept-Ranges", "bytes");
    AddCorsHeaders(response);
}

void ResponseAssembler::BuildNotSatisfiable(uint64_t size, HttpResponse* response) {
    response->setStatusCode(HttpResponse::k416RangeNotSatisfiable);
    response->addHeader("Content-Range", "bytes */" + std::to_string(size));
    response->setContentLength(0);
    AddCorsHeaders(response);
}

void ResponseAssembler::BuildError(HttpResponse::HttpStatusCode code,
                                   const std::string& message,
                                   HttpResponse* response) {
    response->setStatusCode(code);
    response->setContentType("text/plain; charset=utf-8");
    response->setBody(std::to_string(static_cast<int>(code)) + ": " + message + "\n");
}

void ResponseAssembler::BuildPreflight(HttpResponse* response) {
    response->setStatusCode(HttpResponse::k204NoContent);
    AddCorsHeaders(response);
    response->addHeader("Access-Control-Allow-Headers", "Range");
    response->addHeader("Access-Control-Expose-Headers", "Content-Range, Content-Length, Accept-Ranges");
    response->addHeader("Access-Control-Max-Age", "86400");
    response->setContentLength(0);
}

} // namespace stream
} // namespace mediagate
