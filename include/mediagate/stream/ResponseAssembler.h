#pragma once

#include "mediagate/protocol/HttpResponse.h"
#include "mediagate/stream/ObjectResolver.h"
#include "mediagate/stream/RangePlanner.h"

#include <cstdint>
#include <string>

namespace mediagate {
namespace stream {

enum class Disposition {
    kAttachment,
    kInline,
};

// Status and header block for media responses. Bodies are streamed separately.
class ResponseAssembler {
public:
    // 206 for an explicit range, 200 otherwise.
    static void BuildMediaHead(const ObjectMetadata& meta,
                               const RangeSpec& range,
                               Disposition disposition,
                               protocol::HttpResponse* response);

    // 416 with "Content-Range: bytes */size" and no body.
    static void BuildNotSatisfiable(uint64_t size, protocol::HttpResponse* response);

    // Short text body; details belong in the log.
    static void BuildError(protocol::HttpResponse::HttpStatusCode code,
                           const std::string& message,
                           protocol::HttpResponse* response);

    // 204 answer to an OPTIONS preflight.
    static void BuildPreflight(protocol::HttpResponse* response);

    // Metadata type, else a guess from the display name, else application/octet-stream.
    static std::string ContentTypeFor(const ObjectMetadata& meta);

    static void AddCorsHeaders(protocol::HttpResponse* response);

    // Quote-safe form of a name for Content-Disposition.
    static std::string SanitizeFilename(const std::string& name);
};

} // namespace stream
} // namespace mediagate
