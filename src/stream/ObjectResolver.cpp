#include "mediagate/stream/ObjectResolver.h"
#include "mediagate/common/Logger.h"

namespace mediagate {
namespace stream {

void TokenResolver::Resolve(network::EventLoop* loop,
                            const std::string& handle,
                            const std::shared_ptr<backend::ContentSource>& session,
                            ResolveCallback cb) {
    std::optional<std::string> objectId = codec_.Decode(handle);
    if (!objectId) {
        ResolveResult result;
        result.status = ResolveStatus::kInvalidHandle;
        cb(result);
        return;
    }

    const std::string id = *objectId;
    session->Stat(loop, id, [id, cb](const backend::StatResult& stat) {
        ResolveResult result;
        switch (stat.error) {
            case backend::TransportError::kNone:
                result.status = ResolveStatus::kOk;
                result.metadata.size = stat.stat.size;
                if (!stat.stat.contentType.empty()) result.metadata.mimeType = stat.stat.contentType;
                result.metadata.displayName = stat.stat.name.empty() ? id : stat.stat.name;
                result.metadata.objectId = id;
                break;
            case backend::TransportError::kNotFound:
                result.status = ResolveStatus::kObjectNotFound;
                break;
            default:
                LOG_WARN << "Resolving " << id << " failed: " << backend::TransportErrorName(stat.error);
                result.status = ResolveStatus::kBackendFailure;
                result.transportError = stat.error;
                break;
        }
        cb(result);
    });
}

} // namespace stream
} // namespace mediagate
