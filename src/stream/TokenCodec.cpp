#include "mediagate/stream/TokenCodec.h"
#include "mediagate/common/Logger.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <stdexcept>

namespace mediagate {
namespace stream {

TokenCodec::TokenCodec(std::string secret, bool verify)
    : secret_(std::move(secret)), verify_(verify) {
}

bool TokenCodec::IsValidObjectId(const std::string& objectId) {
    if (objectId.empty() || objectId.size() > kMaxObjectIdLength) return false;
    for (unsigned char c : objectId) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '~' || c == '-') continue;
        return false;
    }
    return true;
}

std::string TokenCodec::Signature(const std::string& objectId) const {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
             reinterpret_cast<const unsigned char*>(objectId.data()), objectId.size(), md, &mdLen) == nullptr ||
        mdLen < kSignatureHexLength / 2) {
        LOG_ERROR << "HMAC-SHA256 failed";
        return std::string();
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(kSignatureHexLength);
    for (size_t i = 0; i < kSignatureHexLength / 2; ++i) {
        out.push_back(hex[(md[i] >> 4) & 0xF]);
        out.push_back(hex[md[i] & 0xF]);
    }
    return out;
}

std::optional<std::string> TokenCodec::Decode(const std::string& token) const {
    if (!verify_) {
        if (!IsValidObjectId(token)) return std::nullopt;
        return token;
    }
    if (token.size() <= kSignatureHexLength) return std::nullopt;

    std::string given = token.substr(0, kSignatureHexLength);
    for (char& c : given) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    std::string objectId = token.substr(kSignatureHexLength);
    if (!IsValidObjectId(objectId)) return std::nullopt;

    const std::string expected = Signature(objectId);
    if (expected.size() != kSignatureHexLength ||
        CRYPTO_memcmp(expected.data(), given.data(), kSignatureHexLength) != 0) {
        LOG_DEBUG << "Token signature mismatch for object " << objectId;
        return std::nullopt;
    }
    return objectId;
}

std::string TokenCodec::Encode(const std::string& objectId) const {
    if (!IsValidObjectId(objectId)) {
        throw std::invalid_argument("invalid object id: " + objectId);
    }
    if (!verify_) return objectId;
    return Signature(objectId) + objectId;
}

} // namespace stream
} // namespace mediagate
