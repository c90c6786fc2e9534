#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace mediagate {
namespace stream {

// URL tokens: <16 hex chars of HMAC-SHA256(secret, id)><id>.
// With verification off the token is the bare object id.
class TokenCodec {
public:
    static constexpr size_t kSignatureHexLength = 16;
    static constexpr size_t kMaxObjectIdLength = 256;

    TokenCodec(std::string secret, bool verify);

    bool verifying() const { return verify_; }

    // The object id, or nullopt for a malformed or forged token.
    std::optional<std::string> Decode(const std::string& token) const;

    // Throws std::invalid_argument if `objectId` is not a valid id.
    std::string Encode(const std::string& objectId) const;

    // [A-Za-z0-9._~-]{1,256}
    static bool IsValidObjectId(const std::string& objectId);

private:
    std::string Signature(const std::string& objectId) const;

    std::string secret_;
    bool verify_;
};

} // namespace stream
} // namespace mediagate
