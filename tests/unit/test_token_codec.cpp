#include "mediagate/stream/TokenCodec.h"
#include "mediagate/common/Logger.h"

#include <cassert>
#include <stdexcept>

using namespace mediagate::stream;
using namespace mediagate::common;

void testKnownSignature() {
    TokenCodec codec("change-me", true);
    assert(codec.Encode("BQACAgUAAx0") == "1cfca84b6923c2f1BQACAgUAAx0");
    auto id = codec.Decode("1cfca84b6923c2f1BQACAgUAAx0");
    assert(id && *id == "BQACAgUAAx0");
    // Hex case does not matter.
    id = codec.Decode("1CFCA84B6923C2F1BQACAgUAAx0");
    assert(id && *id == "BQACAgUAAx0");
    LOG_INFO << "Known Signature PASS";
}

void testForgedTokens() {
    TokenCodec codec("change-me", true);
    std::string token = codec.Encode("movie.mp4");
    assert(codec.Decode(token));

    std::string flipped = token;
    flipped[0] = flipped[0] == '0' ? '1' : '0';
    assert(!codec.Decode(flipped));

    // Same id, other secret.
    TokenCodec other("another-secret", true);
    assert(!other.Decode(token));

    assert(!codec.Decode(""));
    assert(!codec.Decode("1cfca84b6923c2f1"));
    assert(!codec.Decode("zzzzzzzzzzzzzzzzmovie.mp4"));
    assert(!codec.Decode(token.substr(0, 16) + "movie.mp5"));
    LOG_INFO << "Forged Tokens PASS";
}

void testObjectIdRules() {
    assert(TokenCodec::IsValidObjectId("a"));
    assert(TokenCodec::IsValidObjectId("file-01_v2.mkv~"));
    assert(TokenCodec::IsValidObjectId(std::string(256, 'x')));
    assert(!TokenCodec::IsValidObjectId(""));
    assert(!TokenCodec::IsValidObjectId(std::string(257, 'x')));
    assert(!TokenCodec::IsValidObjectId("a/b"));
    assert(!TokenCodec::IsValidObjectId("a b"));
    assert(!TokenCodec::IsValidObjectId("..%2f"));

    TokenCodec codec("s", true);
    bool threw = false;
    try {
        codec.Encode("bad/id");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    LOG_INFO << "Object Id Rules PASS";
}

void testVerificationOff() {
    TokenCodec codec("", false);
    assert(codec.Encode("clip.webm") == "clip.webm");
    auto id = codec.Decode("clip.webm");
    assert(id && *id == "clip.webm");
    assert(!codec.Decode("clip/webm"));
    LOG_INFO << "Verification Off PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testKnownSignature();
    testForgedTokens();
    testObjectIdRules();
    testVerificationOff();
    return 0;
}
