#include "mediagate/stream/RangePlanner.h"
#include "mediagate/common/Logger.h"

#include <cctype>
#include <limits>

namespace mediagate {
namespace stream {

namespace {

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Plain decimal, no sign, no overflow.
bool ParseOffset(const std::string& s, uint64_t* out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
        const uint64_t digit = c - '0';
        if (v > (std::numeric_limits<uint64_t>::max() - digit) / 10) return false;
        v = v * 10 + digit;
    }
    *out = v;
    return true;
}

} // namespace

RangePlanner::RangePlanner(uint64_t chunkSize)
    : chunkSize_(chunkSize == 0 ? kDefaultChunkSize : chunkSize) {
}

RangeStatus RangePlanner::Parse(const std::string& header, uint64_t size, RangeSpec* out) {
    const std::string value = Trim(header);
    if (value.empty()) {
        out->from = 0;
        out->until = size == 0 ? 0 : size - 1;
        out->length = size;
        out->explicitRange = false;
        return RangeStatus::kOk;
    }

    const size_t eq = value.find('=');
    if (eq == std::string::npos || Trim(value.substr(0, eq)) != "bytes") {
        LOG_DEBUG << "Unsupported Range unit: " << value;
        return RangeStatus::kNotSatisfiable;
    }
    const std::string spec = Trim(value.substr(eq + 1));
    if (spec.find(',') != std::string::npos) {
        LOG_DEBUG << "Multi-range request refused: " << value;
        return RangeStatus::kNotSatisfiable;
    }
    const size_t dash = spec.find('-');
    if (dash == std::string::npos) return RangeStatus::kNotSatisfiable;
    const std::string first = Trim(spec.substr(0, dash));
    const std::string last = Trim(spec.substr(dash + 1));

    uint64_t from = 0;
    uint64_t until = 0;
    if (first.empty()) {
        // Suffix form: the last N bytes.
        uint64_t suffix = 0;
        if (!ParseOffset(last, &suffix) || suffix == 0 || size == 0) return RangeStatus::kNotSatisfiable;
        if (suffix > size) suffix = size;
        from = size - suffix;
        until = size - 1;
    } else {
        if (!ParseOffset(first, &from)) return RangeStatus::kNotSatisfiable;
        if (last.empty()) {
            if (size == 0) return RangeStatus::kNotSatisfiable;
            until = size - 1;
        } else if (!ParseOffset(last, &until)) {
            return RangeStatus::kNotSatisfiable;
        }
        if (until >= size || until < from) return RangeStatus::kNotSatisfiable;
    }

    out->from = from;
    out->until = until;
    out->length = until - from + 1;
    out->explicitRange = true;
    return RangeStatus::kOk;
}

ChunkPlan RangePlanner::PlanChunks(const RangeSpec& range, uint64_t chunkSize) {
    ChunkPlan plan;
    plan.chunkSize = chunkSize;
    if (range.length == 0 || chunkSize == 0) return plan;

    plan.offset = range.from - range.from % chunkSize;
    plan.firstCut = range.from - plan.offset;
    plan.lastCut = range.until % chunkSize + 1;
    plan.partCount = (range.until / chunkSize + 1) - plan.offset / chunkSize;
    return plan;
}

} // namespace stream
} // namespace mediagate
