#pragma once

#include <cstdint>
#include <string>

namespace mediagate {
namespace stream {

enum class RangeStatus {
    kOk,
    kNotSatisfiable,
};

// Inclusive byte range of an object. `length` is 0 only for a whole empty object.
struct RangeSpec {
    uint64_t from{0};
    uint64_t until{0};
    uint64_t length{0};
    bool explicitRange{false};
};

// Chunk-aligned fetch parameters for one RangeSpec.
//   offset     first chunk start, a multiple of chunkSize, <= from
//   firstCut   bytes dropped from the front of the first chunk
//   lastCut    bytes kept from the last chunk, 1..chunkSize
//   partCount  chunks to fetch
struct ChunkPlan {
    uint64_t offset{0};
    uint64_t firstCut{0};
    uint64_t lastCut{0};
    uint64_t partCount{0};
    uint64_t chunkSize{0};
};

class RangePlanner {
public:
    static constexpr uint64_t kDefaultChunkSize = 1024 * 1024;

    explicit RangePlanner(uint64_t chunkSize = kDefaultChunkSize);

    uint64_t chunkSize() const { return chunkSize_; }

    // `header` is the raw Range value, empty when the request had none.
    // Accepts "bytes=a-b", "bytes=a-" and "bytes=-n". Lists of ranges are refused.
    static RangeStatus Parse(const std::string& header, uint64_t size, RangeSpec* out);

    ChunkPlan Plan(const RangeSpec& range) const { return PlanChunks(range, chunkSize_); }

    static ChunkPlan PlanChunks(const RangeSpec& range, uint64_t chunkSize);

private:
    uint64_t chunkSize_;
};

} // namespace stream
} // namespace mediagate
