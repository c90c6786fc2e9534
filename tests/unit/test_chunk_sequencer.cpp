#include "mediagate/stream/ChunkSequencer.h"
#include "mediagate/stream/RangePlanner.h"
#include "mediagate/common/Logger.h"

#include <cassert>
#include <memory>
#include <vector>

using namespace mediagate::stream;
using namespace mediagate::backend;
using namespace mediagate::common;

// Serves slices of an in-memory object synchronously.
class MemorySource : public ContentSource {
public:
    explicit MemorySource(std::string data) : data_(std::move(data)) {}

    void Stat(mediagate::network::EventLoop*, const std::string&, StatCallback cb) override {
        StatResult r;
        r.stat.size = data_.size();
        cb(r);
    }

    void FetchChunk(mediagate::network::EventLoop*, const std::string&, uint64_t offset, uint64_t length,
                    ChunkCallback cb) override {
        offsets.push_back(offset);
        if (failAt >= 0 && static_cast<int>(offsets.size()) - 1 == failAt) {
            cb(TransportError::kConnectionClosed, std::string());
            return;
        }
        if (hold) {
            held = cb;
            return;
        }
        std::string slice = offset < data_.size() ? data_.substr(offset, length + overfetch) : std::string();
        if (truncate > 0 && slice.size() > truncate) slice.resize(truncate);
        cb(TransportError::kNone, std::move(slice));
    }

    std::vector<uint64_t> offsets;
    int failAt{-1};
    size_t truncate{0};
    size_t overfetch{0};
    bool hold{false};
    ChunkCallback held;

private:
    std::string data_;
};

static std::string MakeObject(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>('a' + i % 26);
    return s;
}

static std::string Drain(const std::shared_ptr<ChunkSequencer>& seq, TransportError* last) {
    std::string out;
    *last = TransportError::kNone;
    while (!seq->done()) {
        seq->Next([&](TransportError e, std::string data) {
            *last = e;
            out += data;
        });
        if (*last != TransportError::kNone) break;
    }
    return out;
}

void testTrimmedSequence() {
    const std::string object = MakeObject(100);
    auto source = std::make_shared<MemorySource>(object);
    RangeSpec r;
    assert(RangePlanner::Parse("bytes=15-62", object.size(), &r) == RangeStatus::kOk);
    ChunkPlan plan = RangePlanner::PlanChunks(r, 16);
    assert(plan.partCount == 4);

    auto seq = std::make_shared<ChunkSequencer>(nullptr, source, "obj", plan);
    TransportError err;
    std::string got = Drain(seq, &err);
    assert(err == TransportError::kNone);
    assert(got == object.substr(15, 48));
    assert(seq->bytesDelivered() == 48);
    assert(seq->partsDelivered() == 4);
    assert((source->offsets == std::vector<uint64_t>{0, 16, 32, 48}));

    // Past the end: cancelled, no extra fetch.
    TransportError after = TransportError::kNone;
    seq->Next([&](TransportError e, std::string) { after = e; });
    assert(after == TransportError::kCancelled);
    assert(source->offsets.size() == 4);
    LOG_INFO << "Trimmed Sequence PASS";
}

void testSingleChunkBothCuts() {
    const std::string object = MakeObject(64);
    auto source = std::make_shared<MemorySource>(object);
    RangeSpec r;
    assert(RangePlanner::Parse("bytes=20-25", object.size(), &r) == RangeStatus::kOk);
    auto seq = std::make_shared<ChunkSequencer>(nullptr, source, "obj", RangePlanner::PlanChunks(r, 32));
    TransportError err;
    assert(Drain(seq, &err) == object.substr(20, 6));
    LOG_INFO << "Single Chunk Both Cuts PASS";
}

void testFetchErrorStopsSequence() {
    auto source = std::make_shared<MemorySource>(MakeObject(100));
    source->failAt = 1;
    RangeSpec r;
    RangePlanner::Parse("", 100, &r);
    auto seq = std::make_shared<ChunkSequencer>(nullptr, source, "obj", RangePlanner::PlanChunks(r, 32));
    TransportError err;
    std::string got = Drain(seq, &err);
    assert(err == TransportError::kConnectionClosed);
    assert(got.size() == 32);
    assert(seq->failed());
    assert(seq->done());
    assert(source->offsets.size() == 2);
    LOG_INFO << "Fetch Error Stops Sequence PASS";
}

void testShortChunk() {
    auto source = std::make_shared<MemorySource>(MakeObject(100));
    source->truncate = 10;
    RangeSpec r;
    RangePlanner::Parse("", 100, &r);
    auto seq = std::make_shared<ChunkSequencer>(nullptr, source, "obj", RangePlanner::PlanChunks(r, 32));
    TransportError err;
    Drain(seq, &err);
    assert(err == TransportError::kShortChunk);
    assert(seq->failed());
    LOG_INFO << "Short Chunk PASS";
}

void testCancelInFlight() {
    auto source = std::make_shared<MemorySource>(MakeObject(100));
    source->hold = true;
    RangeSpec r;
    RangePlanner::Parse("", 100, &r);
    auto seq = std::make_shared<ChunkSequencer>(nullptr, source, "obj", RangePlanner::PlanChunks(r, 32));

    TransportError first = TransportError::kNone;
    bool delivered = false;
    seq->Next([&](TransportError e, std::string) {
        first = e;
        delivered = true;
    });
    assert(!delivered);

    // A second pull while one is outstanding is refused.
    TransportError second = TransportError::kNone;
    seq->Next([&](TransportError e, std::string) { second = e; });
    assert(second == TransportError::kCancelled);

    seq->Cancel();
    source->held(TransportError::kNone, std::string(32, 'x'));
    assert(delivered);
    assert(first == TransportError::kCancelled);
    assert(seq->cancelled());
    assert(seq->done());
    assert(seq->bytesDelivered() == 0);
    assert(source->offsets.size() == 1);
    LOG_INFO << "Cancel In Flight PASS";
}

void testOversizedChunksAreCut() {
    const std::string object = MakeObject(100);
    auto source = std::make_shared<MemorySource>(object);
    source->overfetch = 5;
    RangeSpec r;
    assert(RangePlanner::Parse("bytes=15-62", object.size(), &r) == RangeStatus::kOk);
    auto seq = std::make_shared<ChunkSequencer>(nullptr, source, "obj", RangePlanner::PlanChunks(r, 16));
    TransportError err;
    std::string got = Drain(seq, &err);
    assert(err == TransportError::kNone);
    assert(got == object.substr(15, 48));
    assert(seq->bytesDelivered() == 48);
    LOG_INFO << "Oversized Chunks Are Cut PASS";
}

// Every range of every small object, at every small chunk size.
void testEveryRangeMatchesSlice() {
    size_t cases = 0;
    for (uint64_t size = 1; size <= 40; ++size) {
        const std::string object = MakeObject(size);
        auto source = std::make_shared<MemorySource>(object);
        for (uint64_t chunk = 1; chunk <= 12; ++chunk) {
            for (uint64_t from = 0; from < size; ++from) {
                for (uint64_t until = from; until < size; ++until) {
                    RangeSpec r;
                    const std::string header = "bytes=" + std::to_string(from) + "-" + std::to_string(until);
                    assert(RangePlanner::Parse(header, size, &r) == RangeStatus::kOk);
                    assert(r.from == from && r.until == until && r.length == until - from + 1);

                    const ChunkPlan plan = RangePlanner::PlanChunks(r, chunk);
                    assert(plan.offset % chunk == 0);
                    assert(plan.offset <= from && from < plan.offset + chunk);
                    assert(plan.firstCut < chunk);
                    assert(plan.lastCut >= 1 && plan.lastCut <= chunk);
                    assert(plan.partCount >= 1);

                    source->offsets.clear();
                    auto seq = std::make_shared<ChunkSequencer>(nullptr, source, "obj", plan);
                    TransportError err;
                    const std::string got = Drain(seq, &err);
                    assert(err == TransportError::kNone);
                    assert(got.size() == until - from + 1);
                    assert(got == object.substr(from, until - from + 1));
                    assert(source->offsets.size() == plan.partCount);
                    ++cases;
                }
            }
        }
    }
    assert(cases == 137760);
    LOG_INFO << "Every Range Matches Slice PASS (" << cases << " cases)";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testTrimmedSequence();
    testSingleChunkBothCuts();
    testFetchErrorStopsSequence();
    testShortChunk();
    testCancelInFlight();
    testOversizedChunksAreCut();
    testEveryRangeMatchesSlice();
    return 0;
}
