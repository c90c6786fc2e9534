#include "mediagate/stream/RangePlanner.h"
#include "mediagate/common/Logger.h"

#include <cassert>

using namespace mediagate::stream;
using namespace mediagate::common;

static const uint64_t kMiB = 1024 * 1024;

void testNoRangeHeader() {
    RangeSpec r;
    assert(RangePlanner::Parse("", 3000000, &r) == RangeStatus::kOk);
    assert(r.from == 0);
    assert(r.until == 2999999);
    assert(r.length == 3000000);
    assert(!r.explicitRange);

    assert(RangePlanner::Parse("", 0, &r) == RangeStatus::kOk);
    assert(r.length == 0);
    LOG_INFO << "No Range Header PASS";
}

void testExplicitForms() {
    RangeSpec r;
    assert(RangePlanner::Parse("bytes=500000-1500000", 3000000, &r) == RangeStatus::kOk);
    assert(r.from == 500000 && r.until == 1500000 && r.length == 1000001);
    assert(r.explicitRange);

    assert(RangePlanner::Parse("bytes=100-", 1000, &r) == RangeStatus::kOk);
    assert(r.from == 100 && r.until == 999 && r.length == 900);

    assert(RangePlanner::Parse("bytes=-200", 1000, &r) == RangeStatus::kOk);
    assert(r.from == 800 && r.until == 999);

    // Suffix longer than the object covers all of it.
    assert(RangePlanner::Parse("bytes=-5000", 1000, &r) == RangeStatus::kOk);
    assert(r.from == 0 && r.until == 999);

    assert(RangePlanner::Parse(" bytes = 0-0 ", 10, &r) == RangeStatus::kOk);
    assert(r.length == 1);
    LOG_INFO << "Explicit Forms PASS";
}

void testRefused() {
    RangeSpec r;
    assert(RangePlanner::Parse("bytes=0-1000", 1000, &r) == RangeStatus::kNotSatisfiable);
    assert(RangePlanner::Parse("bytes=500-100", 1000, &r) == RangeStatus::kNotSatisfiable);
    assert(RangePlanner::Parse("bytes=1000-", 1000, &r) == RangeStatus::kNotSatisfiable);
    assert(RangePlanner::Parse("bytes=0-1,5-9", 1000, &r) == RangeStatus::kNotSatisfiable);
    assert(RangePlanner::Parse("items=0-1", 1000, &r) == RangeStatus::kNotSatisfiable);
    assert(RangePlanner::Parse("bytes=abc-", 1000, &r) == RangeStatus::kNotSatisfiable);
    assert(RangePlanner::Parse("bytes=-0", 1000, &r) == RangeStatus::kNotSatisfiable);
    assert(RangePlanner::Parse("bytes=0-", 0, &r) == RangeStatus::kNotSatisfiable);
    assert(RangePlanner::Parse("bytes=99999999999999999999999-", 1000, &r) == RangeStatus::kNotSatisfiable);
    LOG_INFO << "Refused Ranges PASS";
}

void testPlanStraddlingChunks() {
    RangePlanner planner(kMiB);
    RangeSpec r;
    assert(RangePlanner::Parse("bytes=500000-1500000", 3000000, &r) == RangeStatus::kOk);
    ChunkPlan p = planner.Plan(r);
    assert(p.offset == 0);
    assert(p.firstCut == 500000);
    assert(p.lastCut == 451425);
    assert(p.partCount == 2);
    // Bytes delivered: (chunk - firstCut) + lastCut.
    assert((kMiB - p.firstCut) + p.lastCut == r.length);
    LOG_INFO << "Plan Straddling Chunks PASS";
}

void testPlanSingleChunk() {
    RangePlanner planner(kMiB);
    RangeSpec r;
    assert(RangePlanner::Parse("bytes=1048576-1048580", 3000000, &r) == RangeStatus::kOk);
    ChunkPlan p = planner.Plan(r);
    assert(p.offset == kMiB);
    assert(p.firstCut == 0);
    assert(p.lastCut == 5);
    assert(p.partCount == 1);

    // Range ending exactly on a chunk boundary.
    assert(RangePlanner::Parse("bytes=0-1048575", 3000000, &r) == RangeStatus::kOk);
    p = planner.Plan(r);
    assert(p.partCount == 1);
    assert(p.lastCut == kMiB);
    LOG_INFO << "Plan Single Chunk PASS";
}

void testPlanWholeObject() {
    RangePlanner planner(kMiB);
    RangeSpec r;
    assert(RangePlanner::Parse("", 3000000, &r) == RangeStatus::kOk);
    ChunkPlan p = planner.Plan(r);
    assert(p.offset == 0);
    assert(p.firstCut == 0);
    assert(p.partCount == 3);
    assert(p.lastCut == 3000000 - 2 * kMiB);

    assert(RangePlanner::Parse("", 0, &r) == RangeStatus::kOk);
    p = planner.Plan(r);
    assert(p.partCount == 0);

    RangePlanner fallback(0);
    assert(fallback.chunkSize() == RangePlanner::kDefaultChunkSize);
    LOG_INFO << "Plan Whole Object PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testNoRangeHeader();
    testExplicitForms();
    testRefused();
    testPlanStraddlingChunks();
    testPlanSingleChunk();
    testPlanWholeObject();
    return 0;
}
