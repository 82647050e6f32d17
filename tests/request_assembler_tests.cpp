#include <gtest/gtest.h>

#include <cstdio>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "request_assembler.hpp"
#include "wfp_format.hpp"

using namespace winnow;

namespace {

FileRecord smallRecord(unsigned i) {
    char name[32];
    std::snprintf(name, sizeof(name), "src/f%04u.c", i);
    FileRecord r;
    r.path = name;
    r.md5 = std::string(32, 'c');
    r.size = 10;
    r.classification = FileClass::TooSmall;
    return r;
}

FileRecord recordWithSnippets(const std::string& path, size_t entries) {
    FileRecord r;
    r.path = path;
    r.md5 = std::string(32, 'e');
    r.size = 4096;
    for (size_t i = 0; i < entries; i++)
        r.fingerprint.push_back(
            FingerprintEntry{static_cast<uint32_t>(i / 2 + 1),
                             static_cast<uint32_t>(i * 2654435761u)});
    return r;
}

struct Collector {
    std::vector<ScanRequestBatch> batches;
    BatchHandler handler() {
        return [this](ScanRequestBatch&& b) { batches.push_back(std::move(b)); };
    }
};

}  // namespace

class RequestAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override { setLogLevel(LogLevel::Quiet); }
    void TearDown() override { setLogLevel(LogLevel::Info); }
};

TEST_F(RequestAssemblerTest, ThousandSmallFilesMakeTenBatches) {
    const size_t recordSize = serializeRecord(smallRecord(0)).size();
    ASSERT_EQ(recordSize, 53u);

    Collector out;
    RequestAssembler assembler(recordSize * 100, out.handler());
    for (unsigned i = 0; i < 1000; i++) assembler.add(smallRecord(i));
    assembler.flush();

    ASSERT_EQ(out.batches.size(), 10u);
    unsigned expected = 0;
    for (size_t b = 0; b < out.batches.size(); b++) {
        const ScanRequestBatch& batch = out.batches[b];
        EXPECT_EQ(batch.sequence, b);
        EXPECT_EQ(batch.fileCount(), 100u);
        EXPECT_FALSE(batch.oversized);
        EXPECT_EQ(countFilesInWfp(batch.payload), 100u);
        for (const std::string& path : batch.paths)
            EXPECT_EQ(path, smallRecord(expected++).path);
    }
    EXPECT_EQ(expected, 1000u);
    EXPECT_EQ(assembler.recordsAdded(), 1000u);
    EXPECT_EQ(assembler.batchesEmitted(), 10u);
}

TEST_F(RequestAssemblerTest, PayloadIsConcatenationOfRecords) {
    Collector out;
    RequestAssembler assembler(1 << 20, out.handler());
    const FileRecord a = recordWithSnippets("a.c", 6);
    const FileRecord b = smallRecord(7);
    assembler.add(a);
    assembler.add(b);
    assembler.flush();

    ASSERT_EQ(out.batches.size(), 1u);
    EXPECT_EQ(out.batches[0].payload, serializeRecord(a) + serializeRecord(b));
}

TEST_F(RequestAssemblerTest, BatchesStayWithinLimit) {
    const size_t limit = 600;
    Collector out;
    RequestAssembler assembler(limit, out.handler());
    for (unsigned i = 0; i < 200; i++)
        assembler.add(recordWithSnippets("f" + std::to_string(i), i % 17));
    assembler.flush();

    size_t files = 0;
    for (const ScanRequestBatch& batch : out.batches) {
        files += batch.fileCount();
        if (batch.oversized)
            EXPECT_EQ(batch.fileCount(), 1u);
        else
            EXPECT_LE(batch.payload.size(), limit);
    }
    EXPECT_EQ(files, 200u);
}

TEST_F(RequestAssemblerTest, OversizedRecordIsIsolatedAndNotTruncated) {
    const FileRecord big = recordWithSnippets("huge.c", 200);
    const std::string bigText = serializeRecord(big);
    const size_t limit = 500;
    ASSERT_GT(bigText.size(), limit);

    Collector out;
    RequestAssembler assembler(limit, out.handler());
    assembler.add(smallRecord(1));
    assembler.add(big);
    assembler.add(smallRecord(2));
    assembler.flush();

    ASSERT_EQ(out.batches.size(), 3u);
    EXPECT_EQ(out.batches[0].paths, std::vector<std::string>{"src/f0001.c"});
    EXPECT_FALSE(out.batches[0].oversized);

    EXPECT_EQ(out.batches[1].paths, std::vector<std::string>{"huge.c"});
    EXPECT_TRUE(out.batches[1].oversized);
    EXPECT_EQ(out.batches[1].payload, bigText);

    EXPECT_EQ(out.batches[2].paths, std::vector<std::string>{"src/f0002.c"});
    EXPECT_EQ(assembler.oversizedBatches(), 1u);
}

TEST_F(RequestAssemblerTest, FlushWithNothingPendingEmitsNothing) {
    Collector out;
    RequestAssembler assembler(1024, out.handler());
    assembler.flush();
    assembler.flush();
    EXPECT_TRUE(out.batches.empty());
}

TEST_F(RequestAssemblerTest, ConcurrentAddsKeepEveryRecordOnce) {
    std::mutex m;
    std::vector<ScanRequestBatch> batches;
    RequestAssembler assembler(2000, [&](ScanRequestBatch&& b) {
        std::lock_guard<std::mutex> lock(m);
        batches.push_back(std::move(b));
    });

    std::vector<std::thread> threads;
    for (unsigned t = 0; t < 8; t++) {
        threads.emplace_back([&assembler, t]() {
            for (unsigned i = 0; i < 250; i++)
                assembler.add(smallRecord(t * 250 + i));
        });
    }
    for (auto& th : threads) th.join();
    assembler.flush();

    std::set<std::string> seen;
    for (size_t b = 0; b < batches.size(); b++) {
        EXPECT_EQ(batches[b].sequence, b);
        EXPECT_LE(batches[b].payload.size(), 2000u);
        for (const auto& p : batches[b].paths) EXPECT_TRUE(seen.insert(p).second);
    }
    EXPECT_EQ(seen.size(), 2000u);
}

TEST_F(RequestAssemblerTest, RejectsBadArguments) {
    EXPECT_THROW(RequestAssembler(0, [](ScanRequestBatch&&) {}),
                 std::invalid_argument);
    EXPECT_THROW(RequestAssembler(10, BatchHandler{}), std::invalid_argument);
}

TEST_F(RequestAssemblerTest, RejectedBatchIsReportedNotDropped) {
    const size_t recordSize = serializeRecord(smallRecord(0)).size();
    std::vector<ScanRequestBatch> delivered;
    unsigned calls = 0;
    RequestAssembler assembler(recordSize * 2, [&](ScanRequestBatch&& b) {
        if (calls++ == 0) throw std::runtime_error("sink unavailable");
        delivered.push_back(std::move(b));
    });

    for (unsigned i = 0; i < 6; i++)
        EXPECT_NO_THROW(assembler.add(smallRecord(i)));
    assembler.flush();

    EXPECT_EQ(calls, 3u);
    EXPECT_EQ(assembler.batchesEmitted(), 3u);
    EXPECT_EQ(assembler.failedBatches(), 1u);
    EXPECT_EQ(assembler.undeliveredPaths(),
              (std::vector<std::string>{"src/f0000.c", "src/f0001.c"}));

    std::vector<std::string> paths;
    for (const auto& b : delivered)
        paths.insert(paths.end(), b.paths.begin(), b.paths.end());
    EXPECT_EQ(paths, (std::vector<std::string>{"src/f0002.c", "src/f0003.c",
                                               "src/f0004.c", "src/f0005.c"}));
    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_EQ(delivered[0].sequence, 1u);
    EXPECT_EQ(delivered[1].sequence, 2u);
}

TEST_F(RequestAssemblerTest, UnwritablePathLeavesBatchIntact) {
    Collector out;
    RequestAssembler assembler(1024, out.handler());
    assembler.add(smallRecord(1));
    FileRecord bad = smallRecord(2);
    bad.path = "src/a\nb.c";
    EXPECT_THROW(assembler.add(bad), std::invalid_argument);
    assembler.flush();

    ASSERT_EQ(out.batches.size(), 1u);
    EXPECT_EQ(out.batches[0].payload, serializeRecord(smallRecord(1)));
    EXPECT_EQ(assembler.recordsAdded(), 1u);
}
