#include <thread>
#include <gtest/gtest.h>
#include <sift/ingest/ingestion_queue.h>

using namespace sift;
using namespace sift::ingest;
using namespace std::chrono_literals;

namespace {

IngestionJob makeJob(const std::string& documentId, std::optional<std::string> batch = {}) {
    IngestionJob job;
    job.documentId = documentId;
    job.path = "/" + documentId + ".txt";
    job.options.scopeId = "scope";
    job.batchId = std::move(batch);
    return job;
}

} // namespace

TEST(IngestionQueueTest, AssignsJobIdAndQueuedStatus) {
    IngestionQueue queue(4);
    ASSERT_TRUE(queue.tryEnqueue(makeJob("doc-1")));

    auto all = queue.allStatuses();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_FALSE(all[0].jobId.empty());
    EXPECT_EQ(all[0].documentId, "doc-1");
    EXPECT_EQ(all[0].state, JobState::Queued);
    EXPECT_EQ(queue.activeJobFor("doc-1"), all[0].jobId);
}

TEST(IngestionQueueTest, FullQueueReturnsBackpressureWithoutBlocking) {
    IngestionQueue queue(2);
    ASSERT_TRUE(queue.tryEnqueue(makeJob("a")));
    ASSERT_TRUE(queue.tryEnqueue(makeJob("b")));

    auto full = queue.tryEnqueue(makeJob("c"));
    ASSERT_FALSE(full);
    EXPECT_EQ(full.error().code, ErrorCode::QueueFull);
    EXPECT_EQ(queue.size(), 2u);

    auto started = std::chrono::steady_clock::now();
    auto timed = queue.enqueue(makeJob("d"), 50ms);
    ASSERT_FALSE(timed);
    EXPECT_EQ(timed.error().code, ErrorCode::QueueFull);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(queue.size(), 2u);
}

TEST(IngestionQueueTest, BlockingEnqueueProceedsWhenSpaceFrees) {
    IngestionQueue queue(1);
    ASSERT_TRUE(queue.tryEnqueue(makeJob("a")));

    std::jthread consumer([&queue] {
        std::this_thread::sleep_for(20ms);
        std::stop_source never;
        auto job = queue.dequeue(never.get_token());
        EXPECT_TRUE(job.has_value());
    });
    EXPECT_TRUE(queue.enqueue(makeJob("b"), 5s));
}

TEST(IngestionQueueTest, DequeueIsFifoAndStopsOnRequest) {
    IngestionQueue queue(8);
    ASSERT_TRUE(queue.tryEnqueue(makeJob("first")));
    ASSERT_TRUE(queue.tryEnqueue(makeJob("second")));

    std::stop_source stop;
    EXPECT_EQ(queue.dequeue(stop.get_token())->job.documentId, "first");
    EXPECT_EQ(queue.dequeue(stop.get_token())->job.documentId, "second");

    std::jthread stopper([&stop] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
    });
    EXPECT_FALSE(queue.dequeue(stop.get_token()).has_value());
}

TEST(IngestionQueueTest, TerminalStatusNeverChanges) {
    IngestionQueue queue(4);
    ASSERT_TRUE(queue.tryEnqueue(makeJob("doc")));
    auto jobId = *queue.activeJobFor("doc");

    ASSERT_TRUE(queue.markProcessing(jobId));
    ASSERT_TRUE(queue.updateProgress(jobId, IngestionPhase::Embedding, 55));
    auto done = queue.markCompleted(jobId);
    ASSERT_TRUE(done);
    EXPECT_EQ(done->percentComplete, 100);

    EXPECT_FALSE(queue.markFailed(jobId, "late failure"));
    EXPECT_FALSE(queue.markCancelled(jobId, "late cancel"));
    EXPECT_FALSE(queue.updateProgress(jobId, IngestionPhase::Storing, 90));

    auto st = queue.status(jobId);
    ASSERT_TRUE(st);
    EXPECT_EQ(st->state, JobState::Completed);
    EXPECT_TRUE(st->errorMessage.empty());
    EXPECT_TRUE(st->completedAt.has_value());
}

TEST(IngestionQueueTest, CancelForDocumentWithoutJobDoesNothing) {
    IngestionQueue queue(4);
    EXPECT_FALSE(queue.cancelForDocument("nobody"));
    EXPECT_FALSE(queue.activeJobFor("nobody").has_value());
}

TEST(IngestionQueueTest, CancelReachesQueuedJobScope) {
    IngestionQueue queue(4);
    ASSERT_TRUE(queue.tryEnqueue(makeJob("doc")));
    EXPECT_TRUE(queue.cancelForDocument("doc"));

    std::stop_source stop;
    auto job = queue.dequeue(stop.get_token());
    ASSERT_TRUE(job);
    EXPECT_TRUE(job->stop.stop_requested());
}

TEST(IngestionQueueTest, ReleaseIgnoresStaleJobId) {
    IngestionQueue queue(4);
    ASSERT_TRUE(queue.tryEnqueue(makeJob("doc")));
    auto first = *queue.activeJobFor("doc");
    ASSERT_TRUE(queue.tryEnqueue(makeJob("doc")));
    auto second = *queue.activeJobFor("doc");
    ASSERT_NE(first, second);

    queue.releaseDocument("doc", first);
    EXPECT_EQ(queue.activeJobFor("doc"), second);
    queue.releaseDocument("doc", second);
    EXPECT_FALSE(queue.activeJobFor("doc").has_value());
}

TEST(IngestionQueueTest, BatchStatusesAndCleanup) {
    IngestionQueue queue(8);
    ASSERT_TRUE(queue.tryEnqueue(makeJob("a", "batch-1")));
    ASSERT_TRUE(queue.tryEnqueue(makeJob("b", "batch-1")));
    ASSERT_TRUE(queue.tryEnqueue(makeJob("c", "batch-2")));
    EXPECT_EQ(queue.batchStatuses("batch-1").size(), 2u);

    auto jobA = *queue.activeJobFor("a");
    ASSERT_TRUE(queue.markFailed(jobA, "bad"));
    std::this_thread::sleep_for(5ms);
    EXPECT_EQ(queue.cleanupOldStatuses(1ms), 1u);
    EXPECT_FALSE(queue.status(jobA).has_value());
    EXPECT_EQ(queue.allStatuses().size(), 2u);
}
