#include <catch2/catch.hpp>

#include "core/downloader/DownloadJob.hpp"

using namespace parafetch::core::downloader;

TEST_CASE("chunk follows the download path") {
    Chunk chunk;
    chunk.start = 4;
    chunk.end = 7;
    REQUIRE(chunk.length() == 4);

    chunk.advance(ChunkState::InProgress);
    chunk.advance(ChunkState::Completed);
    REQUIRE(chunk.state == ChunkState::Completed);
}

TEST_CASE("failed chunk can be reset for retry or aborted") {
    Chunk retried;
    retried.advance(ChunkState::InProgress);
    retried.advance(ChunkState::Failed);
    retried.advance(ChunkState::Pending);
    retried.advance(ChunkState::InProgress);
    retried.advance(ChunkState::Completed);
    REQUIRE(retried.state == ChunkState::Completed);

    Chunk aborted;
    aborted.advance(ChunkState::InProgress);
    aborted.advance(ChunkState::Failed);
    aborted.advance(ChunkState::Aborted);
    REQUIRE(aborted.state == ChunkState::Aborted);
}

TEST_CASE("pending chunk may be completed from disk") {
    Chunk chunk;
    chunk.advance(ChunkState::Completed);
    REQUIRE(chunk.state == ChunkState::Completed);
}

TEST_CASE("illegal transitions throw and leave the state alone") {
    Chunk pending;
    REQUIRE_THROWS_AS(pending.advance(ChunkState::Failed), std::logic_error);
    REQUIRE_THROWS_AS(pending.advance(ChunkState::Aborted), std::logic_error);
    REQUIRE(pending.state == ChunkState::Pending);

    Chunk done;
    done.advance(ChunkState::Completed);
    REQUIRE_THROWS_AS(done.advance(ChunkState::Pending), std::logic_error);
    REQUIRE_THROWS_AS(done.advance(ChunkState::InProgress), std::logic_error);

    Chunk inProgress;
    inProgress.advance(ChunkState::InProgress);
    REQUIRE_THROWS_AS(inProgress.advance(ChunkState::Pending), std::logic_error);

    Chunk aborted;
    aborted.advance(ChunkState::InProgress);
    aborted.advance(ChunkState::Failed);
    aborted.advance(ChunkState::Aborted);
    REQUIRE_THROWS_AS(aborted.advance(ChunkState::Pending), std::logic_error);
}

TEST_CASE("part file completeness") {
    PartFile part;
    part.expectedLength = 100;
    REQUIRE_FALSE(part.exists());
    REQUIRE_FALSE(part.isComplete());

    part.actualLength = 37;
    REQUIRE(part.exists());
    REQUIRE_FALSE(part.isComplete());

    part.actualLength = 101;
    REQUIRE_FALSE(part.isComplete());

    part.actualLength = 100;
    REQUIRE(part.isComplete());
}

TEST_CASE("progress counters add and subtract") {
    ProgressCounters counters;
    counters.addBytes(10);
    counters.addBytes(5);
    counters.removeBytes(3);
    counters.chunkCompleted();
    counters.chunkFailed();

    REQUIRE(counters.bytes() == 12);
    REQUIRE(counters.completed() == 1);
    REQUIRE(counters.failed() == 1);

    counters.reset();
    REQUIRE(counters.bytes() == 0);
    REQUIRE(counters.completed() == 0);
}
