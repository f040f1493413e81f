#include "fetcher/downloader.hpp"

#include "downloader_fixture.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace fetcher;
using namespace fetcher::testing;

class ResumeTest : public DownloaderTestBase {};

TEST_F(ResumeTest, PartialFileIssuesRangeRequest) {
    writeFile(dir / "r.bin.tmp", "prior");
    const auto d = add("r.bin");

    ASSERT_EQ(http->callCount(), 1u);
    EXPECT_EQ(http->call(0).options.headers.at("Range"), "bytes=5-");
    EXPECT_EQ(d->completedLength(), 5u);

    http->respond(0, 206, 3);
    EXPECT_EQ(d->totalLength(), 8u);
    http->send(0, "new");
    http->end(0);

    EXPECT_EQ(d->status(), DownloadStatus::complete);
    EXPECT_EQ(readFile(d->path()), "priornew");
    EXPECT_EQ(d->completedLength(), 8u);
    EXPECT_FALSE(std::filesystem::exists(d->partialPath()));
}

TEST_F(ResumeTest, EmptyPartialFileIsNotResumed) {
    writeFile(dir / "r.bin.tmp", "");
    add("r.bin");
    EXPECT_EQ(http->call(0).options.headers.count("Range"), 0u);
}

TEST_F(ResumeTest, PauseThenUnpauseCompletes) {
    recordEvents();
    const auto d = add("movie.mkv");
    http->respond(0, 200, 10);
    http->send(0, "12345");

    ASSERT_TRUE(downloader().pause(d));
    downloader().poll(std::chrono::milliseconds{0});

    std::error_code ec;
    EXPECT_GT(std::filesystem::file_size(d->partialPath(), ec), 0u);
    EXPECT_FALSE(ec);
    EXPECT_FALSE(std::filesystem::exists(d->path()));

    ASSERT_TRUE(downloader().unpause(d));
    EXPECT_EQ(d->status(), DownloadStatus::active);
    ASSERT_EQ(http->callCount(), 2u);
    EXPECT_EQ(http->call(1).options.headers.at("Range"), "bytes=5-");

    http->respond(1, 206, 5);
    EXPECT_EQ(d->completedLength(), 5u);
    EXPECT_EQ(d->totalLength(), 10u);
    http->send(1, "67890");
    http->end(1);

    EXPECT_EQ(d->status(), DownloadStatus::complete);
    EXPECT_EQ(d->totalLength(), 10u);
    EXPECT_EQ(readFile(d->path()), "1234567890");
    EXPECT_EQ(eventsFor(d),
              (std::vector<EventKind>{EventKind::activate, EventKind::progress, EventKind::pause,
                                      EventKind::unpause, EventKind::activate, EventKind::progress,
                                      EventKind::complete, EventKind::done}));
}

TEST_F(ResumeTest, IgnoredRangeRestartsFromZero) {
    writeFile(dir / "r.bin.tmp", "stale");
    const auto d = add("r.bin");
    EXPECT_EQ(http->call(0).options.headers.at("Range"), "bytes=5-");

    http->respond(0, 200, 4);
    EXPECT_EQ(d->completedLength(), 0u);
    EXPECT_EQ(d->totalLength(), 4u);
    http->send(0, "full");
    http->end(0);

    EXPECT_EQ(d->status(), DownloadStatus::complete);
    EXPECT_EQ(readFile(d->path()), "full");
}

TEST_F(ResumeTest, RetryAfterNetworkFailureContinuesPartial) {
    const auto first = add("big.iso");
    http->respond(0, 200, 6);
    http->send(0, "abc");
    http->fail(0, HttpError{HttpErrorKind::network, 0, "Connection reset by peer"});

    EXPECT_EQ(first->status(), DownloadStatus::error);
    EXPECT_STREQ(first->error()->what(), "Connection reset by peer");
    EXPECT_EQ(readFile(first->partialPath()), "abc");

    const auto retry = add("big.iso");
    ASSERT_EQ(http->callCount(), 2u);
    EXPECT_EQ(http->call(1).options.headers.at("Range"), "bytes=3-");
    http->respond(1, 206, 3);
    http->send(1, "def");
    http->end(1);

    EXPECT_EQ(retry->status(), DownloadStatus::complete);
    EXPECT_EQ(readFile(retry->path()), "abcdef");
}

TEST_F(ResumeTest, UnpausedIntoWaitingResumesWhenAdmitted) {
    const auto a = add("a.bin");
    http->respond(0, 200, 4);
    http->send(0, "ab");
    downloader().pause(a);

    const auto b = add("b.bin");
    EXPECT_EQ(b->status(), DownloadStatus::active);
    downloader().unpause(a);
    EXPECT_EQ(a->status(), DownloadStatus::waiting);

    http->serve(1, "b");
    EXPECT_EQ(a->status(), DownloadStatus::active);
    ASSERT_EQ(http->callCount(), 3u);
    EXPECT_EQ(http->call(2).options.headers.at("Range"), "bytes=2-");
    http->respond(2, 206, 2);
    http->send(2, "cd");
    http->end(2);
    EXPECT_EQ(readFile(a->path()), "abcd");
}
