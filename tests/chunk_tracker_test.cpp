#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <vector>
#include "server/chunk_tracker/chunk_tracker.hpp"
#include "test_util.hpp"

using chunk_tracker::ChunkTracker;

class ChunkTrackerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        tracker = std::make_unique<ChunkTracker>(dir.str());
    }

    test_util::TempDir dir{"tracker"};
    std::unique_ptr<ChunkTracker> tracker;
};

TEST_F(ChunkTrackerTest, LedgerLivesInOutputDir)
{
    EXPECT_TRUE(std::filesystem::is_directory(ChunkTracker::dbPathFor(dir.str())));
}

TEST_F(ChunkTrackerTest, MarkIsIdempotent)
{
    tracker->markReceived("a.txt", 0);
    tracker->markReceived("a.txt", 0);
    tracker->markReceived("a.txt", 2);

    EXPECT_TRUE(tracker->isReceived("a.txt", 0));
    EXPECT_FALSE(tracker->isReceived("a.txt", 1));
    EXPECT_EQ(tracker->receivedSet("a.txt"), (std::set<int>{0, 2}));
}

TEST_F(ChunkTrackerTest, FilesDoNotShareRecords)
{
    tracker->markReceived("a", 1);
    tracker->markReceived("ab", 3);

    EXPECT_EQ(tracker->receivedSet("a"), (std::set<int>{1}));
    EXPECT_EQ(tracker->receivedSet("ab"), (std::set<int>{3}));
    EXPECT_TRUE(tracker->receivedSet("unknown").empty());
}

TEST_F(ChunkTrackerTest, IndicesAreReturnedNumerically)
{
    for (int i : {10, 9, 100, 0})
    {
        tracker->markReceived("f", i);
    }
    auto received = tracker->receivedSet("f");
    std::vector<int> ordered(received.begin(), received.end());
    EXPECT_EQ(ordered, (std::vector<int>{0, 9, 10, 100}));
}

TEST_F(ChunkTrackerTest, CommittedLengthFollowsFirstMark)
{
    EXPECT_FALSE(tracker->committedLength("f").has_value());

    tracker->markReceived("f", 0, 1000);
    EXPECT_EQ(tracker->committedLength("f"), std::optional<std::uint64_t>(1000));

    tracker->markReceived("f", 1, 2000);
    EXPECT_EQ(tracker->committedLength("f"), std::optional<std::uint64_t>(2000));

    // A duplicate mark does not move the committed length
    tracker->markReceived("f", 0, 5);
    EXPECT_EQ(tracker->committedLength("f"), std::optional<std::uint64_t>(2000));
}

TEST_F(ChunkTrackerTest, ResetOneFile)
{
    tracker->markReceived("a", 0, 10);
    tracker->markReceived("b", 0, 20);

    tracker->reset("a");

    EXPECT_TRUE(tracker->receivedSet("a").empty());
    EXPECT_FALSE(tracker->committedLength("a").has_value());
    EXPECT_EQ(tracker->receivedSet("b"), (std::set<int>{0}));
    EXPECT_EQ(tracker->committedLength("b"), std::optional<std::uint64_t>(20));
}

TEST_F(ChunkTrackerTest, ResetEverything)
{
    tracker->markReceived("a", 0, 10);
    tracker->markReceived("b", 4, 20);

    tracker->reset();

    EXPECT_TRUE(tracker->receivedSet("a").empty());
    EXPECT_TRUE(tracker->receivedSet("b").empty());
    EXPECT_FALSE(tracker->committedLength("b").has_value());
}

TEST_F(ChunkTrackerTest, RecordsSurviveReopen)
{
    tracker->markReceived("a", 3, 42);
    tracker.reset();

    tracker = std::make_unique<ChunkTracker>(dir.str());
    EXPECT_TRUE(tracker->isReceived("a", 3));
    EXPECT_EQ(tracker->committedLength("a"), std::optional<std::uint64_t>(42));
}
