#include <gtest/gtest.h>
#include <memory>
#include "client/chunk_store/chunk_store.hpp"
#include "test_util.hpp"

using chunk_store::BufferedChunk;
using chunk_store::ChunkStore;

namespace
{
    BufferedChunk chunk(const std::string &file, int index, const std::string &data)
    {
        return BufferedChunk{chunk_store::makeChunkId(file, index), file, index, data};
    }
}

class ChunkStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store = std::make_unique<ChunkStore>(dir.file("db"));
    }

    test_util::TempDir dir{"chunk_store"};
    std::unique_ptr<ChunkStore> store;
};

TEST_F(ChunkStoreTest, ChunkIdIsZeroPadded)
{
    EXPECT_EQ(chunk_store::makeChunkId("a.txt", 7), "a.txt#0000000007");
}

TEST_F(ChunkStoreTest, PutGetRemove)
{
    std::string binary("\x00\x01\xff\x00z", 5);
    store->put(chunk("a.txt", 0, binary));

    auto got = store->get(chunk_store::makeChunkId("a.txt", 0));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->data, binary);
    EXPECT_EQ(got->fileName, "a.txt");
    EXPECT_EQ(got->index, 0);

    store->remove(got->id);
    EXPECT_FALSE(store->get(got->id).has_value());
    EXPECT_EQ(store->count(), 0u);
}

TEST_F(ChunkStoreTest, PutIsUpsert)
{
    store->put(chunk("a.txt", 0, "old"));
    store->put(chunk("a.txt", 0, "new"));
    EXPECT_EQ(store->count(), 1u);
    EXPECT_EQ(store->get(chunk_store::makeChunkId("a.txt", 0))->data, "new");
}

TEST_F(ChunkStoreTest, RemovingMissingIdIsHarmless)
{
    EXPECT_NO_THROW(store->remove("nothing#0000000000"));
}

TEST_F(ChunkStoreTest, ListByFileIsOrderedAndScoped)
{
    for (int i : {11, 2, 0})
    {
        store->put(chunk("a.txt", i, "a" + std::to_string(i)));
    }
    // Shares the "a.txt" prefix but is a different file
    store->put(chunk("a.txt.bak", 1, "x"));

    auto chunks = store->listByFile("a.txt");
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].index, 0);
    EXPECT_EQ(chunks[1].index, 2);
    EXPECT_EQ(chunks[2].index, 11);
}

TEST_F(ChunkStoreTest, ListAllGroupsByFileThenIndex)
{
    store->put(chunk("b.txt", 1, "b1"));
    store->put(chunk("a.txt", 1, "a1"));
    store->put(chunk("b.txt", 0, "b0"));
    store->put(chunk("a.txt", 0, "a0"));

    auto all = store->listAll();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].data, "a0");
    EXPECT_EQ(all[1].data, "a1");
    EXPECT_EQ(all[2].data, "b0");
    EXPECT_EQ(all[3].data, "b1");

    EXPECT_EQ(store->listDistinctFileNames(), (std::set<std::string>{"a.txt", "b.txt"}));
}

TEST_F(ChunkStoreTest, ClearDropsEverything)
{
    store->put(chunk("a.txt", 0, "a"));
    store->put(chunk("b.txt", 0, "b"));
    store->clear();
    EXPECT_EQ(store->count(), 0u);
    EXPECT_TRUE(store->listDistinctFileNames().empty());
}

TEST_F(ChunkStoreTest, RecordsSurviveReopen)
{
    store->put(chunk("a.txt", 4, "durable"));
    store.reset();

    store = std::make_unique<ChunkStore>(dir.file("db"));
    auto got = store->get(chunk_store::makeChunkId("a.txt", 4));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->data, "durable");
}
