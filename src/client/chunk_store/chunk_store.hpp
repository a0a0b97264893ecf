#ifndef CHUNK_STORE_HPP
#define CHUNK_STORE_HPP

#include <set>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "rocksdb/db.h"

namespace chunk_store
{
    // One staged chunk of a source file that the receiver has not confirmed yet.
    struct BufferedChunk
    {
        std::string id;
        std::string fileName;
        int index = 0;
        std::string data;
    };

    // "<fileName>#<index padded to 10 digits>"; padding keeps key order equal to index order.
    std::string makeChunkId(const std::string &fileName, int index);

    // Durable client-side staging area backed by RocksDB.
    // Every write is synced, so a record is either fully present after a
    // crash or absent. RocksDB failures are raised as errors::StorageError.
    class ChunkStore
    {
    public:
        explicit ChunkStore(const std::string &dbPath);

        // ~/.chunkcp/<dbName>, creating ~/.chunkcp when needed.
        static std::string defaultPath(const std::string &dbName);

        // Upsert keyed by chunk.id.
        void put(const BufferedChunk &chunk);
        std::optional<BufferedChunk> get(const std::string &id) const;
        void remove(const std::string &id);
        void clear();

        // Chunks of one file ordered by index.
        std::vector<BufferedChunk> listByFile(const std::string &fileName) const;
        // Every chunk ordered by file name, then index.
        std::vector<BufferedChunk> listAll() const;
        std::set<std::string> listDistinctFileNames() const;
        std::size_t count() const;

        const std::string &path() const { return dbPath; }

    private:
        std::vector<BufferedChunk> scan(const std::string &keyPrefix) const;

        std::string dbPath;
        std::shared_ptr<rocksdb::DB> db;
    };
}

#endif // CHUNK_STORE_HPP
