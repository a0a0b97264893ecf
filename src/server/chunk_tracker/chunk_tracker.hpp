#ifndef CHUNK_TRACKER_HPP
#define CHUNK_TRACKER_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include "rocksdb/db.h"

namespace chunk_tracker
{
    // Durable ledger of (target filename, chunk index) pairs already appended
    // to their target file, stored in <output_dir>/.chunkcp_chunks.
    //
    // Alongside the ledger it keeps each file's committed length: the target
    // file size at the last successful mark, written in the same batch as the
    // record. The receiver uses it to cut off bytes left by an append whose
    // mark never committed.
    class ChunkTracker
    {
    public:
        explicit ChunkTracker(const std::string &outputDir);

        static std::string dbPathFor(const std::string &outputDir);

        // Inserting an existing pair is a no-op.
        void markReceived(const std::string &filename, int index);
        void markReceived(const std::string &filename, int index, std::uint64_t committedLength);

        bool isReceived(const std::string &filename, int index) const;
        std::set<int> receivedSet(const std::string &filename) const;
        std::optional<std::uint64_t> committedLength(const std::string &filename) const;

        // Drops the records of one file, or of every file when filename is empty.
        void reset(const std::optional<std::string> &filename = std::nullopt);

    private:
        void mark(const std::string &filename, int index, const std::optional<std::uint64_t> &committedLength);

        std::shared_ptr<rocksdb::DB> db;
        std::mutex write_mutex;
    };
}

#endif // CHUNK_TRACKER_HPP
