#include "chunk_tracker.hpp"
#include "common/errors/errors.hpp"
#include "logger/Mylogger.hpp"
#include "nlohmann/json.hpp"
#include "rocksdb/write_batch.h"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace chunk_tracker
{
    namespace
    {
        const std::string kRecordPrefix = "recv:";
        const std::string kLengthPrefix = "len:";
        const std::size_t kIndexWidth = 10;

        // The NUL separator cannot occur in a filename, so one file's prefix
        // never matches another file's records.
        std::string recordPrefix(const std::string &filename)
        {
            return kRecordPrefix + filename + std::string(1, '\0');
        }

        std::string recordKey(const std::string &filename, int index)
        {
            std::ostringstream key;
            key << recordPrefix(filename) << std::setw(kIndexWidth) << std::setfill('0') << index;
            return key.str();
        }

        std::string lengthKey(const std::string &filename)
        {
            return kLengthPrefix + filename;
        }

        rocksdb::WriteOptions syncedWrite()
        {
            rocksdb::WriteOptions options;
            options.sync = true;
            return options;
        }

        void check(const rocksdb::Status &status, const std::string &what)
        {
            if (!status.ok())
            {
                MyLogger::error(what + ": " + status.ToString());
                throw errors::StorageError(what + ": " + status.ToString());
            }
        }

        void deletePrefix(rocksdb::DB &db, rocksdb::WriteBatch &batch, const std::string &prefix)
        {
            std::unique_ptr<rocksdb::Iterator> it(db.NewIterator(rocksdb::ReadOptions()));
            for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next())
            {
                batch.Delete(it->key());
            }
            check(it->status(), "Failed to scan chunk ledger");
        }
    }

    ChunkTracker::ChunkTracker(const std::string &outputDir)
    {
        std::error_code ec;
        std::filesystem::create_directories(outputDir, ec);
        if (ec)
        {
            throw errors::StorageError("Cannot create output directory " + outputDir + ": " + ec.message());
        }

        const std::string path = dbPathFor(outputDir);
        rocksdb::DB *raw_db = nullptr;
        rocksdb::Options options;
        options.create_if_missing = true;
        rocksdb::Status status = rocksdb::DB::Open(options, path, &raw_db);
        check(status, "Failed to open chunk ledger at " + path);
        db = std::shared_ptr<rocksdb::DB>(raw_db);
        MyLogger::info("Chunk tracking database: " + path);
    }

    std::string ChunkTracker::dbPathFor(const std::string &outputDir)
    {
        return (std::filesystem::path(outputDir) / ".chunkcp_chunks").string();
    }

    void ChunkTracker::markReceived(const std::string &filename, int index)
    {
        mark(filename, index, std::nullopt);
    }

    void ChunkTracker::markReceived(const std::string &filename, int index, std::uint64_t committedLength)
    {
        mark(filename, index, committedLength);
    }

    void ChunkTracker::mark(const std::string &filename, int index, const std::optional<std::uint64_t> &committedLength)
    {
        std::lock_guard<std::mutex> lock(write_mutex);

        const std::string key = recordKey(filename, index);
        std::string existing;
        rocksdb::Status status = db->Get(rocksdb::ReadOptions(), key, &existing);
        if (status.ok())
        {
            MyLogger::debug("Chunk " + std::to_string(index) + " of " + filename + " already tracked");
            return;
        }
        if (!status.IsNotFound())
        {
            check(status, "Failed to read chunk ledger");
        }

        json record = {
            {"received_at", std::chrono::duration_cast<std::chrono::seconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count()}};

        rocksdb::WriteBatch batch;
        batch.Put(key, record.dump());
        if (committedLength)
        {
            batch.Put(lengthKey(filename), std::to_string(*committedLength));
        }
        check(db->Write(syncedWrite(), &batch), "Failed to record chunk " + std::to_string(index) + " of " + filename);
    }

    bool ChunkTracker::isReceived(const std::string &filename, int index) const
    {
        std::string value;
        rocksdb::Status status = db->Get(rocksdb::ReadOptions(), recordKey(filename, index), &value);
        if (status.IsNotFound())
            return false;
        check(status, "Failed to read chunk ledger");
        return true;
    }

    std::set<int> ChunkTracker::receivedSet(const std::string &filename) const
    {
        std::set<int> indices;
        const std::string prefix = recordPrefix(filename);
        std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next())
        {
            std::string suffix = it->key().ToString().substr(prefix.size());
            try
            {
                indices.insert(std::stoi(suffix));
            }
            catch (const std::exception &e)
            {
                MyLogger::warning("Skipping malformed ledger key for " + filename + ": " + e.what());
            }
        }
        check(it->status(), "Failed to scan chunk ledger");
        return indices;
    }

    std::optional<std::uint64_t> ChunkTracker::committedLength(const std::string &filename) const
    {
        std::string value;
        rocksdb::Status status = db->Get(rocksdb::ReadOptions(), lengthKey(filename), &value);
        if (status.IsNotFound())
            return std::nullopt;
        check(status, "Failed to read committed length");
        try
        {
            return std::stoull(value);
        }
        catch (const std::exception &)
        {
            throw errors::StorageError("Corrupt committed length for " + filename + ": " + value);
        }
    }

    void ChunkTracker::reset(const std::optional<std::string> &filename)
    {
        std::lock_guard<std::mutex> lock(write_mutex);

        rocksdb::WriteBatch batch;
        if (filename)
        {
            deletePrefix(*db, batch, recordPrefix(*filename));
            batch.Delete(lengthKey(*filename));
            MyLogger::info("Cleared chunk tracking for " + *filename);
        }
        else
        {
            deletePrefix(*db, batch, kRecordPrefix);
            deletePrefix(*db, batch, kLengthPrefix);
            MyLogger::info("Cleared all chunk tracking");
        }
        check(db->Write(syncedWrite(), &batch), "Failed to reset chunk ledger");
    }
}
