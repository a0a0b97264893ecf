#include "chunk_store.hpp"
#include "common/errors/errors.hpp"
#include "logger/Mylogger.hpp"
#include "nlohmann/json.hpp"
#include "rocksdb/write_batch.h"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace chunk_store
{
    namespace
    {
        const std::string kKeyPrefix = "chunk:";

        rocksdb::WriteOptions syncedWrite()
        {
            rocksdb::WriteOptions options;
            options.sync = true;
            return options;
        }

        std::string encode(const BufferedChunk &chunk)
        {
            json j;
            j["id"] = chunk.id;
            j["file_name"] = chunk.fileName;
            j["chunk_index"] = chunk.index;
            j["data"] = json::binary(std::vector<std::uint8_t>(chunk.data.begin(), chunk.data.end()));
            auto bytes = json::to_cbor(j);
            return std::string(bytes.begin(), bytes.end());
        }

        BufferedChunk decode(const std::string &key, const std::string &value)
        {
            try
            {
                json j = json::from_cbor(value);
                BufferedChunk chunk;
                chunk.id = j.at("id").get<std::string>();
                chunk.fileName = j.at("file_name").get<std::string>();
                chunk.index = j.at("chunk_index").get<int>();
                const auto &bin = j.at("data").get_binary();
                chunk.data.assign(bin.begin(), bin.end());
                return chunk;
            }
            catch (const json::exception &e)
            {
                MyLogger::error("Corrupt chunk record at key " + key + ": " + e.what());
                throw errors::StorageError("Corrupt chunk record " + key + ": " + e.what());
            }
        }

        void check(const rocksdb::Status &status, const std::string &what)
        {
            if (!status.ok())
            {
                MyLogger::error(what + ": " + status.ToString());
                throw errors::StorageError(what + ": " + status.ToString());
            }
        }

        bool byFileThenIndex(const BufferedChunk &a, const BufferedChunk &b)
        {
            if (a.fileName != b.fileName)
                return a.fileName < b.fileName;
            return a.index < b.index;
        }
    }

    std::string makeChunkId(const std::string &fileName, int index)
    {
        std::ostringstream id;
        id << fileName << '#' << std::setw(10) << std::setfill('0') << index;
        return id.str();
    }

    ChunkStore::ChunkStore(const std::string &path) : dbPath(path)
    {
        std::error_code ec;
        auto parent = std::filesystem::path(dbPath).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw errors::StorageError("Cannot create directory " + parent.string() + ": " + ec.message());
            }
        }

        rocksdb::DB *raw_db = nullptr;
        rocksdb::Options options;
        options.create_if_missing = true;
        rocksdb::Status status = rocksdb::DB::Open(options, dbPath, &raw_db);
        check(status, "Failed to open chunk store at " + dbPath);
        db = std::shared_ptr<rocksdb::DB>(raw_db);
        MyLogger::debug("Opened chunk store: " + dbPath);
    }

    std::string ChunkStore::defaultPath(const std::string &dbName)
    {
        const char *home = std::getenv("HOME");
        std::filesystem::path base = home != nullptr ? std::filesystem::path(home)
                                                     : std::filesystem::temp_directory_path();
        return (base / ".chunkcp" / dbName).string();
    }

    void ChunkStore::put(const BufferedChunk &chunk)
    {
        rocksdb::Status status = db->Put(syncedWrite(), kKeyPrefix + chunk.id, encode(chunk));
        check(status, "Failed to store chunk " + chunk.id);
    }

    std::optional<BufferedChunk> ChunkStore::get(const std::string &id) const
    {
        std::string value;
        rocksdb::Status status = db->Get(rocksdb::ReadOptions(), kKeyPrefix + id, &value);
        if (status.IsNotFound())
            return std::nullopt;
        check(status, "Failed to read chunk " + id);
        return decode(kKeyPrefix + id, value);
    }

    void ChunkStore::remove(const std::string &id)
    {
        rocksdb::Status status = db->Delete(syncedWrite(), kKeyPrefix + id);
        check(status, "Failed to delete chunk " + id);
        MyLogger::debug("Removed chunk from buffer: " + id);
    }

    void ChunkStore::clear()
    {
        rocksdb::WriteBatch batch;
        std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(kKeyPrefix); it->Valid() && it->key().starts_with(kKeyPrefix); it->Next())
        {
            batch.Delete(it->key());
        }
        check(it->status(), "Failed to scan chunk store");
        check(db->Write(syncedWrite(), &batch), "Failed to clear chunk store");
        MyLogger::info("Buffer cleared");
    }

    std::vector<BufferedChunk> ChunkStore::scan(const std::string &keyPrefix) const
    {
        std::vector<BufferedChunk> result;
        std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(keyPrefix); it->Valid() && it->key().starts_with(keyPrefix); it->Next())
        {
            result.push_back(decode(it->key().ToString(), it->value().ToString()));
        }
        check(it->status(), "Failed to scan chunk store");
        return result;
    }

    std::vector<BufferedChunk> ChunkStore::listByFile(const std::string &fileName) const
    {
        // The prefix also matches names like "<fileName>#x", so filter on the record itself.
        auto candidates = scan(kKeyPrefix + fileName + "#");
        std::vector<BufferedChunk> result;
        for (auto &chunk : candidates)
        {
            if (chunk.fileName == fileName)
                result.push_back(std::move(chunk));
        }
        std::sort(result.begin(), result.end(), byFileThenIndex);
        return result;
    }

    std::vector<BufferedChunk> ChunkStore::listAll() const
    {
        auto result = scan(kKeyPrefix);
        std::sort(result.begin(), result.end(), byFileThenIndex);
        return result;
    }

    std::set<std::string> ChunkStore::listDistinctFileNames() const
    {
        std::set<std::string> names;
        for (const auto &chunk : scan(kKeyPrefix))
        {
            names.insert(chunk.fileName);
        }
        return names;
    }

    std::size_t ChunkStore::count() const
    {
        std::size_t total = 0;
        std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(kKeyPrefix); it->Valid() && it->key().starts_with(kKeyPrefix); it->Next())
        {
            ++total;
        }
        check(it->status(), "Failed to scan chunk store");
        return total;
    }
}
