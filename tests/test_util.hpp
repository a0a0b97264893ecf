#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace test_util
{
    // Unique scratch directory under the system temp dir, removed on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &tag)
        {
            static std::atomic<int> counter{0};
            path_ = std::filesystem::temp_directory_path() /
                    ("chunkcp_" + tag + "_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
                     std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }
        std::string str() const { return path_.string(); }
        std::string file(const std::string &name) const { return (path_ / name).string(); }

    private:
        std::filesystem::path path_;
    };

    inline void writeFile(const std::string &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    inline std::string readFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Deterministic non-repeating bytes, so misordered chunks are detectable.
    inline std::string patternBytes(std::size_t size)
    {
        std::string data(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<char>((i * 31 + i / 251) % 256);
        }
        return data;
    }
}
