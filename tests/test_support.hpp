#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

/**
 * Unique temporary directory, removed with its contents on destruction.
 */
class TempDir
{
public:
    explicit TempDir(const std::string &prefix = "wikilog-test-")
    {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<unsigned long long> dist;
        const fs::path base = fs::temp_directory_path();
        for (int i = 0; i < 5; ++i)
        {
            path_ = base / (prefix + std::to_string(dist(gen)));
            if (!fs::exists(path_))
            {
                break;
            }
        }
        fs::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const { return path_; }

private:
    fs::path path_;
};

inline std::string readFile(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeFile(const fs::path &path, const std::string &content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

// Deterministic, non-repeating-looking payload of the given size
inline std::string makePayload(std::size_t size, char seed = 'a')
{
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
    {
        data[i] = static_cast<char>(seed + (i * 7 + i / 13) % 26);
    }
    return data;
}
