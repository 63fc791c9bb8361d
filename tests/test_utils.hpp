#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <unistd.h>

#include "gtest/gtest.h"
#include "chunk_naming.hpp"

namespace asset_splitter {
namespace test {

namespace fs = std::filesystem;

/**
 * Scratch directory named after the running test, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("asset_splitter_") + info->test_suite_name() + "_" +
                           info->name() + "_" + std::to_string(::getpid());
        path_ = fs::temp_directory_path() / name;
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

// Deterministic, non-repeating-at-block-boundaries content so misordered chunks are caught
inline std::vector<char> make_pattern(size_t size, uint32_t seed = 1) {
    std::vector<char> data(size);
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; i++) {
        state = state * 1664525u + 1013904223u;
        data[i] = static_cast<char>(state >> 24);
    }
    return data;
}

inline void write_file(const std::string& path, const std::vector<char>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    ASSERT_TRUE(out.good()) << "cannot create " << path;
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    ASSERT_TRUE(out.good()) << "cannot write " << path;
}

inline std::vector<char> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * Reference consumer: concatenate the chunks of an asset in numeric ordinal order
 */
inline std::vector<char> reassemble(const std::string& asset_path) {
    std::vector<char> out;
    for (const auto& chunk : list_chunks(asset_path)) {
        std::vector<char> part = read_file(chunk.path);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

inline size_t count_temp_files(const fs::path& dir) {
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == TEMP_SUFFIX) {
            count++;
        }
    }
    return count;
}

} // namespace test
} // namespace asset_splitter

#endif // TEST_UTILS_HPP
