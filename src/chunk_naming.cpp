#include "chunk_naming.hpp"
#include <algorithm>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

namespace asset_splitter {

std::string chunk_path(const std::string& asset_path, uint64_t ordinal) {
    return asset_path + CHUNK_MARKER + std::to_string(ordinal);
}

std::string temp_chunk_path(const std::string& asset_path, uint64_t ordinal) {
    return chunk_path(asset_path, ordinal) + TEMP_SUFFIX;
}

std::optional<uint64_t> parse_chunk_ordinal(const std::string& asset_path,
                                            const std::string& candidate_path) {
    const std::string prefix = fs::path(asset_path).filename().string() + CHUNK_MARKER;
    const std::string name = fs::path(candidate_path).filename().string();

    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    const std::string digits = name.substr(prefix.size());

    // Leading zeros would give two names for one ordinal
    if (digits.size() > 1 && digits[0] == '0') {
        return std::nullopt;
    }

    uint64_t ordinal = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (ordinal > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        ordinal = ordinal * 10 + digit;
    }

    return ordinal;
}

std::vector<ChunkFile> list_chunks(const std::string& asset_path, std::error_code& ec) {
    std::vector<ChunkFile> chunks;
    ec.clear();

    fs::path dir = fs::path(asset_path).parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            ec.clear();
        }
        return chunks;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            chunks.clear();
            return chunks;
        }

        auto ordinal = parse_chunk_ordinal(asset_path, it->path().string());
        if (!ordinal.has_value()) {
            continue;
        }

        std::error_code entry_ec;
        bool regular = it->is_regular_file(entry_ec);
        uint64_t size = regular ? it->file_size(entry_ec) : 0;

        // A chunk removed while scanning is simply gone
        if (entry_ec == std::errc::no_such_file_or_directory) {
            continue;
        }
        if (entry_ec) {
            ec = entry_ec;
            chunks.clear();
            return chunks;
        }
        if (!regular) {
            continue;
        }

        chunks.push_back({*ordinal, chunk_path(asset_path, *ordinal), size});
    }

    std::sort(chunks.begin(), chunks.end(),
              [](const ChunkFile& a, const ChunkFile& b) { return a.ordinal < b.ordinal; });

    return chunks;
}

std::vector<ChunkFile> list_chunks(const std::string& asset_path) {
    std::error_code ec;
    std::vector<ChunkFile> chunks = list_chunks(asset_path, ec);
    if (ec) {
        throw fs::filesystem_error("cannot list chunks", fs::path(asset_path), ec);
    }
    return chunks;
}

uint64_t expected_chunk_count(uint64_t source_size, uint64_t threshold_bytes) {
    if (threshold_bytes == 0 || source_size <= threshold_bytes) {
        return 0;
    }
    return (source_size + threshold_bytes - 1) / threshold_bytes;
}

bool chunk_set_complete(const std::string& asset_path, uint64_t source_size, uint64_t threshold_bytes) {
    uint64_t expected = expected_chunk_count(source_size, threshold_bytes);
    if (expected == 0) {
        return false;
    }

    std::error_code ec;
    std::vector<ChunkFile> chunks = list_chunks(asset_path, ec);
    if (ec || chunks.size() != expected) {
        return false;
    }

    uint64_t total = 0;
    for (size_t i = 0; i < chunks.size(); i++) {
        const ChunkFile& chunk = chunks[i];
        if (chunk.ordinal != i) {
            return false;
        }

        bool last = (i + 1 == chunks.size());
        if (!last && chunk.size != threshold_bytes) {
            return false;
        }
        if (last && (chunk.size == 0 || chunk.size > threshold_bytes)) {
            return false;
        }

        total += chunk.size;
    }

    return total == source_size;
}

} // namespace asset_splitter
