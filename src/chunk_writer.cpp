#include "chunk_writer.hpp"
#include "chunk_naming.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <new>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace asset_splitter {

namespace {

// Flush a file (or directory) to stable storage
bool sync_path(const std::string& path, int flags, std::string& error) {
    int fd = ::open(path.c_str(), flags);
    if (fd == -1) {
        error = "cannot open " + path + " for fsync: " + std::strerror(errno);
        return false;
    }

    bool synced = ::fsync(fd) == 0;
    if (!synced) {
        error = "cannot fsync " + path + ": " + std::strerror(errno);
    }
    ::close(fd);
    return synced;
}

} // namespace

// ==================== WriterOptions ====================

WriterOptions::WriterOptions()
    : atomic_writes(true)
    , remove_stale_chunks(true)
    , verbose(true) {
}

// ==================== WriteResult ====================

WriteResult::WriteResult()
    : status(WriteStatus::OK)
    , source_size(0)
    , bytes_written(0) {
}

// ==================== ChunkWriter ====================

ChunkWriter::ChunkWriter(const WriterOptions& options)
    : options_(options) {
}

WriteResult ChunkWriter::write_chunks(const std::string& asset_path, uint64_t threshold_bytes) const {
    WriteResult result;

    if (threshold_bytes == 0 ||
        threshold_bytes > static_cast<uint64_t>(std::numeric_limits<std::streamsize>::max())) {
        result.status = WriteStatus::INVALID_THRESHOLD;
        result.error = "threshold out of range: " + std::to_string(threshold_bytes);
        return result;
    }

    std::ifstream in(asset_path, std::ios::binary);
    if (!in) {
        result.status = WriteStatus::IO_FAILURE;
        result.error = "failed to open source: " + asset_path;
        return result;
    }

    std::error_code ec;
    uintmax_t size = fs::file_size(asset_path, ec);
    if (ec) {
        result.status = WriteStatus::IO_FAILURE;
        result.error = "cannot read size of " + asset_path + ": " + ec.message();
        return result;
    }
    result.source_size = static_cast<uint64_t>(size);

    std::vector<char> buffer;
    try {
        buffer.resize(static_cast<size_t>(threshold_bytes));
    } catch (const std::bad_alloc&) {
        result.status = WriteStatus::IO_FAILURE;
        result.error = "cannot allocate " + std::to_string(threshold_bytes) + " byte block buffer";
        return result;
    }

    uint64_t ordinal = 0;
    while (true) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();

        // A short read is only legal at end of stream
        if (in.bad() || (in.fail() && !in.eof())) {
            result.status = WriteStatus::IO_FAILURE;
            result.error = "read error in " + asset_path + " at offset " + std::to_string(result.bytes_written);
            return result;
        }

        if (got <= 0) {
            break;
        }

        // The source grew after it was measured; stop before writing past its recorded size
        if (result.bytes_written + static_cast<uint64_t>(got) > result.source_size) {
            result.status = WriteStatus::IO_FAILURE;
            result.error = "source changed size while splitting " + asset_path + ": expected " +
                           std::to_string(result.source_size) + " bytes, found more";
            return result;
        }

        std::string error;
        if (!write_block(asset_path, ordinal, buffer.data(), static_cast<size_t>(got), error)) {
            result.status = WriteStatus::IO_FAILURE;
            result.error = error;
            return result;
        }

        result.chunks.push_back({ordinal, chunk_path(asset_path, ordinal), static_cast<uint64_t>(got)});
        result.bytes_written += static_cast<uint64_t>(got);

        if (options_.verbose) {
            std::cout << "  Created " << result.chunks.back().path
                      << " (" << format_megabytes(static_cast<uint64_t>(got)) << ")" << std::endl;
        }

        ordinal++;

        if (in.eof()) {
            break;
        }
    }

    if (result.bytes_written != result.source_size) {
        result.status = WriteStatus::IO_FAILURE;
        result.error = "source changed size while splitting " + asset_path + ": expected " +
                       std::to_string(result.source_size) + " bytes, read " +
                       std::to_string(result.bytes_written);
        return result;
    }

    // An empty source has no chunk set; cleanup would remove every existing chunk
    if (result.chunks.empty()) {
        result.status = WriteStatus::IO_FAILURE;
        result.error = "source is empty: " + asset_path;
        return result;
    }

    if (options_.remove_stale_chunks) {
        std::string error;
        if (!remove_stale_chunks(asset_path, ordinal, error)) {
            result.status = WriteStatus::IO_FAILURE;
            result.error = error;
            return result;
        }
    }

    return result;
}

bool ChunkWriter::write_block(const std::string& asset_path, uint64_t ordinal,
                              const char* data, size_t length, std::string& error) const {
    const std::string final_path = chunk_path(asset_path, ordinal);
    const std::string target = options_.atomic_writes ? temp_chunk_path(asset_path, ordinal) : final_path;

    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "failed to open chunk for writing: " + target;
            return false;
        }

        out.write(data, static_cast<std::streamsize>(length));
        out.close();
        if (!out) {
            error = "failed to write chunk: " + target;
            if (options_.atomic_writes) {
                std::error_code ignored;
                fs::remove(target, ignored);
            }
            return false;
        }
    }

    if (!sync_path(target, O_RDONLY, error)) {
        if (options_.atomic_writes) {
            std::error_code ignored;
            fs::remove(target, ignored);
        }
        return false;
    }

    if (!options_.atomic_writes) {
        return true;
    }

    std::error_code ec;
    fs::rename(target, final_path, ec);
    if (ec) {
        error = "failed to move " + target + " to " + final_path + ": " + ec.message();
        std::error_code ignored;
        fs::remove(target, ignored);
        return false;
    }

    // Persist the rename itself
    fs::path dir = fs::path(final_path).parent_path();
    return sync_path(dir.empty() ? "." : dir.string(), O_RDONLY | O_DIRECTORY, error);
}

bool ChunkWriter::remove_stale_chunks(const std::string& asset_path, uint64_t chunk_count,
                                      std::string& error) const {
    std::error_code list_ec;
    std::vector<ChunkFile> chunks = list_chunks(asset_path, list_ec);
    if (list_ec) {
        error = "cannot list chunks of " + asset_path + ": " + list_ec.message();
        return false;
    }

    for (const ChunkFile& chunk : chunks) {
        if (chunk.ordinal < chunk_count) {
            continue;
        }

        // Left behind by an earlier split with a smaller threshold
        std::error_code ec;
        fs::remove(chunk.path, ec);
        if (ec) {
            error = "failed to remove stale chunk " + chunk.path + ": " + ec.message();
            return false;
        }

        if (options_.verbose) {
            std::cout << "  Removed stale " << chunk.path << std::endl;
        }
    }

    return true;
}

// ==================== Helpers ====================

std::string format_megabytes(uint64_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2)
        << static_cast<double>(bytes) / (1024.0 * 1024.0) << "MB";
    return out.str();
}

} // namespace asset_splitter
