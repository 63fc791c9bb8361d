#ifndef CHUNK_WRITER_HPP
#define CHUNK_WRITER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace asset_splitter {

enum class WriteStatus {
    OK,
    IO_FAILURE,
    INVALID_THRESHOLD
};

/**
 * A chunk written by this run
 */
struct ChunkInfo {
    uint64_t ordinal;
    std::string path;
    uint64_t length;
};

struct WriterOptions {
    bool atomic_writes;         // Write to <chunk>.tmp, then rename over the final name
    bool remove_stale_chunks;   // Remove chunks with ordinal >= new count after success
    bool verbose;               // Print one line per created chunk

    WriterOptions();
};

struct WriteResult {
    WriteStatus status;
    std::vector<ChunkInfo> chunks;  // Chunks completed before success or failure
    uint64_t source_size;           // Size measured when the source was opened
    uint64_t bytes_written;
    std::string error;

    WriteResult();

    bool ok() const { return status == WriteStatus::OK; }
};

/**
 * Streams a source asset into <asset>.part0, <asset>.part1, ...
 *
 * The source is read sequentially in blocks of exactly threshold_bytes and each
 * block is written verbatim to its own chunk before the next block is read, so
 * memory use is one block buffer regardless of the asset size.
 *
 * Each chunk is flushed to disk before it is renamed into place.
 * On failure the chunks already completed are left in place.
 */
class ChunkWriter {
public:
    explicit ChunkWriter(const WriterOptions& options = WriterOptions());

    /**
     * Split an asset into chunks
     * @param asset_path Source asset
     * @param threshold_bytes Block size, must be > 0
     * @return IO_FAILURE if the source is empty or its length differs from
     *         the size measured when it was opened
     */
    WriteResult write_chunks(const std::string& asset_path, uint64_t threshold_bytes) const;

    const WriterOptions& options() const { return options_; }

private:
    WriterOptions options_;

    bool write_block(const std::string& asset_path, uint64_t ordinal,
                     const char* data, size_t length, std::string& error) const;
    bool remove_stale_chunks(const std::string& asset_path, uint64_t chunk_count,
                             std::string& error) const;
};

/**
 * Human-readable size, e.g. "80.00MB" (binary megabytes)
 */
std::string format_megabytes(uint64_t bytes);

} // namespace asset_splitter

#endif // CHUNK_WRITER_HPP
