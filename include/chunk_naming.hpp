#ifndef CHUNK_NAMING_HPP
#define CHUNK_NAMING_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <system_error>

namespace asset_splitter {

/**
 * Chunk artifacts are named <asset path>.part<N>, siblings of the asset.
 * N is a plain decimal ordinal starting at 0, never zero-padded, so
 * consumers must order chunks numerically: "part10" sorts before "part2"
 * as a string.
 */
constexpr const char* CHUNK_MARKER = ".part";

/**
 * Suffix of the in-progress file a chunk is written to before it is
 * renamed to its final name
 */
constexpr const char* TEMP_SUFFIX = ".tmp";

/**
 * A chunk artifact found on disk
 */
struct ChunkFile {
    uint64_t ordinal;
    std::string path;
    uint64_t size;
};

std::string chunk_path(const std::string& asset_path, uint64_t ordinal);
std::string temp_chunk_path(const std::string& asset_path, uint64_t ordinal);

/**
 * Recover the ordinal from a chunk artifact path
 * @param asset_path Path of the parent asset
 * @param candidate_path Path (or bare file name) of a possible chunk
 * @return Ordinal if candidate is a chunk of this asset, nullopt otherwise.
 *         Only canonical names are accepted: "part07" and "part+7" are not chunks.
 */
std::optional<uint64_t> parse_chunk_ordinal(const std::string& asset_path,
                                            const std::string& candidate_path);

/**
 * Enumerate the chunk artifacts of an asset, sorted by ascending ordinal
 * (numeric order). This is the order in which they must be concatenated.
 * In-progress temp files are not listed. A missing parent directory
 * holds no chunks and is not an error.
 * @param ec Set if the directory or a chunk in it cannot be read; the
 *           returned list is then empty
 */
std::vector<ChunkFile> list_chunks(const std::string& asset_path, std::error_code& ec);

/**
 * Throwing overload
 * @throws std::filesystem::filesystem_error if the listing fails
 */
std::vector<ChunkFile> list_chunks(const std::string& asset_path);

/**
 * Number of chunks a source of the given size splits into
 * @return ceil(source_size / threshold) when source_size > threshold, else 0
 */
uint64_t expected_chunk_count(uint64_t source_size, uint64_t threshold_bytes);

/**
 * Check that the full chunk set for a source is present on disk:
 * ordinals 0..n-1 with no gaps or extras, every chunk but the last exactly
 * threshold_bytes, the last in (0, threshold_bytes], lengths summing to source_size.
 * A listing error counts as incomplete.
 */
bool chunk_set_complete(const std::string& asset_path, uint64_t source_size, uint64_t threshold_bytes);

} // namespace asset_splitter

#endif // CHUNK_NAMING_HPP
