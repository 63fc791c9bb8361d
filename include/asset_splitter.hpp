#ifndef ASSET_SPLITTER_HPP
#define ASSET_SPLITTER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "asset_inventory.hpp"
#include "chunk_writer.hpp"

namespace asset_splitter {

/**
 * Outcome of processing a single asset
 */
enum class AssetOutcome {
    SKIPPED,            // Within threshold, left untouched
    SPLIT,              // Chunks written
    NOT_FOUND,          // Source asset does not exist
    IO_FAILURE,         // Read/write/stat error, asset may be partially split
    INVALID_THRESHOLD   // Threshold <= 0
};

const char* outcome_name(AssetOutcome outcome);

/**
 * Structured per-asset result
 */
struct AssetResult {
    std::string path;
    int64_t threshold_bytes;
    AssetOutcome outcome;
    uint64_t source_size;
    std::vector<ChunkInfo> chunks;  // Chunks written (complete ones only on failure)
    bool source_removed;            // Source deleted after the chunk set was confirmed
    std::string message;            // Reason for failures

    AssetResult();

    bool failed() const;
};

/**
 * Per-asset results of a batch run, in inventory order
 */
struct BatchReport {
    std::vector<AssetResult> results;

    size_t count(AssetOutcome outcome) const;
    bool any_failed() const;

    /**
     * Whether the batch as a whole succeeded under the given policy
     */
    bool succeeded(BatchFailurePolicy policy) const;

    /**
     * Process exit code: 0 on success, 1 otherwise
     */
    int exit_code(BatchFailurePolicy policy) const;
};

/**
 * Batch driver: for each inventory entry, runs the size gate and, when the
 * asset is over its threshold, the chunk writer.
 *
 * Assets are independent. A failure in one asset is recorded in its result
 * and the batch moves on to the next.
 */
class AssetSplitter {
public:
    explicit AssetSplitter(const InventoryConfig& config = InventoryConfig::default_config());

    /**
     * Process every asset in the inventory
     */
    BatchReport run();

    /**
     * Process one asset (gate, then split if needed)
     */
    AssetResult process_asset(const AssetEntry& entry);

    /**
     * Print a summary of a batch to stdout
     */
    void print_report(const BatchReport& report) const;

    const InventoryConfig& config() const { return config_; }

private:
    InventoryConfig config_;
    ChunkWriter writer_;

    void split_asset(const AssetEntry& entry, AssetResult& result);
    void remove_source(AssetResult& result);
    void report_error(const AssetResult& result) const;
};

} // namespace asset_splitter

#endif // ASSET_SPLITTER_HPP
