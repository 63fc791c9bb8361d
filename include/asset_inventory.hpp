#ifndef ASSET_INVENTORY_HPP
#define ASSET_INVENTORY_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace asset_splitter {

/**
 * Default chunk threshold: 80MB, well under a 100MB per-file hosting limit
 */
constexpr int64_t DEFAULT_THRESHOLD_BYTES = 80LL * 1024 * 1024;

/**
 * How per-asset failures map to the outcome of a whole batch
 */
enum class BatchFailurePolicy {
    BEST_EFFORT,        // Batch always succeeds, failures are only reported
    FAIL_ON_IO_ERROR,   // IO failures and invalid thresholds fail the batch, missing assets don't
    FAIL_ON_ANY_ERROR   // Anything other than skipped/split fails the batch
};

/**
 * One asset to consider for splitting
 */
struct AssetEntry {
    std::string path;           // Path to the source asset
    int64_t threshold_bytes;    // Maximum chunk size (must be > 0)

    AssetEntry();
    AssetEntry(const std::string& asset_path, int64_t threshold = DEFAULT_THRESHOLD_BYTES);
};

/**
 * Inventory of assets plus the knobs that control a batch run
 */
struct InventoryConfig {
    // Assets, processed in order
    std::vector<AssetEntry> assets;

    // Batch outcome
    BatchFailurePolicy failure_policy;

    // Chunk output
    bool atomic_writes;             // Write each chunk to <chunk>.tmp and rename it into place
    bool remove_stale_chunks;       // Drop leftover higher-ordinal chunks after a successful split
    bool remove_source_after_split; // Delete the source once the full chunk set is confirmed

    // Reporting
    bool verbose;                   // Print progress lines (errors are always printed)

    InventoryConfig();

    void add_asset(const std::string& path, int64_t threshold_bytes = DEFAULT_THRESHOLD_BYTES);

    static InventoryConfig default_config();

    /**
     * The speech-synthesis model set
     * @param models_dir Directory holding the ONNX models
     * @param quantized Target the precision-converted (<name>_quant.onnx) artifacts instead
     */
    static InventoryConfig config_for_speech_models(const std::string& models_dir,
                                                    bool quantized = false);

    static InventoryConfig config_for_single_asset(const std::string& path,
                                                   int64_t threshold_bytes = DEFAULT_THRESHOLD_BYTES);
};

/**
 * Path the precision-conversion step writes for a model
 * "model.onnx" -> "model_quant.onnx"; other extensions get "_quant" appended to the stem.
 */
std::string quantized_artifact_path(const std::string& model_path);

} // namespace asset_splitter

#endif // ASSET_INVENTORY_HPP
