#ifndef SIZE_GATE_HPP
#define SIZE_GATE_HPP

#include <string>
#include <cstdint>

namespace asset_splitter {

/**
 * What the gate decided for one asset
 */
enum class GateDecision {
    NO_SPLIT,           // size <= threshold, leave the asset alone
    SPLIT,              // size > threshold, hand over to the chunk writer
    NOT_FOUND,          // asset does not exist
    INVALID_THRESHOLD,  // threshold <= 0
    STAT_FAILED         // asset exists but its size can't be read
};

struct GateResult {
    GateDecision decision;
    uint64_t size_bytes;    // Valid for NO_SPLIT and SPLIT
    std::string error;      // Reason for NOT_FOUND / INVALID_THRESHOLD / STAT_FAILED

    GateResult();
};

/**
 * Decide whether an asset needs splitting.
 * Only reads file metadata; never opens or modifies the asset.
 */
GateResult evaluate_asset(const std::string& asset_path, int64_t threshold_bytes);

} // namespace asset_splitter

#endif // SIZE_GATE_HPP
