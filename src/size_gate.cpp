#include "size_gate.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace asset_splitter {

GateResult::GateResult()
    : decision(GateDecision::NOT_FOUND)
    , size_bytes(0) {
}

GateResult evaluate_asset(const std::string& asset_path, int64_t threshold_bytes) {
    GateResult result;

    if (threshold_bytes <= 0) {
        result.decision = GateDecision::INVALID_THRESHOLD;
        result.error = "threshold must be positive, got " + std::to_string(threshold_bytes);
        return result;
    }

    std::error_code ec;
    fs::file_status status = fs::status(asset_path, ec);
    if (status.type() == fs::file_type::not_found) {
        result.decision = GateDecision::NOT_FOUND;
        result.error = "not found";
        return result;
    }
    if (ec) {
        result.decision = GateDecision::STAT_FAILED;
        result.error = "cannot stat: " + ec.message();
        return result;
    }
    if (!fs::is_regular_file(status)) {
        result.decision = GateDecision::STAT_FAILED;
        result.error = "not a regular file";
        return result;
    }

    uintmax_t size = fs::file_size(asset_path, ec);
    if (ec) {
        result.decision = GateDecision::STAT_FAILED;
        result.error = "cannot read size: " + ec.message();
        return result;
    }

    result.size_bytes = static_cast<uint64_t>(size);
    result.decision = result.size_bytes > static_cast<uint64_t>(threshold_bytes)
        ? GateDecision::SPLIT
        : GateDecision::NO_SPLIT;

    return result;
}

} // namespace asset_splitter
