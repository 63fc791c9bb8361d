#include "asset_splitter.hpp"
#include "chunk_naming.hpp"
#include "size_gate.hpp"
#include <exception>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace asset_splitter {

namespace {

WriterOptions writer_options_from(const InventoryConfig& config) {
    WriterOptions options;
    options.atomic_writes = config.atomic_writes;
    options.remove_stale_chunks = config.remove_stale_chunks;
    options.verbose = config.verbose;
    return options;
}

} // namespace

const char* outcome_name(AssetOutcome outcome) {
    switch (outcome) {
        case AssetOutcome::SKIPPED: return "SKIPPED";
        case AssetOutcome::SPLIT: return "SPLIT";
        case AssetOutcome::NOT_FOUND: return "NOT_FOUND";
        case AssetOutcome::IO_FAILURE: return "IO_FAILURE";
        case AssetOutcome::INVALID_THRESHOLD: return "INVALID_THRESHOLD";
    }
    return "UNKNOWN";
}

// ==================== AssetResult ====================

AssetResult::AssetResult()
    : threshold_bytes(0)
    , outcome(AssetOutcome::SKIPPED)
    , source_size(0)
    , source_removed(false) {
}

bool AssetResult::failed() const {
    return outcome == AssetOutcome::NOT_FOUND ||
           outcome == AssetOutcome::IO_FAILURE ||
           outcome == AssetOutcome::INVALID_THRESHOLD;
}

// ==================== BatchReport ====================

size_t BatchReport::count(AssetOutcome outcome) const {
    size_t total = 0;
    for (const auto& result : results) {
        if (result.outcome == outcome) {
            total++;
        }
    }
    return total;
}

bool BatchReport::any_failed() const {
    for (const auto& result : results) {
        if (result.failed()) {
            return true;
        }
    }
    return false;
}

bool BatchReport::succeeded(BatchFailurePolicy policy) const {
    switch (policy) {
        case BatchFailurePolicy::BEST_EFFORT:
            return true;

        case BatchFailurePolicy::FAIL_ON_IO_ERROR:
            return count(AssetOutcome::IO_FAILURE) == 0 &&
                   count(AssetOutcome::INVALID_THRESHOLD) == 0;

        case BatchFailurePolicy::FAIL_ON_ANY_ERROR:
            return !any_failed();
    }
    return false;
}

int BatchReport::exit_code(BatchFailurePolicy policy) const {
    return succeeded(policy) ? 0 : 1;
}

// ==================== AssetSplitter ====================

AssetSplitter::AssetSplitter(const InventoryConfig& config)
    : config_(config)
    , writer_(writer_options_from(config)) {
}

BatchReport AssetSplitter::run() {
    BatchReport report;
    report.results.reserve(config_.assets.size());

    for (const auto& entry : config_.assets) {
        try {
            report.results.push_back(process_asset(entry));
        } catch (const std::exception& e) {
            AssetResult result;
            result.path = entry.path;
            result.threshold_bytes = entry.threshold_bytes;
            result.outcome = AssetOutcome::IO_FAILURE;
            result.message = e.what();
            report_error(result);
            report.results.push_back(result);
        }
    }

    return report;
}

AssetResult AssetSplitter::process_asset(const AssetEntry& entry) {
    AssetResult result;
    result.path = entry.path;
    result.threshold_bytes = entry.threshold_bytes;

    GateResult gate = evaluate_asset(entry.path, entry.threshold_bytes);
    result.source_size = gate.size_bytes;

    switch (gate.decision) {
        case GateDecision::NOT_FOUND:
            result.outcome = AssetOutcome::NOT_FOUND;
            result.message = gate.error;
            report_error(result);
            return result;

        case GateDecision::INVALID_THRESHOLD:
            result.outcome = AssetOutcome::INVALID_THRESHOLD;
            result.message = gate.error;
            report_error(result);
            return result;

        case GateDecision::STAT_FAILED:
            result.outcome = AssetOutcome::IO_FAILURE;
            result.message = gate.error;
            report_error(result);
            return result;

        case GateDecision::NO_SPLIT:
            result.outcome = AssetOutcome::SKIPPED;
            if (config_.verbose) {
                std::cout << "Skipping " << entry.path << " (small enough: "
                          << format_megabytes(gate.size_bytes) << ")" << std::endl;
            }
            return result;

        case GateDecision::SPLIT:
            split_asset(entry, result);
            return result;
    }

    return result;
}

void AssetSplitter::print_report(const BatchReport& report) const {
    std::cout << "===== Split Report =====" << std::endl;
    std::cout << "Assets: " << report.results.size() << std::endl;
    std::cout << "Split: " << report.count(AssetOutcome::SPLIT) << std::endl;
    std::cout << "Skipped: " << report.count(AssetOutcome::SKIPPED) << std::endl;
    std::cout << "Not found: " << report.count(AssetOutcome::NOT_FOUND) << std::endl;
    std::cout << "IO failures: " << report.count(AssetOutcome::IO_FAILURE) << std::endl;
    std::cout << "Invalid thresholds: " << report.count(AssetOutcome::INVALID_THRESHOLD) << std::endl;
    std::cout << std::endl;

    for (const auto& result : report.results) {
        std::cout << "[" << outcome_name(result.outcome) << "] " << result.path;
        if (result.outcome == AssetOutcome::SPLIT) {
            std::cout << " (" << result.chunks.size() << " chunks"
                      << (result.source_removed ? ", original removed" : "") << ")";
        } else if (!result.message.empty()) {
            std::cout << " (" << result.message << ")";
        }
        std::cout << std::endl;
    }

    std::cout << std::endl;
    std::cout << "Batch " << (report.succeeded(config_.failure_policy) ? "succeeded" : "failed")
              << std::endl;
}

// ==================== Private Methods ====================

void AssetSplitter::split_asset(const AssetEntry& entry, AssetResult& result) {
    if (config_.verbose) {
        std::cout << "Splitting " << entry.path << " ("
                  << format_megabytes(result.source_size) << ")..." << std::endl;
    }

    WriteResult write = writer_.write_chunks(entry.path, static_cast<uint64_t>(entry.threshold_bytes));
    result.chunks = write.chunks;
    if (write.source_size > 0) {
        result.source_size = write.source_size;
    }

    if (!write.ok()) {
        result.outcome = write.status == WriteStatus::INVALID_THRESHOLD
            ? AssetOutcome::INVALID_THRESHOLD
            : AssetOutcome::IO_FAILURE;
        result.message = write.error;
        report_error(result);
        return;
    }

    // Shrank to threshold or below between the gate and the writer
    if (write.source_size <= static_cast<uint64_t>(entry.threshold_bytes)) {
        result.outcome = AssetOutcome::IO_FAILURE;
        result.message = "source changed size while splitting: " + std::to_string(write.source_size) +
                         " bytes is no longer above the threshold";
        report_error(result);
        return;
    }

    result.outcome = AssetOutcome::SPLIT;

    if (config_.remove_source_after_split) {
        remove_source(result);
        return;
    }

    if (config_.verbose) {
        std::cout << "Done splitting " << entry.path
                  << ". You can now delete the original." << std::endl;
    }
}

void AssetSplitter::remove_source(AssetResult& result) {
    uint64_t threshold = static_cast<uint64_t>(result.threshold_bytes);

    if (!chunk_set_complete(result.path, result.source_size, threshold)) {
        result.outcome = AssetOutcome::IO_FAILURE;
        result.message = "chunk set incomplete after split, original kept";
        report_error(result);
        return;
    }

    std::error_code ec;
    fs::remove(result.path, ec);
    if (ec) {
        result.outcome = AssetOutcome::IO_FAILURE;
        result.message = "failed to remove original: " + ec.message();
        report_error(result);
        return;
    }

    result.source_removed = true;
    if (config_.verbose) {
        std::cout << "Done splitting " << result.path << ". Original removed." << std::endl;
    }
}

void AssetSplitter::report_error(const AssetResult& result) const {
    switch (result.outcome) {
        case AssetOutcome::NOT_FOUND:
            std::cerr << "Skipping " << result.path << " (not found)" << std::endl;
            break;

        case AssetOutcome::INVALID_THRESHOLD:
            std::cerr << "Skipping " << result.path << " (" << result.message << ")" << std::endl;
            break;

        default:
            std::cerr << "Error processing " << result.path << ": " << result.message << std::endl;
            break;
    }
}

} // namespace asset_splitter
