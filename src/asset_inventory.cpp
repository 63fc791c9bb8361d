#include "asset_inventory.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace asset_splitter {

// ==================== AssetEntry ====================

AssetEntry::AssetEntry()
    : threshold_bytes(DEFAULT_THRESHOLD_BYTES) {
}

AssetEntry::AssetEntry(const std::string& asset_path, int64_t threshold)
    : path(asset_path)
    , threshold_bytes(threshold) {
}

// ==================== InventoryConfig ====================

InventoryConfig::InventoryConfig()
    : failure_policy(BatchFailurePolicy::FAIL_ON_ANY_ERROR)
    , atomic_writes(true)
    , remove_stale_chunks(true)
    , remove_source_after_split(false)
    , verbose(true) {
}

void InventoryConfig::add_asset(const std::string& path, int64_t threshold_bytes) {
    assets.emplace_back(path, threshold_bytes);
}

InventoryConfig InventoryConfig::default_config() {
    return InventoryConfig();
}

InventoryConfig InventoryConfig::config_for_speech_models(const std::string& models_dir, bool quantized) {
    InventoryConfig config;

    // Some of these may never exceed the limit; they are listed in case they grow
    static const char* const models[] = {
        "vector_estimator.onnx",
        "vocoder.onnx",
        "text_encoder.onnx",
        "duration_predictor.onnx"
    };

    for (const char* model : models) {
        std::string path = (fs::path(models_dir) / model).string();
        if (quantized) {
            path = quantized_artifact_path(path);
        }
        config.add_asset(path, DEFAULT_THRESHOLD_BYTES);
    }

    // A model that was never exported is not a reason to fail the run
    config.failure_policy = BatchFailurePolicy::FAIL_ON_IO_ERROR;

    return config;
}

InventoryConfig InventoryConfig::config_for_single_asset(const std::string& path, int64_t threshold_bytes) {
    InventoryConfig config;
    config.add_asset(path, threshold_bytes);
    return config;
}

// ==================== Helpers ====================

std::string quantized_artifact_path(const std::string& model_path) {
    static const std::string onnx_ext = ".onnx";

    if (model_path.size() > onnx_ext.size() &&
        model_path.compare(model_path.size() - onnx_ext.size(), onnx_ext.size(), onnx_ext) == 0) {
        return model_path.substr(0, model_path.size() - onnx_ext.size()) + "_quant" + onnx_ext;
    }

    fs::path path(model_path);
    fs::path renamed = path.parent_path() / (path.stem().string() + "_quant" + path.extension().string());
    return renamed.string();
}

} // namespace asset_splitter
