#include "gtest/gtest.h"
#include "asset_inventory.hpp"

#include <filesystem>
#include <string>

using namespace asset_splitter;
namespace fs = std::filesystem;

TEST(InventoryConfigTest, DefaultsAreConservative) {
    InventoryConfig config = InventoryConfig::default_config();

    EXPECT_TRUE(config.assets.empty());
    EXPECT_EQ(config.failure_policy, BatchFailurePolicy::FAIL_ON_ANY_ERROR);
    EXPECT_TRUE(config.atomic_writes);
    EXPECT_TRUE(config.remove_stale_chunks);
    EXPECT_FALSE(config.remove_source_after_split);
    EXPECT_TRUE(config.verbose);
}

TEST(InventoryConfigTest, AddAssetKeepsOrderAndDefaultThreshold) {
    InventoryConfig config;
    config.add_asset("b.onnx");
    config.add_asset("a.onnx", 1024);

    ASSERT_EQ(config.assets.size(), 2u);
    EXPECT_EQ(config.assets[0].path, "b.onnx");
    EXPECT_EQ(config.assets[0].threshold_bytes, 80LL * 1024 * 1024);
    EXPECT_EQ(config.assets[1].path, "a.onnx");
    EXPECT_EQ(config.assets[1].threshold_bytes, 1024);
}

TEST(InventoryConfigTest, SpeechModelPreset) {
    InventoryConfig config = InventoryConfig::config_for_speech_models("public/models/onnx");

    ASSERT_EQ(config.assets.size(), 4u);
    EXPECT_EQ(config.assets[0].path, (fs::path("public/models/onnx") / "vector_estimator.onnx").string());
    EXPECT_EQ(config.assets[1].path, (fs::path("public/models/onnx") / "vocoder.onnx").string());
    EXPECT_EQ(config.assets[2].path, (fs::path("public/models/onnx") / "text_encoder.onnx").string());
    EXPECT_EQ(config.assets[3].path, (fs::path("public/models/onnx") / "duration_predictor.onnx").string());

    for (const auto& entry : config.assets) {
        EXPECT_EQ(entry.threshold_bytes, DEFAULT_THRESHOLD_BYTES);
    }

    // Missing models are tolerated, IO errors are not
    EXPECT_EQ(config.failure_policy, BatchFailurePolicy::FAIL_ON_IO_ERROR);
}

TEST(InventoryConfigTest, SpeechModelPresetTargetsQuantizedArtifacts) {
    InventoryConfig config = InventoryConfig::config_for_speech_models("models", true);

    ASSERT_EQ(config.assets.size(), 4u);
    EXPECT_EQ(config.assets[1].path, (fs::path("models") / "vocoder_quant.onnx").string());
}

TEST(InventoryConfigTest, SingleAssetPreset) {
    InventoryConfig config = InventoryConfig::config_for_single_asset("weights.bin", 4096);

    ASSERT_EQ(config.assets.size(), 1u);
    EXPECT_EQ(config.assets[0].path, "weights.bin");
    EXPECT_EQ(config.assets[0].threshold_bytes, 4096);
}

TEST(QuantizedArtifactPathTest, ReplacesOnnxExtension) {
    EXPECT_EQ(quantized_artifact_path("public/models/onnx/vocoder.onnx"),
              "public/models/onnx/vocoder_quant.onnx");
    EXPECT_EQ(quantized_artifact_path("text_encoder.onnx"), "text_encoder_quant.onnx");
}

TEST(QuantizedArtifactPathTest, OtherExtensionsKeepTheirExtension) {
    EXPECT_EQ(quantized_artifact_path("weights.bin"), "weights_quant.bin");
    EXPECT_EQ(quantized_artifact_path("model"), "model_quant");
}
