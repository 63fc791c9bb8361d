#include "asset_splitter.hpp"
#include "chunk_naming.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace asset_splitter;
namespace fs = std::filesystem;

int main() {
    std::cout << "=== Asset Splitter - Simple Example ===\n" << std::endl;

    // 1. Create a scratch directory with a fake model and a small asset
    fs::path dir = fs::temp_directory_path() / "asset_splitter_example";
    fs::remove_all(dir);
    fs::create_directories(dir);

    std::string model = (dir / "model.onnx").string();
    {
        std::ofstream out(model, std::ios::binary);
        std::vector<char> data(10 * 1024 + 7);
        for (size_t i = 0; i < data.size(); i++) {
            data[i] = static_cast<char>(i % 251);
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    std::string small = (dir / "config.json").string();
    {
        std::ofstream out(small);
        out << "{\"sample_rate\": 24000}\n";
    }

    std::cout << "✓ Created " << model << " (" << fs::file_size(model) << " bytes)\n" << std::endl;

    // 2. Build an inventory with a 4KB threshold
    InventoryConfig config;
    config.add_asset(model, 4 * 1024);
    config.add_asset(small, 4 * 1024);
    config.add_asset((dir / "missing.onnx").string(), 4 * 1024);
    config.failure_policy = BatchFailurePolicy::FAIL_ON_IO_ERROR;

    // 3. Run the batch
    AssetSplitter splitter(config);
    BatchReport report = splitter.run();
    std::cout << std::endl;
    splitter.print_report(report);

    // 4. Chunks come back in numeric order, ready to be concatenated
    std::cout << "\nChunks of model.onnx:" << std::endl;
    for (const auto& chunk : list_chunks(model)) {
        std::cout << "  #" << chunk.ordinal << " " << chunk.path << " (" << chunk.size << " bytes)" << std::endl;
    }

    fs::remove_all(dir);

    std::cout << "\n=== Example Complete! ===" << std::endl;
    return report.exit_code(config.failure_policy);
}
