#include "asset_splitter.hpp"
#include "command_line.hpp"
#include <iostream>
#include <string>

using namespace asset_splitter;

int main(int argc, char** argv) {
    CommandLine cmd = parse_command_line(argc, argv);

    switch (cmd.action) {
        case CommandAction::SHOW_HELP:
            std::cout << usage_line(argv[0]) << std::endl;
            return 0;

        case CommandAction::USAGE_ERROR:
            std::cerr << cmd.error << std::endl;
            std::cerr << usage_line(argv[0]) << std::endl;
            return EXIT_USAGE;

        case CommandAction::RUN:
            break;
    }

    try {
        InventoryConfig config = InventoryConfig::config_for_speech_models(cmd.models_dir, cmd.quantized);
        AssetSplitter splitter(config);

        BatchReport report = splitter.run();

        std::cout << std::endl;
        splitter.print_report(report);

        return report.exit_code(config.failure_policy);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
