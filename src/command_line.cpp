#include "command_line.hpp"

namespace asset_splitter {

CommandLine::CommandLine()
    : action(CommandAction::RUN)
    , models_dir(DEFAULT_MODELS_DIR)
    , quantized(false) {
}

CommandLine parse_command_line(int argc, const char* const* argv) {
    CommandLine cmd;
    bool have_dir = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--quantized") {
            cmd.quantized = true;
        } else if (arg == "-h" || arg == "--help") {
            cmd.action = CommandAction::SHOW_HELP;
            return cmd;
        } else if (!have_dir && !arg.empty() && arg[0] != '-') {
            cmd.models_dir = arg;
            have_dir = true;
        } else {
            cmd.action = CommandAction::USAGE_ERROR;
            cmd.error = arg.empty() ? "empty argument" : "unexpected argument: " + arg;
            return cmd;
        }
    }

    return cmd;
}

std::string usage_line(const std::string& program) {
    return "Usage: " + program + " [models_dir] [--quantized]";
}

} // namespace asset_splitter
