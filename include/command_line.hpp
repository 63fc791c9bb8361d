#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <string>

namespace asset_splitter {

constexpr const char* DEFAULT_MODELS_DIR = "public/models/onnx";

// Exit code for a malformed command line
constexpr int EXIT_USAGE = 2;

enum class CommandAction {
    RUN,
    SHOW_HELP,
    USAGE_ERROR
};

/**
 * Parsed arguments of split_assets [models_dir] [--quantized]
 */
struct CommandLine {
    CommandAction action;
    std::string models_dir;     // Directory holding the ONNX models
    bool quantized;             // Split the _quant.onnx artifacts instead
    std::string error;          // Offending argument when action is USAGE_ERROR

    CommandLine();
};

CommandLine parse_command_line(int argc, const char* const* argv);

std::string usage_line(const std::string& program);

} // namespace asset_splitter

#endif // COMMAND_LINE_HPP
