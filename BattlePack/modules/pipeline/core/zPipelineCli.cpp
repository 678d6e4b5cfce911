// 引入 CLI 相关接口声明。
#include "zPipelineCli.h"

// 引入控制台输出。
#include <iostream>

// 进入 pipeline 命名空间。
namespace bpk {

bool parseCommandValue(const std::string& value, BattlePackCommand* outCommand, std::string* error) {
    if (outCommand == nullptr) {
        if (error != nullptr) {
            *error = "internal error: null outCommand";
        }
        return false;
    }
    if (value == "unpack") {
        *outCommand = BattlePackCommand::kUnpack;
        return true;
    }
    if (value == "repack") {
        *outCommand = BattlePackCommand::kRepack;
        return true;
    }
    if (value == "patch-flying-flag") {
        *outCommand = BattlePackCommand::kPatchFlyingFlag;
        return true;
    }
    if (error != nullptr) {
        *error = "unknown command: " + value + " (expected: unpack|repack|patch-flying-flag)";
    }
    return false;
}

bool parseCommandLine(int argc, char* argv[], CliOverrides& cli, std::string& error) {
    // 位置参数计数：第 0 个是子命令，之后依次是路径。
    int positional = 0;
    for (int argIndex = 1; argIndex < argc; ++argIndex) {
        const std::string arg = argv[argIndex] ? argv[argIndex] : "";
        // 跳过空参数。
        if (arg.empty()) {
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            cli.showHelp = true;
            continue;
        }
        // 任何未知选项都立即报错。
        if (arg[0] == '-') {
            error = "unknown option: " + arg;
            return false;
        }
        if (positional == 0) {
            cli.commandName = arg;
            std::string commandError;
            if (!parseCommandValue(arg, &cli.command, &commandError)) {
                error = commandError;
                return false;
            }
        } else if (positional == 1) {
            cli.firstPath = arg;
        } else if (positional == 2) {
            cli.secondPath = arg;
        } else {
            error = "unexpected positional argument: " + arg;
            return false;
        }
        ++positional;
    }
    return true;
}

bool buildConfig(const CliOverrides& cli, BattlePackConfig& config, std::string& error) {
    config = BattlePackConfig();
    config.command = cli.command;
    switch (cli.command) {
        case BattlePackCommand::kUnpack:
            if (cli.firstPath.empty()) {
                error = "unpack requires <battle_pack>";
                return false;
            }
            config.containerPath = cli.firstPath;
            // 未指定输出目录时沿用容器旁的 .unpacked 目录。
            config.outputDir = cli.secondPath.empty() ? defaultUnpackDirectory(cli.firstPath) : cli.secondPath;
            return true;
        case BattlePackCommand::kRepack:
            if (cli.firstPath.empty() || cli.secondPath.empty()) {
                error = "repack requires <input_dir> <output_battle_pack>";
                return false;
            }
            config.inputDir = cli.firstPath;
            config.outputPath = cli.secondPath;
            return true;
        case BattlePackCommand::kPatchFlyingFlag:
            if (cli.firstPath.empty()) {
                error = "patch-flying-flag requires <battle_pack>";
                return false;
            }
            if (!cli.secondPath.empty()) {
                error = "unexpected positional argument: " + cli.secondPath;
                return false;
            }
            config.containerPath = cli.firstPath;
            return true;
        case BattlePackCommand::kNone:
            break;
    }
    error = "missing command";
    return false;
}

void printUsage() {
    std::cout
        << "Usage:\n"
        << "  BattlePackTool unpack <battle_pack> [output_dir]\n"
        << "  BattlePackTool repack <input_dir> <output_battle_pack>\n"
        << "  BattlePackTool patch-flying-flag <battle_pack>\n\n"
        << "Commands:\n"
        << "  unpack              Export every section to <output_dir>/section_NN.bin\n"
        << "                      (default output_dir: <battle_pack>.unpacked)\n"
        << "  repack              Rebuild a battle pack from section_NN.bin files,\n"
        << "                      packed in ascending NN order\n"
        << "  patch-flying-flag   Let every weapon in the battle pack hit flying enemies\n"
        << "                      (edits the file in place)\n\n"
        << "Exit codes:\n"
        << "  0 ok, 1 usage, 2 missing input, 3 output directory failure,\n"
        << "  4 container format error, 5 I/O failure, 6 section count mismatch,\n"
        << "  7 equipment signature not found\n";
}

}  // namespace bpk
