// 防止头文件重复包含。
#pragma once

// 引入固定宽度整数。
#include <cstdint>
// 引入字符串类型。
#include <string>

// 引入错误模型。
#include "zError.h"

// 进入 pipeline 顶层命名空间。
namespace bpk {

// 子命令。
enum class BattlePackCommand {
    // 未指定（仅 --help 时出现）。
    kNone = 0,
    // 把容器拆成 section_NN.bin。
    kUnpack = 1,
    // 把 section_NN.bin 重新打包成容器。
    kRepack = 2,
    // 原位设置全部装备的“可攻击飞行单位”标志。
    kPatchFlyingFlag = 3,
};

// 进程退出码：每类失败一个独立值，供外层脚本区分。
enum BattlePackExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,
    kExitMissingInput = 2,
    kExitDirectoryFailure = 3,
    kExitContainerFormat = 4,
    kExitIoFailure = 5,
    kExitContractViolation = 6,
    kExitSignatureNotFound = 7,
};

// 主流程配置：由“默认值 + CLI 覆盖”共同构成最终运行参数。
struct BattlePackConfig {
    // 子命令。
    BattlePackCommand command = BattlePackCommand::kNone;
    // unpack / patch 的输入容器。
    std::string containerPath;
    // unpack 输出目录（为空时使用 `<容器去扩展名>.unpacked`）。
    std::string outputDir;
    // repack 输入目录。
    std::string inputDir;
    // repack 输出容器路径。
    std::string outputPath;
};

// CLI 覆盖项集合。
struct CliOverrides {
    // 是否显示帮助信息。
    bool showHelp = false;
    // 子命令名（原样保留，便于报错）。
    std::string commandName;
    // 子命令。
    BattlePackCommand command = BattlePackCommand::kNone;
    // 第一个位置参数。
    std::string firstPath;
    // 第二个位置参数（unpack 可选，repack 必填）。
    std::string secondPath;
};

// patch 流程执行摘要。
struct FlyingFlagPatchSummary {
    // 特征串命中偏移。
    uint64_t signatureOffset = 0;
    // 装备数组首条记录偏移。
    uint64_t arrayBase = 0;
    // 已处理记录数。
    uint32_t recordsPatched = 0;
};

// 把错误码映射为进程退出码。
int exitCodeForError(const base::zBpError& error);

// 计算 unpack 默认输出目录：把容器路径的扩展名替换为 `.unpacked`。
std::string defaultUnpackDirectory(const std::string& containerPath);

// 结束命名空间。
}  // namespace bpk
